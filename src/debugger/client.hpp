#pragma once

#include <mutex>
#include <deque>
#include <chrono>
#include <thread>
#include <string>
#include <optional>
#include <string_view>
#include <condition_variable>

#include "codec.hpp"
#include "types.hpp"
#include "parser.hpp"
#include "router.hpp"
#include "commands.hpp"
#include "connection.hpp"
#include "../capture/error_capture.hpp"

struct ClientConfig {
	int port = DEFAULT_PORT;
	std::chrono::milliseconds command_timeout = DEFAULT_COMMAND_TIMEOUT;
	size_t error_queue_size = DEFAULT_ERROR_QUEUE_SIZE;
	int context_radius = DEFAULT_CONTEXT_RADIUS;
	int max_port_attempts = DEFAULT_MAX_PORT_ATTEMPTS;
};

class DbgpClient {
public:
	explicit DbgpClient(ClientConfig config = {});
	~DbgpClient();

	int Listen() { return Listen(config.port); }
	int Listen(int port);
	void Close();

	bool IsConnected() const { return connection.IsConnected(); }
	bool IsListening() const { return connection.IsListening(); }
	ConnectionState GetState() const { return connection.GetState(); }
	int GetPort() const { return connection.GetPort(); }
	std::optional<AttributeMap> GetInitInfo();

	// Queues a fault for enrichment on the capture thread
	void ReportFault(Fault fault);

	Commands& GetCommands() { return commands; }
	ErrorCapture& GetErrorCapture() { return error_capture; }
	TransactionRouter& GetRouter() { return router; }
	const ClientConfig& GetConfig() const { return config; }
private:
	void HandleData(std::string_view data);
	void HandleFrame(const Frame& frame);
	void CaptureLoop();

	ClientConfig config;
	Connection connection;
	FrameDecoder decoder;
	TransactionRouter router;
	Commands commands;
	ErrorCapture error_capture;

	std::mutex init_mutex;
	std::string init_message;

	std::mutex fault_mutex;
	std::condition_variable fault_cv;
	std::deque<Fault> faults;
	bool capture_running = true;
	std::thread capture_thread;
};
