#pragma once

#include <mutex>
#include <atomic>
#include <thread>
#include <string>
#include <functional>
#include <string_view>
#include <sockpp/tcp_acceptor.h>

#include "types.hpp"
#include "transport.hpp"

constexpr auto DEFAULT_PORT = 9000;
constexpr auto DEFAULT_MAX_PORT_ATTEMPTS = 100;

typedef std::function<void(std::string_view data)> DataHandler;
typedef std::function<void()> LifecycleHandler;

class Connection : public Transport {
public:
	Connection();
	~Connection();

	// Binds on loopback, moving to the next port while the current one is taken
	int Listen(int port, int max_attempts = DEFAULT_MAX_PORT_ATTEMPTS);
	void Close();

	bool IsConnected() const override { return state == ConnectionState::CONNECTED; }
	bool IsListening() const { return state != ConnectionState::DISCONNECTED; }
	bool Write(const std::string& data) override;

	ConnectionState GetState() const { return state; }
	int GetPort() const { return port; }

	void SetDataHandler(DataHandler handler) { data_handler = std::move(handler); }
	void SetConnectedHandler(LifecycleHandler handler) { connected_handler = std::move(handler); }
	void SetDisconnectedHandler(LifecycleHandler handler) { disconnected_handler = std::move(handler); }
private:
	void Run();
	bool WaitForConnection();
	void ReceiveLoop();

	std::atomic<ConnectionState> state = ConnectionState::DISCONNECTED;
	std::atomic<bool> running = false;
	std::atomic<int> port = DEFAULT_PORT;

	DataHandler data_handler;
	LifecycleHandler connected_handler;
	LifecycleHandler disconnected_handler;

	std::mutex socket_mutex;
	sockpp::tcp_acceptor listener;
	sockpp::tcp_socket socket;
	std::thread server_thread;
};
