#include "client.hpp"

#include <spdlog/spdlog.h>

#include "errors.hpp"

DbgpClient::DbgpClient(ClientConfig config)
	: config(config),
	router(connection, config.command_timeout),
	commands(router),
	error_capture(commands, config.error_queue_size, config.context_radius) {
	connection.SetDataHandler([this](std::string_view data) { HandleData(data); });
	connection.SetConnectedHandler([this] {
		decoder.Reset();
	});
	connection.SetDisconnectedHandler([this] {
		router.RejectAll("Debugger engine disconnected");
		std::lock_guard lock(init_mutex);
		init_message.clear();
	});
	commands.SetFaultHandler([this](const Fault& fault) { ReportFault(fault); });

	capture_thread = std::thread(&DbgpClient::CaptureLoop, this);
}

DbgpClient::~DbgpClient() {
	Close();
	{
		std::lock_guard lock(fault_mutex);
		capture_running = false;
	}
	fault_cv.notify_all();
	if (capture_thread.joinable()) {
		capture_thread.join();
	}
}

int DbgpClient::Listen(int port) {
	return connection.Listen(port, config.max_port_attempts);
}

void DbgpClient::Close() {
	connection.Close();
	router.RejectAll("Debugger session closed");
}

std::optional<AttributeMap> DbgpClient::GetInitInfo() {
	std::lock_guard lock(init_mutex);
	if (init_message.empty()) {
		return std::nullopt;
	}
	return FindElement(init_message, "init");
}

void DbgpClient::ReportFault(Fault fault) {
	{
		std::lock_guard lock(fault_mutex);
		faults.push_back(std::move(fault));
	}
	fault_cv.notify_one();
}

void DbgpClient::HandleData(std::string_view data) {
	for (auto& frame : decoder.Feed(data)) {
		HandleFrame(frame);
	}
}

void DbgpClient::HandleFrame(const Frame& frame) {
	if (frame.type == FrameType::INIT) {
		auto attributes = FindElement(frame.payload, "init");
		if (attributes) {
			spdlog::info("Client: engine {} {} attached ({})", (*attributes)["appid"], (*attributes)["language"], (*attributes)["fileuri"]);
		}
		std::lock_guard lock(init_mutex);
		init_message = frame.payload;
		return;
	}

	if (router.Dispatch(frame.payload)) {
		return;
	}

	// A break whose run or step already timed out on the caller side
	if (auto fault = GetContinuationFault(ParseResponse(frame.payload))) {
		spdlog::info("Client: late continuation response stopped on {}", fault->error_type);
		ReportFault(*fault);
		return;
	}

	if (auto fault = ParseErrorNotification(frame.payload)) {
		spdlog::info("Client: engine reported {} at {}:{}", fault->error_type, fault->file, fault->line);
		ReportFault(*fault);
		return;
	}

	spdlog::warn("Client: unsolicited frame: {}", frame.payload);
}

void DbgpClient::CaptureLoop() {
	while (true) {
		Fault fault;
		{
			std::unique_lock lock(fault_mutex);
			fault_cv.wait(lock, [this] { return !faults.empty() || !capture_running; });
			if (!capture_running) {
				return;
			}
			fault = std::move(faults.front());
			faults.pop_front();
		}

		error_capture.CaptureFault(fault);
	}
}
