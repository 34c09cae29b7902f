#include "connection.hpp"

#include <chrono>
#include <format>
#include <system_error>
#include <spdlog/spdlog.h>

#include "errors.hpp"

constexpr auto LOOPBACK_ADDRESS = "127.0.0.1";
constexpr auto MAX_PORT = 65535;
constexpr auto RECEIVE_BUFFER_SIZE = 4096;
constexpr auto ACCEPT_RETRY_DELAY = std::chrono::milliseconds(100);

Connection::Connection() {
	sockpp::initialize();
}

Connection::~Connection() {
	Close();
}

int Connection::Listen(int requested_port, int max_attempts) {
	if (IsListening()) {
		return port;
	}

	for (int attempt = 0; attempt < max_attempts; attempt++) {
		int candidate = requested_port + attempt;
		if (candidate > MAX_PORT) {
			break;
		}

		sockpp::tcp_acceptor acceptor;
		auto result = acceptor.open(sockpp::inet_address(LOOPBACK_ADDRESS, static_cast<in_port_t>(candidate)));
		if (!result) {
			if (result.error() == std::errc::address_in_use) {
				spdlog::warn("Connection: port {} in use, trying next port", candidate);
				continue;
			}
			spdlog::error("Connection: unable to listen on port {}: {}", candidate, result.error().message());
			throw TransportError(std::format("Failed to listen on port {}: {}", candidate, result.error().message()));
		}

		listener = std::move(acceptor);
		port = listener.address().port();
		state = ConnectionState::LISTENING;
		running = true;
		server_thread = std::thread(&Connection::Run, this);

		spdlog::info("Connection: DBGp listener started on port {}", port.load());
		return port;
	}

	spdlog::error("Connection: no available port in {}..{}", requested_port, requested_port + max_attempts - 1);
	throw TransportError(std::format("No available port starting at {} after {} attempts", requested_port, max_attempts));
}

void Connection::Close() {
	running = false;
	{
		std::lock_guard lock(socket_mutex);
		if (socket.is_open()) {
			socket.shutdown();
		}
		if (listener.is_open()) {
			listener.shutdown();
		}
	}

	if (server_thread.joinable()) {
		server_thread.join();
	}

	std::lock_guard lock(socket_mutex);
	if (socket.is_open()) {
		socket.close();
	}
	if (listener.is_open()) {
		listener.close();
		spdlog::info("Connection: listener on port {} closed", port.load());
	}
	state = ConnectionState::DISCONNECTED;
}

bool Connection::Write(const std::string& data) {
	std::lock_guard lock(socket_mutex);
	if (!socket.is_open() || state != ConnectionState::CONNECTED) {
		return false;
	}

	auto result = socket.write_n(data.data(), data.length());
	if (!result || result.value() != data.length()) {
		spdlog::error("Connection: write failed");
		return false;
	}
	return true;
}

void Connection::Run() {
	while (running) {
		if (!WaitForConnection()) {
			continue;
		}

		ReceiveLoop();

		{
			std::lock_guard lock(socket_mutex);
			socket.close();
		}
		state = running ? ConnectionState::LISTENING : ConnectionState::DISCONNECTED;
		spdlog::info("Connection: debugger engine disconnected");
		if (disconnected_handler) {
			disconnected_handler();
		}
	}
}

bool Connection::WaitForConnection() {
	spdlog::debug("Connection: waiting for debugger engine on port {}...", port.load());
	auto response = listener.accept();
	if (!response) {
		if (running) {
			spdlog::error("Connection: invalid connection: {}", response.error().message());
			std::this_thread::sleep_for(ACCEPT_RETRY_DELAY);
		}
		return false;
	}

	{
		std::lock_guard lock(socket_mutex);
		socket = response.release();
		if (!running) {
			socket.close();
			return false;
		}
	}
	state = ConnectionState::CONNECTED;
	spdlog::info("Connection: debugger engine connected");

	if (connected_handler) {
		connected_handler();
	}
	return true;
}

void Connection::ReceiveLoop() {
	char buffer[RECEIVE_BUFFER_SIZE];
	while (running) {
		auto response = socket.read(buffer, sizeof(buffer));
		if (!response) {
			if (running) {
				spdlog::error("Connection: socket error: {}", response.error().message());
			}
			return;
		}
		if (response.value() == 0) {
			return;
		}

		if (data_handler) {
			data_handler(std::string_view(buffer, response.value()));
		}
	}
}
