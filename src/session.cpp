#include "session.hpp"

#include <spdlog/spdlog.h>

DbgpClient& Session::Get() {
	if (!client) {
		client = std::make_unique<DbgpClient>(config);
	}
	return *client;
}

void Session::Reset() {
	if (!client) {
		return;
	}

	spdlog::debug("Session: resetting debugger session");
	client->Close();
	client.reset();
}
