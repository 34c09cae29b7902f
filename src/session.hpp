#pragma once

#include <memory>

#include "debugger/client.hpp"

// Owns the single debugger session of the process
class Session {
public:
	explicit Session(ClientConfig config = {}) : config(config) {}
	~Session() { Reset(); }

	// Creates the client on first use
	DbgpClient& Get();
	void Reset();
	bool IsActive() const { return client != nullptr; }

	ClientConfig& GetConfig() { return config; }
private:
	ClientConfig config;
	std::unique_ptr<DbgpClient> client;
};
