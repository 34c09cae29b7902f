#pragma once

#include <stdexcept>
#include <string>

class DbgpError : public std::runtime_error {
public:
	explicit DbgpError(const std::string& message) : std::runtime_error(message) {}
};

class NotConnectedError : public DbgpError {
public:
	NotConnectedError() : DbgpError("Not connected to debugger engine") {}
};

class TimeoutError : public DbgpError {
public:
	TimeoutError(const std::string& command, int transaction_id)
		: DbgpError("Command timeout: " + command + " (transaction " + std::to_string(transaction_id) + ")"),
		transaction_id(transaction_id) {}

	int GetTransactionId() const { return transaction_id; }
private:
	int transaction_id;
};

class TransportError : public DbgpError {
public:
	explicit TransportError(const std::string& message) : DbgpError(message) {}
};

// Engine replied with <error code="N"/>
class EngineError : public DbgpError {
public:
	EngineError(const std::string& command, int code, const std::string& message)
		: DbgpError("Engine error " + std::to_string(code) + " for " + command + (message.empty() ? "" : ": " + message)),
		code(code) {}

	int GetCode() const { return code; }
private:
	int code;
};
