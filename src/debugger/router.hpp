#pragma once

#include <map>
#include <mutex>
#include <chrono>
#include <future>
#include <string>

#include "codec.hpp"
#include "types.hpp"
#include "transport.hpp"

constexpr auto DEFAULT_COMMAND_TIMEOUT = std::chrono::milliseconds(10000);

struct PendingCommand {
	int transaction_id;
	std::string name;
	std::future<Response> future;
};

class TransactionRouter {
public:
	TransactionRouter(Transport& transport, std::chrono::milliseconds timeout = DEFAULT_COMMAND_TIMEOUT);

	// Registers the transaction and writes the command, does not wait
	PendingCommand Submit(const DbgpCommand& command);
	// Waits for a submitted command, removing it on timeout
	Response Await(PendingCommand& pending);
	Response Send(const DbgpCommand& command);

	// Resolves the pending transaction named by the message, false if none matches
	bool Dispatch(const std::string& message);
	bool Cancel(int transaction_id);
	void RejectAll(const std::string& reason);

	size_t GetPendingCount();
	int GetNextTransactionId();
	std::chrono::milliseconds GetTimeout() const { return timeout; }
private:
	Transport& transport;
	std::chrono::milliseconds timeout;

	std::mutex mutex;
	int next_transaction_id = 1;
	std::map<int, std::promise<Response>> pending;
};
