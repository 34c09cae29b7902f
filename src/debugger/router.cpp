#include "router.hpp"

#include <cstdlib>
#include <spdlog/spdlog.h>

#include "errors.hpp"
#include "parser.hpp"

TransactionRouter::TransactionRouter(Transport& transport, std::chrono::milliseconds timeout) : transport(transport), timeout(timeout) {}

PendingCommand TransactionRouter::Submit(const DbgpCommand& command) {
	if (!transport.IsConnected()) {
		throw NotConnectedError();
	}

	PendingCommand result{};
	result.name = command.name;
	{
		std::lock_guard lock(mutex);
		result.transaction_id = next_transaction_id++;
		auto [it, _] = pending.emplace(result.transaction_id, std::promise<Response>{});
		result.future = it->second.get_future();
	}

	auto line = EncodeCommand(command, result.transaction_id);
	spdlog::debug("Router: -> {} -i {}", command.name, result.transaction_id);
	if (!transport.Write(line)) {
		Cancel(result.transaction_id);
		throw TransportError("Failed to send " + command.name + " to debugger engine");
	}

	return result;
}

Response TransactionRouter::Await(PendingCommand& pending_command) {
	if (pending_command.future.wait_for(timeout) != std::future_status::ready) {
		// Nothing to cancel means the response landed between the wait and the cancel
		if (Cancel(pending_command.transaction_id)) {
			spdlog::warn("Router: {} (transaction {}) timed out", pending_command.name, pending_command.transaction_id);
			throw TimeoutError(pending_command.name, pending_command.transaction_id);
		}
	}
	return pending_command.future.get();
}

Response TransactionRouter::Send(const DbgpCommand& command) {
	auto pending_command = Submit(command);
	return Await(pending_command);
}

bool TransactionRouter::Dispatch(const std::string& message) {
	auto response = ParseResponse(message);
	if (!response.Has("transaction_id")) {
		return false;
	}

	int transaction_id = static_cast<int>(std::strtol(response.Get("transaction_id").c_str(), nullptr, 10));

	std::promise<Response> promise;
	{
		std::lock_guard lock(mutex);
		auto it = pending.find(transaction_id);
		if (it == pending.end()) {
			spdlog::warn("Router: no pending transaction {}", transaction_id);
			return false;
		}
		promise = std::move(it->second);
		pending.erase(it);
	}

	spdlog::debug("Router: <- {} -i {}", response.Get("command"), transaction_id);
	promise.set_value(std::move(response));
	return true;
}

bool TransactionRouter::Cancel(int transaction_id) {
	std::lock_guard lock(mutex);
	return pending.erase(transaction_id) > 0;
}

void TransactionRouter::RejectAll(const std::string& reason) {
	std::map<int, std::promise<Response>> rejected;
	{
		std::lock_guard lock(mutex);
		rejected.swap(pending);
	}

	if (!rejected.empty()) {
		spdlog::warn("Router: rejecting {} pending transactions: {}", rejected.size(), reason);
	}
	for (auto& [transaction_id, promise] : rejected) {
		promise.set_exception(std::make_exception_ptr(TransportError(reason)));
	}
}

size_t TransactionRouter::GetPendingCount() {
	std::lock_guard lock(mutex);
	return pending.size();
}

int TransactionRouter::GetNextTransactionId() {
	std::lock_guard lock(mutex);
	return next_transaction_id;
}
