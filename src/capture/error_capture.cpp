#include "error_capture.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

#include "../debugger/errors.hpp"

ErrorCapture::ErrorCapture(Commands& commands, size_t max_size, int context_radius)
	: commands(commands), max_size(max_size), context_radius(context_radius) {}

ErrorEvent ErrorCapture::CaptureErrorContext(const std::string& file, int line, const std::string& error_type, const std::string& message) {
	ErrorEvent error{};
	error.error_type = error_type;
	error.message = message;
	error.file = file;
	error.line = line;

	// Each step may fail when the engine is not in a break state
	try {
		error.stack_trace = commands.GetStackTrace();
	} catch (const DbgpError& e) {
		spdlog::warn("ErrorCapture: stack trace unavailable: {}", e.what());
	}

	if (error.file.empty() && !error.stack_trace.empty()) {
		error.file = error.stack_trace.front().filename;
		error.line = error.stack_trace.front().lineno;
	}

	error.source_context = GetSourceContext(error.file, error.line, context_radius);

	try {
		error.local_variables = commands.GetVariables(LOCAL_CONTEXT);
	} catch (const DbgpError& e) {
		spdlog::warn("ErrorCapture: local variables unavailable: {}", e.what());
	}

	try {
		error.global_variables = commands.GetVariables(GLOBAL_CONTEXT);
	} catch (const DbgpError& e) {
		spdlog::warn("ErrorCapture: global variables unavailable: {}", e.what());
	}

	error.timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(
		std::chrono::system_clock::now().time_since_epoch()).count();

	spdlog::info("ErrorCapture: captured {} at {}:{}", error.error_type, error.file, error.line);
	QueueError(error);
	return error;
}

ErrorEvent ErrorCapture::CaptureFault(const Fault& fault) {
	return CaptureErrorContext(fault.file, fault.line, fault.error_type, fault.message);
}

void ErrorCapture::QueueError(ErrorEvent error) {
	{
		std::lock_guard lock(mutex);
		if (!waiters.empty()) {
			auto waiter = waiters.front();
			waiters.pop_front();
			waiter->error = error;
			waiter->cv.notify_one();
		} else {
			queue.push_back(error);
			if (queue.size() > max_size) {
				spdlog::debug("ErrorCapture: queue full, dropping oldest error");
				queue.pop_front();
			}
		}
	}

	if (captured_handler) {
		captured_handler(error);
	}
}

std::optional<ErrorEvent> ErrorCapture::WaitForError(std::chrono::milliseconds timeout) {
	std::unique_lock lock(mutex);
	if (!queue.empty()) {
		auto error = std::move(queue.front());
		queue.pop_front();
		return error;
	}

	auto waiter = std::make_shared<Waiter>();
	waiters.push_back(waiter);
	if (!waiter->cv.wait_for(lock, timeout, [&waiter] { return waiter->error.has_value(); })) {
		waiters.erase(std::remove(waiters.begin(), waiters.end(), waiter), waiters.end());
		return std::nullopt;
	}
	return std::move(waiter->error);
}

std::vector<ErrorEvent> ErrorCapture::GetQueuedErrors() {
	std::lock_guard lock(mutex);
	return { queue.begin(), queue.end() };
}

size_t ErrorCapture::ClearErrorQueue() {
	std::lock_guard lock(mutex);
	size_t count = queue.size();
	queue.clear();
	return count;
}

size_t ErrorCapture::GetQueueSize() {
	std::lock_guard lock(mutex);
	return queue.size();
}
