#pragma once

#include <mutex>
#include <deque>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <condition_variable>

#include "../debugger/commands.hpp"
#include "../debugger/types.hpp"
#include "source_context.hpp"

constexpr auto DEFAULT_ERROR_QUEUE_SIZE = 100;
constexpr auto DEFAULT_WAIT_TIMEOUT = std::chrono::milliseconds(30000);

typedef std::function<void(const ErrorEvent& error)> ErrorHandler;

class ErrorCapture {
public:
	ErrorCapture(Commands& commands, size_t max_size = DEFAULT_ERROR_QUEUE_SIZE, int context_radius = DEFAULT_CONTEXT_RADIUS);

	// Builds a full error event and queues it. Without a file the innermost
	// stack frame supplies the location.
	ErrorEvent CaptureErrorContext(const std::string& file, int line, const std::string& error_type, const std::string& message);
	ErrorEvent CaptureFault(const Fault& fault);

	void QueueError(ErrorEvent error);
	std::optional<ErrorEvent> WaitForError(std::chrono::milliseconds timeout = DEFAULT_WAIT_TIMEOUT);
	std::vector<ErrorEvent> GetQueuedErrors();
	size_t ClearErrorQueue();
	size_t GetQueueSize();

	size_t GetMaxSize() const { return max_size; }
	int GetContextRadius() const { return context_radius; }
	void SetCapturedHandler(ErrorHandler handler) { captured_handler = std::move(handler); }
private:
	struct Waiter {
		std::condition_variable cv;
		std::optional<ErrorEvent> error;
	};

	Commands& commands;
	size_t max_size;
	int context_radius;
	ErrorHandler captured_handler;

	std::mutex mutex;
	std::deque<ErrorEvent> queue;
	std::deque<std::shared_ptr<Waiter>> waiters;
};
