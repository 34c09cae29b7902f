#pragma once

#include <string>

// Byte sink for outgoing commands, implemented by the socket connection
class Transport {
public:
	virtual ~Transport() {}

	virtual bool IsConnected() const = 0;
	virtual bool Write(const std::string& data) = 0;
};
