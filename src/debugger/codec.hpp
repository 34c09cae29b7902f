#pragma once

#include <string>
#include <string_view>
#include <vector>

constexpr const char INIT_MARKER[] = "<init ";

struct DbgpCommand {
	std::string name;
	std::string args;
	// Sent base64 encoded after "--"
	std::string data;
};

enum class FrameType {
	INIT,
	MESSAGE,
};

struct Frame {
	FrameType type;
	std::string payload;
};

std::string EncodeCommand(const DbgpCommand& command, int transaction_id);

std::string PathToFileUri(std::string path);
// Strips the scheme and decodes %XX escapes
std::string FileUriToPath(std::string_view uri);
std::string DecodePercent(std::string_view text);
std::string QuoteArgument(std::string_view value);

class FrameDecoder {
public:
	// Appends raw bytes and returns every frame completed by them
	std::vector<Frame> Feed(std::string_view data);

	size_t GetBufferedSize() const { return buffer.size(); }
	void Reset() { buffer.clear(); }
private:
	std::string buffer;
};
