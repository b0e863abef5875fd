#pragma once
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace bashbuddy {

// One JSON object per frame, followed by a blank line.
inline constexpr const char* FRAME_TERMINATOR = "\n\n";
inline constexpr size_t MAX_FRAME_BYTES = 1024 * 1024;

// dump() that replaces invalid UTF-8 (file names, man output) with U+FFFD
// instead of throwing type_error.316.
std::string dump_lossy(const nlohmann::json& value);

std::string encode_frame(const nlohmann::json& message);

// Accumulates bytes read from a connection until a complete frame is present.
class FrameBuffer {
public:
    void append(const char* data, size_t len);
    void append(const std::string& data) { append(data.data(), data.size()); }

    bool has_frame() const;

    // Bytes before the first terminator, removed from the buffer together
    // with the terminator. nullopt while the terminator has not been seen.
    std::optional<std::string> take_frame();

    // Buffered bytes beyond MAX_FRAME_BYTES without a terminator.
    bool overflowed() const;

    size_t size() const { return buf_.size(); }
    bool empty() const { return buf_.empty(); }

private:
    std::string buf_;
};

// Parses a frame payload. Throws nlohmann::json::parse_error on bad JSON
// and std::runtime_error when the payload is not an object.
nlohmann::json decode_frame(const std::string& payload);

} // namespace bashbuddy
