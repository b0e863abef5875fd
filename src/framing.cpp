#include "framing.hpp"
#include <stdexcept>

namespace bashbuddy {

std::string dump_lossy(const nlohmann::json& value) {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string encode_frame(const nlohmann::json& message) {
    // dump() escapes control characters, so the payload never contains "\n\n"
    return dump_lossy(message) + FRAME_TERMINATOR;
}

void FrameBuffer::append(const char* data, size_t len) {
    buf_.append(data, len);
}

bool FrameBuffer::has_frame() const {
    return buf_.find(FRAME_TERMINATOR) != std::string::npos;
}

std::optional<std::string> FrameBuffer::take_frame() {
    size_t pos = buf_.find(FRAME_TERMINATOR);
    if (pos == std::string::npos) return std::nullopt;
    std::string payload = buf_.substr(0, pos);
    buf_.erase(0, pos + 2);
    return payload;
}

bool FrameBuffer::overflowed() const {
    return !has_frame() && buf_.size() > MAX_FRAME_BYTES;
}

nlohmann::json decode_frame(const std::string& payload) {
    auto j = nlohmann::json::parse(payload);
    if (!j.is_object()) {
        throw std::runtime_error("frame payload is not a JSON object");
    }
    return j;
}

} // namespace bashbuddy
