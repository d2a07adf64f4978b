#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

#include "msg/Message.hpp"

namespace ctrl {

// Upper bound for bytes buffered without a line break. Past this the stream
// is considered corrupt and the buffer is dropped.
static constexpr std::size_t MAX_FRAME_BYTES = 64 * 1024;

enum class DecodeStatus : uint8_t {
    OK = 0,
    INCOMPLETE,     // no delimiter yet; keep accumulating
    FRAME_ERROR,    // one unit consumed and lost; the rest of the buffer is still usable
};

const char* DecodeStatusStr(DecodeStatus s);

// ---------------------------------------------------------------------------
// FrameCodec: newline-delimited JSON objects on the command channel.
// Stateless; the caller owns the receive buffer.
// ---------------------------------------------------------------------------
class FrameCodec {
public:
    static constexpr char DELIM = '\n';

    // Compact JSON object + one DELIM. String escaping keeps raw line breaks
    // out of the payload.
    static std::string Encode(const msg::Message& m);

    // Consumes at most one unit from the front of 'buffer'.
    //   INCOMPLETE : no DELIM in buffer, buffer untouched (unless over MAX_FRAME_BYTES)
    //   FRAME_ERROR: unit removed, not an object with a non-empty string "cmd"
    //   OK         : unit removed, 'out' filled
    // Blank lines (and a trailing '\r') are skipped without reporting.
    static DecodeStatus Decode(std::string& buffer, msg::Message& out);

    // Parses one already-delimited payload (no DELIM).
    static bool ParseLine(const std::string& line, msg::Message& out);
};

} // namespace ctrl
