#pragma once
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace msg {

// Command-channel tags. The wire carries the lower-case string form.
enum class CmdType : uint8_t {
    UNKNOWN = 0,
    REGISTER_VIDEO,
    MOVE,
    STOP,
    STATUS,
    QUIT,
    // vehicle -> operator replies
    STATUS_REPORT,
    ERROR,
};

// One command-channel unit. 'cmd' is always the non-empty wire tag (kept even
// when the tag is unknown to us, for logging); 'body' is the whole decoded
// JSON object including the "cmd" member.
struct Message {
    CmdType        type = CmdType::UNKNOWN;
    std::string    cmd;
    nlohmann::json body = nlohmann::json::object();
};

inline const char* CmdTypeStr(CmdType t) {
    switch (t) {
        case CmdType::REGISTER_VIDEO: return "register_video";
        case CmdType::MOVE:           return "move";
        case CmdType::STOP:           return "stop";
        case CmdType::STATUS:         return "status";
        case CmdType::QUIT:           return "quit";
        case CmdType::STATUS_REPORT:  return "status_report";
        case CmdType::ERROR:          return "error";
        default:                      return "unknown";
    }
}

inline CmdType ParseCmdType(const std::string& s) {
    if (s == "register_video") return CmdType::REGISTER_VIDEO;
    if (s == "move")           return CmdType::MOVE;
    if (s == "stop")           return CmdType::STOP;
    if (s == "status")         return CmdType::STATUS;
    if (s == "quit")           return CmdType::QUIT;
    if (s == "status_report")  return CmdType::STATUS_REPORT;
    if (s == "error")          return CmdType::ERROR;
    return CmdType::UNKNOWN;
}

// Builds a message whose body holds only the "cmd" member.
inline Message MakeMessage(CmdType t) {
    Message m;
    m.type = t;
    m.cmd  = CmdTypeStr(t);
    m.body = nlohmann::json::object();
    m.body["cmd"] = m.cmd;
    return m;
}

} // namespace msg
