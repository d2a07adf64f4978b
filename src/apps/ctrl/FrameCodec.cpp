#include "apps/ctrl/FrameCodec.hpp"

#include <iostream>

namespace ctrl {

const char* DecodeStatusStr(DecodeStatus s) {
    switch (s) {
        case DecodeStatus::OK:          return "OK";
        case DecodeStatus::INCOMPLETE:  return "INCOMPLETE";
        case DecodeStatus::FRAME_ERROR: return "FRAME_ERROR";
        default:                        return "UNKNOWN";
    }
}

std::string FrameCodec::Encode(const msg::Message& m) {
    nlohmann::json j = m.body.is_object() ? m.body : nlohmann::json::object();
    j["cmd"] = m.cmd.empty() ? std::string(msg::CmdTypeStr(m.type)) : m.cmd;

    // replace: invalid UTF-8 in a string field must not throw out of the codec
    std::string out = j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    out.push_back(DELIM);
    return out;
}

bool FrameCodec::ParseLine(const std::string& line, msg::Message& out) {
    // allow_exceptions=false: a parse error yields a discarded value
    nlohmann::json j = nlohmann::json::parse(line, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return false;

    auto it = j.find("cmd");
    if (it == j.end() || !it->is_string()) return false;

    const std::string cmd = it->get<std::string>();
    if (cmd.empty()) return false;

    out.type = msg::ParseCmdType(cmd);
    out.cmd  = cmd;
    out.body = std::move(j);
    return true;
}

DecodeStatus FrameCodec::Decode(std::string& buffer, msg::Message& out) {
    while (true) {
        const std::size_t pos = buffer.find(DELIM);
        if (pos == std::string::npos) {
            if (buffer.size() > MAX_FRAME_BYTES) {
                std::cerr << "[CODEC] unterminated frame over " << MAX_FRAME_BYTES
                          << " bytes, dropping " << buffer.size() << " bytes\n";
                buffer.clear();
                return DecodeStatus::FRAME_ERROR;
            }
            return DecodeStatus::INCOMPLETE;
        }

        std::string line = buffer.substr(0, pos);
        buffer.erase(0, pos + 1);

        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t") == std::string::npos) continue; // blank

        if (!ParseLine(line, out)) return DecodeStatus::FRAME_ERROR;
        return DecodeStatus::OK;
    }
}

} // namespace ctrl
