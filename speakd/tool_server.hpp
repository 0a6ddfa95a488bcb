#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "audio_export.hpp"
#include "playback_controller.hpp"

namespace speakd {

struct ToolResult {
    std::string text;
    bool isError = false;
    std::optional<nlohmann::ordered_json> structured;
};

// JSON-RPC 2.0 front end speaking the MCP stdio dialect: initialize, ping,
// tools/list and tools/call. One request per line, one response per line.
class ToolServer {
public:
    static constexpr const char* kServerName = "speakd";
    static constexpr const char* kServerVersion = "0.3.0";
    static constexpr const char* kProtocolVersion = "2024-11-05";

    ToolServer(PlaybackController& playback, SpeechExporter& exporter);

    // nullopt for notifications, which get no reply.
    std::optional<nlohmann::json> handle(const nlohmann::json& request);
    std::optional<std::string> handleLine(const std::string& line);

    ToolResult callTool(const std::string& name, const nlohmann::json& args);

    static nlohmann::json toolDescriptions();

private:
    PlaybackController& playback_;
    SpeechExporter& exporter_;
};

} // namespace speakd
