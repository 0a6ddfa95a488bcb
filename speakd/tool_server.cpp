#include "tool_server.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

#include "voice_catalog.hpp"

using json = nlohmann::json;
using namespace std;

namespace speakd {

namespace {

constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

json errorResponse(const json& id, int code, const string& message) {
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

json okResponse(const json& id, json result) {
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

// Unknown tool names are a protocol error, bad arguments are a tool error.
struct UnknownTool : runtime_error {
    using runtime_error::runtime_error;
};

string stringArg(const json& args, const char* name, const optional<string>& fallback = nullopt) {
    if (!args.contains(name) || args[name].is_null()) {
        if (fallback) return *fallback;
        throw invalid_argument(string("Missing argument: ") + name);
    }
    if (!args[name].is_string()) throw invalid_argument(string(name) + " must be a string");
    return args[name].get<string>();
}

double numberArg(const json& args, const char* name, double fallback) {
    if (!args.contains(name) || args[name].is_null()) return fallback;
    if (!args[name].is_number()) throw invalid_argument(string(name) + " must be a number");
    return args[name].get<double>();
}

bool boolArg(const json& args, const char* name, bool fallback) {
    if (!args.contains(name) || args[name].is_null()) return fallback;
    if (!args[name].is_boolean()) throw invalid_argument(string(name) + " must be a boolean");
    return args[name].get<bool>();
}

json schema(json properties, json required = json::array()) {
    return json{{"type", "object"}, {"properties", std::move(properties)}, {"required", std::move(required)}};
}

json tool(const char* name, const char* description, json inputSchema) {
    return json{{"name", name}, {"description", description}, {"inputSchema", std::move(inputSchema)}};
}

} // namespace

ToolServer::ToolServer(PlaybackController& playback, SpeechExporter& exporter)
    : playback_(playback), exporter_(exporter) {}

json ToolServer::toolDescriptions() {
    const json text = {{"type", "string"}, {"description", "Text to speak."}};
    const json voice = {{"type", "string"}, {"default", kDefaultVoice},
                        {"description", "Voice name (e.g. af_heart, bm_fable)."}};
    const json speed = {{"type", "number"}, {"default", 1.0}, {"description", "Speed multiplier."}};

    json tools = json::array();
    tools.push_back(tool("speak", "Speak text aloud. Returns immediately while audio plays in background.",
                         schema({{"text", text}, {"voice", voice}, {"speed", speed}}, json::array({"text"}))));
    tools.push_back(tool("pause", "Pause current audio playback.", schema(json::object())));
    tools.push_back(tool("resume", "Resume paused audio playback.", schema(json::object())));
    tools.push_back(tool("stop", "Stop any currently-playing audio immediately.", schema(json::object())));
    tools.push_back(tool("status", "Return current playback state: idle, playing, or paused.",
                         schema(json::object())));
    tools.push_back(tool("speak_and_save", "Generate speech and save to a file. Blocks until file is written.",
                         schema({{"text", text},
                                 {"output_path", {{"type", "string"}, {"default", SpeechExporter::kDefaultOutputPath}}},
                                 {"voice", voice},
                                 {"speed", speed},
                                 {"mp3", {{"type", "boolean"}, {"default", false},
                                          {"description", "Save as MP3 (requires ffmpeg)."}}}},
                                json::array({"text"}))));
    tools.push_back(tool("list_voices", "List all available voices, grouped by accent and gender.",
                         schema(json::object())));
    return tools;
}

ToolResult ToolServer::callTool(const string& name, const json& args) {
    try {
        if (!args.is_object()) throw invalid_argument("arguments must be an object");

        if (name == "speak") {
            return {playback_.speak(stringArg(args, "text"), stringArg(args, "voice", kDefaultVoice),
                                    numberArg(args, "speed", 1.0))};
        }
        if (name == "pause") return {playback_.pause()};
        if (name == "resume") return {playback_.resume()};
        if (name == "stop") return {playback_.stop()};
        if (name == "status") return {string(toString(playback_.status()))};
        if (name == "speak_and_save") {
            return {exporter_.save(stringArg(args, "text"),
                                   stringArg(args, "output_path", SpeechExporter::kDefaultOutputPath),
                                   stringArg(args, "voice", kDefaultVoice),
                                   numberArg(args, "speed", 1.0),
                                   boolArg(args, "mp3", false))};
        }
        if (name == "list_voices") {
            nlohmann::ordered_json catalog = nlohmann::ordered_json::object();
            for (const auto& group : voiceCatalog()) catalog[group.label] = group.voices;
            return {catalog.dump(), false, catalog};
        }
    } catch (const exception& e) {
        spdlog::error("Tool {} failed: {}", name, e.what());
        return {string("Error: ") + e.what(), true};
    }
    throw UnknownTool("Unknown tool: " + name);
}

optional<json> ToolServer::handle(const json& request) {
    if (!request.is_object() || !request.contains("method") || !request["method"].is_string()) {
        const bool hasId = request.is_object() && request.contains("id");
        return errorResponse(hasId ? request["id"] : json(), kInvalidRequest, "Invalid request");
    }

    const auto method = request["method"].get<string>();
    const bool notification = !request.contains("id");
    const json id = notification ? json() : request["id"];
    const json params = request.contains("params") ? request["params"] : json::object();

    try {
        if (method == "initialize") {
            auto version = params.is_object() ? params.value("protocolVersion", string(kProtocolVersion))
                                              : string(kProtocolVersion);
            return okResponse(id, {{"protocolVersion", version},
                                   {"capabilities", {{"tools", json::object()}}},
                                   {"serverInfo", {{"name", kServerName}, {"version", kServerVersion}}}});
        }
        if (method.rfind("notifications/", 0) == 0) {
            spdlog::debug("Notification {}", method);
            return nullopt;
        }
        if (method == "ping") return okResponse(id, json::object());
        if (method == "tools/list") return okResponse(id, {{"tools", toolDescriptions()}});
        if (method == "tools/call") {
            if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
                return errorResponse(id, kInvalidParams, "tools/call needs a tool name");
            }
            auto name = params["name"].get<string>();
            spdlog::debug("Calling tool {}", name);
            auto result = callTool(name, params.contains("arguments") ? params["arguments"] : json::object());

            json body = {{"content", json::array({{{"type", "text"}, {"text", result.text}}})},
                         {"isError", result.isError}};
            if (result.structured) body["structuredContent"] = json::parse(result.structured->dump());
            if (notification) return nullopt;
            return okResponse(id, std::move(body));
        }
    } catch (const UnknownTool& e) {
        return errorResponse(id, kInvalidParams, e.what());
    } catch (const exception& e) {
        spdlog::error("Request {} failed: {}", method, e.what());
        return errorResponse(id, kInternalError, e.what());
    }

    if (notification) return nullopt;
    return errorResponse(id, kMethodNotFound, "Method not found: " + method);
}

optional<string> ToolServer::handleLine(const string& line) {
    json request;
    try {
        request = json::parse(line);
    } catch (const json::parse_error& e) {
        spdlog::warn("Unparseable request: {}", e.what());
        return errorResponse(nullptr, kParseError, "Parse error").dump();
    }
    auto response = handle(request);
    if (!response) return nullopt;
    return response->dump();
}

} // namespace speakd
