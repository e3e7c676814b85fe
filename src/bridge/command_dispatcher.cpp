#include "bridge/command_dispatcher.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"
#include "session/start_options.hpp"
#include "stt/result_json.hpp"

using nlohmann::json;

namespace {

json okReply() { return json{{"ok", true}}; }

json errorReply(ErrorKind kind, const std::string& message) {
    return json{{"ok", false}, {"error", {{"kind", errorKindName(kind)}, {"message", message}}}};
}

json outcomeReply(const Outcome& outcome) {
    if (outcome.ok) return okReply();
    return errorReply(outcome.kind, outcome.message);
}

}

// Constructor
CommandDispatcher::CommandDispatcher(SessionController& controller) : controller_(controller) {}

std::string CommandDispatcher::handle(const std::string& payload) {
    json command = json::parse(payload, nullptr, false);

    json reply;
    if (command.is_discarded() || !command.is_object()) {
        logWarn("Command Dispatcher", "malformed command: " + payload);
        reply = errorReply(ErrorKind::ConfigurationError, "malformed command");
    } else {
        reply = dispatch(command);
        if (command.contains("id")) reply["id"] = command["id"];
    }

    reply["type"] = "reply";
    return dumpJson(reply);
}

json CommandDispatcher::dispatch(const json& command) {
    const auto cmd = command.find("cmd");
    if (cmd == command.end() || !cmd->is_string()) {
        return errorReply(ErrorKind::ConfigurationError, "missing \"cmd\"");
    }

    const std::string name = cmd->get<std::string>();
    logDebug("Command Dispatcher", "command: " + name);

    if (name == "loadModel") {
        const auto path = command.find("path");
        if (path == command.end() || !path->is_string()) {
            return errorReply(ErrorKind::ConfigurationError, "loadModel requires \"path\"");
        }
        return outcomeReply(controller_.loadModel(path->get<std::string>()));
    }

    if (name == "start") {
        StartOptions options;
        try {
            const auto raw = command.find("options");
            if (raw != command.end()) options = parseStartOptions(*raw);
        } catch (const SessionError& e) {
            return errorReply(e.kind(), e.what());
        }
        return outcomeReply(controller_.start(options));
    }

    if (name == "stop") {
        controller_.stop();
        return okReply();
    }

    if (name == "pause") {
        controller_.pause();
        return okReply();
    }

    if (name == "resume") {
        json reply = okReply();
        reply["value"] = controller_.resume();
        return reply;
    }

    if (name == "unload") {
        controller_.unload();
        return okReply();
    }

    return errorReply(ErrorKind::ConfigurationError, "unknown command: " + name);
}

std::string CommandDispatcher::encodeEvent(const SessionEvent& event) {
    json doc{{"type", "event"}, {"name", eventName(event.type)}};

    switch (event.type) {
        case EventType::Result:
        case EventType::FinalResult:
            doc["body"] = resultBody(event.result);
            break;
        case EventType::PartialResult:
        case EventType::Error:
            doc["body"] = event.text;
            break;
        case EventType::VolumeChanged:
            doc["body"] = event.volume;
            break;
        case EventType::Timeout:
            break;
    }
    return dumpJson(doc);
}
