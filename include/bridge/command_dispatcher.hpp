#ifndef COMMAND_DISPATCHER_HPP
#define COMMAND_DISPATCHER_HPP

#include "session/event_bus.hpp"
#include "session/session_controller.hpp"

#include <nlohmann/json.hpp>

#include <string>

// Maps JSON command datagrams onto the session controller and encodes its
// events for the host.
//
//   {"id": 1, "cmd": "start", "options": {"grammar": [...], "timeout": 5000}}
//   -> {"type": "reply", "id": 1, "ok": true}
//
//   {"type": "event", "name": "onPartialResult", "body": "hello"}
class CommandDispatcher {
public:
    explicit CommandDispatcher(SessionController& controller);

    std::string handle(const std::string& payload);

    static std::string encodeEvent(const SessionEvent& event);

private:
    nlohmann::json dispatch(const nlohmann::json& command);

    SessionController& controller_;
};

#endif
