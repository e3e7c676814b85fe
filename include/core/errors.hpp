#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

enum class ErrorKind {
    None,
    ConfigurationError,
    PermissionDenied,
    AudioSubsystemError,
    PersistenceError,
    DecodeGlitch,
    ModelLoadError
};

const char* errorKindName(ErrorKind kind);

// Thrown by the capture, engine and options layers. The session controller
// converts it into an Outcome at the command boundary.
class SessionError : public std::runtime_error {
public:
    SessionError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Result of a host command (loadModel, start).
struct Outcome {
    bool ok = true;
    ErrorKind kind = ErrorKind::None;
    std::string message;

    static Outcome success() { return Outcome{}; }
    static Outcome failure(ErrorKind kind, std::string message) {
        Outcome out;
        out.ok = false;
        out.kind = kind;
        out.message = std::move(message);
        return out;
    }

    explicit operator bool() const { return ok; }
};

#endif
