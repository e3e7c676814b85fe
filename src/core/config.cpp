#include "core/config.hpp"
#include "core/errors.hpp"

#include <stdexcept>

namespace {

int toInt(const std::string& flag, const std::string& value) {
    try {
        std::size_t used = 0;
        const int v = std::stoi(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::logic_error&) {
        throw SessionError(ErrorKind::ConfigurationError, flag + " expects an integer, got \"" + value + "\"");
    }
}

}

DaemonConfig parseArgs(int argc, char** argv) {
    DaemonConfig config;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        auto next = [&]() -> std::string {
            if (i + 1 >= argc) throw SessionError(ErrorKind::ConfigurationError, arg + " requires a value");
            return argv[++i];
        };

        if (arg == "--model") {
            config.modelPath = next();
        } else if (arg == "--bind") {
            config.bindIp = next();
        } else if (arg == "--port") {
            config.port = toInt(arg, next());
            if (config.port < 0 || config.port > 65535) {
                throw SessionError(ErrorKind::ConfigurationError, "--port out of range");
            }
        } else if (arg == "--threads") {
            config.whisper.threads = toInt(arg, next());
            if (config.whisper.threads <= 0) throw SessionError(ErrorKind::ConfigurationError, "--threads must be positive");
        } else if (arg == "--language") {
            config.whisper.language = next();
        } else if (arg == "--channels") {
            config.capture.maxChannels = toInt(arg, next());
            if (config.capture.maxChannels <= 0) throw SessionError(ErrorKind::ConfigurationError, "--channels must be positive");
        } else if (arg == "--start") {
            config.autoStartOptions = next();
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else {
            throw SessionError(ErrorKind::ConfigurationError, "unknown argument: " + arg);
        }
    }

    return config;
}

std::string usage(const char* program) {
    return std::string("usage: ") + program +
           " [--model PATH] [--bind IP] [--port N] [--threads N] [--language CODE]"
           " [--channels N] [--start JSON] [--verbose]";
}
