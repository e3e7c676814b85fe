#ifndef START_OPTIONS_HPP
#define START_OPTIONS_HPP

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

struct StartOptions {
    // Empty means unconstrained. "[unk]" makes the vocabulary closed.
    std::vector<std::string> grammar;

    std::optional<int> timeoutMs;

    std::optional<std::string> audioFilePath;
};

// Accepts {"grammar": [...], "timeout" | "timeoutMs": n, "audioFilePath": "..."}.
// Null or missing fields are left unset. Throws SessionError(ConfigurationError).
StartOptions parseStartOptions(const nlohmann::json& options);
StartOptions parseStartOptions(const std::string& text);

// Throws SessionError(ConfigurationError) on an empty phrase or a negative timeout.
void validateStartOptions(const StartOptions& options);

#endif
