#include "core/errors.hpp"

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::ConfigurationError: return "ConfigurationError";
        case ErrorKind::PermissionDenied: return "PermissionDenied";
        case ErrorKind::AudioSubsystemError: return "AudioSubsystemError";
        case ErrorKind::PersistenceError: return "PersistenceError";
        case ErrorKind::DecodeGlitch: return "DecodeGlitch";
        case ErrorKind::ModelLoadError: return "ModelLoadError";
    }
    return "Unknown";
}
