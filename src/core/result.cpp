#include <superbox/core/result.hpp>

#include <nlohmann/json.hpp>

namespace superbox {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound:                 return "NotFound";
        case ErrorKind::StoreError:               return "StoreError";
        case ErrorKind::UnsupportedSource:        return "UnsupportedSource";
        case ErrorKind::ProvisionError:           return "ProvisionError";
        case ErrorKind::UnsupportedLanguage:      return "UnsupportedLanguage";
        case ErrorKind::EntrypointMissing:        return "EntrypointMissing";
        case ErrorKind::HandshakeFailure:         return "HandshakeFailure";
        case ErrorKind::BrokenPipe:               return "BrokenPipe";
        case ErrorKind::ProcessExited:            return "ProcessExited";
        case ErrorKind::Timeout:                  return "Timeout";
        case ErrorKind::DependencyInstallFailure: return "DependencyInstallFailure";
        case ErrorKind::InvalidRequest:           return "InvalidRequest";
        case ErrorKind::SpawnError:               return "SpawnError";
        case ErrorKind::ConfigError:              return "ConfigError";
        case ErrorKind::Internal:                 return "Internal";
    }
    return "Internal";
}

int Error::ExitCode() const {
    switch (kind) {
        case ErrorKind::InvalidRequest:           return 2;
        case ErrorKind::ConfigError:              return 2;
        case ErrorKind::NotFound:                 return 3;
        case ErrorKind::StoreError:               return 3;
        case ErrorKind::UnsupportedSource:        return 4;
        case ErrorKind::ProvisionError:           return 4;
        case ErrorKind::DependencyInstallFailure: return 4;
        case ErrorKind::UnsupportedLanguage:      return 5;
        case ErrorKind::EntrypointMissing:        return 5;
        case ErrorKind::SpawnError:               return 5;
        case ErrorKind::HandshakeFailure:         return 6;
        case ErrorKind::BrokenPipe:               return 7;
        case ErrorKind::ProcessExited:            return 7;
        case ErrorKind::Timeout:                  return 10;
        case ErrorKind::Internal:                 return 99;
    }
    return 99;
}

std::string Error::ToString() const {
    std::string out = operation.empty() ? message : operation + ": " + message;
    if (detail.has_value() && !detail->empty()) {
        out += " (" + *detail + ")";
    }
    return out;
}

std::string Error::ToEnvelope() const {
    auto text = message;
    if (detail.has_value() && !detail->empty()) {
        text += ": " + *detail;
    }
    nlohmann::ordered_json envelope;
    envelope["error"] = text;
    envelope["type"] = KindName();
    // Child output is not guaranteed to be valid UTF-8.
    return envelope.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace superbox
