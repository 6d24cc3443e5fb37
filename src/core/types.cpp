#include <superbox/core/types.hpp>

#include <algorithm>
#include <cctype>

namespace superbox {

namespace {

constexpr size_t kMaxServerNameLength = 128;

bool IsNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 ||
           c == '-' || c == '_' || c == '.';
}

} // anonymous namespace

Result<ServerName, std::string> ServerName::Create(std::string_view name) {
    if (name.empty()) {
        return Result<ServerName, std::string>::Err("Server name must not be empty");
    }
    if (name.size() > kMaxServerNameLength) {
        return Result<ServerName, std::string>::Err(
            "Server name must be at most 128 characters, got " +
            std::to_string(name.size()));
    }
    if (!std::all_of(name.begin(), name.end(), IsNameChar)) {
        return Result<ServerName, std::string>::Err(
            "Server name may contain only letters, digits, '-', '_' and '.'");
    }
    if (name == "." || name == "..") {
        return Result<ServerName, std::string>::Err(
            "Server name must not be '.' or '..'");
    }
    return Result<ServerName, std::string>::Ok(ServerName(std::string(name)));
}

bool IsSupportedLanguage(std::string_view language) {
    const std::string_view supported{kSupportedLanguage};
    if (language.size() != supported.size()) {
        return false;
    }
    for (size_t i = 0; i < language.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(language[i])) != supported[i]) {
            return false;
        }
    }
    return true;
}

} // namespace superbox
