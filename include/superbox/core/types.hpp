#pragma once

#include <superbox/core/result.hpp>

#include <string>
#include <string_view>

namespace superbox {

// ---------------------------------------------------------------------------
// ServerName: validated logical server name.
//
// Rules:
//   - Non-empty, max 128 characters
//   - ASCII letters, digits, '-', '_', '.'
//   - Not "." or ".."
//
// The name becomes a store key ("<name>.json") and a temp directory prefix,
// so it must never contain path separators.
// ---------------------------------------------------------------------------
class ServerName {
public:
    static Result<ServerName, std::string> Create(std::string_view name);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const ServerName& other) const { return value_ == other.value_; }
    bool operator!=(const ServerName& other) const { return value_ != other.value_; }

private:
    explicit ServerName(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// The one interpreted runtime the bridge can launch.
constexpr const char* kSupportedLanguage = "python";

// Case-insensitive comparison against kSupportedLanguage.
bool IsSupportedLanguage(std::string_view language);

} // namespace superbox
