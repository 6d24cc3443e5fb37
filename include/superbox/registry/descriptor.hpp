#pragma once

#include <superbox/core/result.hpp>

#include <string>
#include <string_view>

namespace superbox {

// ---------------------------------------------------------------------------
// Descriptor: deployment metadata for a named server, resolved once per
// session.
//
// Stored form:
//   {"repository": {"url": "https://github.com/o/r"},
//    "entrypoint": "main.py",
//    "lang": "python"}
// ---------------------------------------------------------------------------
struct Descriptor {
    std::string repository_url;
    std::string entrypoint;
    std::string language;

    bool operator==(const Descriptor& other) const {
        return repository_url == other.repository_url &&
               entrypoint == other.entrypoint && language == other.language;
    }
    bool operator!=(const Descriptor& other) const { return !(*this == other); }
};

// Parse and validate a stored descriptor. A missing or non-string field is a
// StoreError naming it; a language other than python is UnsupportedLanguage.
[[nodiscard]] Result<Descriptor, Error> ParseDescriptor(std::string_view json_text,
                                                        std::string_view source);

// Validation shared by stored and directly supplied descriptors.
[[nodiscard]] Result<void, Error> ValidateDescriptor(const Descriptor& descriptor);

} // namespace superbox
