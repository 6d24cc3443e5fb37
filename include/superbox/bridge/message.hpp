#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace superbox {

// ---------------------------------------------------------------------------
// InboundMessage: a client message after envelope handling.
//
// `line` is what goes to the child: `_mcp_name` removed, `params: {}` added
// to requests that lack it, key order otherwise unchanged. A body that is not
// a JSON object passes through untouched with `is_json == false`.
// ---------------------------------------------------------------------------
struct InboundMessage {
    std::string line;
    std::optional<std::string> mcp_name;
    bool is_json = false;
    bool is_request = false;      // has "method" and "id"
    bool is_notification = false; // has "method", no "id"
};

[[nodiscard]] InboundMessage PrepareInbound(std::string_view body);

// Trim surrounding whitespace and line terminators from a relayed line.
[[nodiscard]] std::string StripFraming(std::string_view line);

} // namespace superbox
