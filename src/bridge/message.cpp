#include <superbox/bridge/message.hpp>

#include <nlohmann/json.hpp>

namespace superbox {

namespace {

bool IsSpace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

} // anonymous namespace

std::string StripFraming(std::string_view line) {
    size_t begin = 0;
    size_t end = line.size();
    while (begin < end && IsSpace(line[begin])) ++begin;
    while (end > begin && IsSpace(line[end - 1])) --end;
    return std::string(line.substr(begin, end - begin));
}

InboundMessage PrepareInbound(std::string_view body) {
    InboundMessage message;
    auto trimmed = StripFraming(body);

    auto json = nlohmann::ordered_json::parse(trimmed, nullptr, /*allow_exceptions=*/false);
    if (json.is_discarded() || !json.is_object()) {
        message.line = std::move(trimmed);
        return message;
    }
    message.is_json = true;

    auto name = json.find("_mcp_name");
    if (name != json.end()) {
        if (name->is_string() && !name->get_ref<const std::string&>().empty()) {
            message.mcp_name = name->get<std::string>();
        }
        json.erase("_mcp_name");
    }

    const bool has_method = json.contains("method");
    const bool has_id = json.contains("id");
    message.is_request = has_method && has_id;
    message.is_notification = has_method && !has_id;

    if (message.is_request && !json.contains("params")) {
        json["params"] = nlohmann::ordered_json::object();
    }

    message.line = json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return message;
}

} // namespace superbox
