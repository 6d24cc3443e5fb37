#include <superbox/registry/http_descriptor_resolver.hpp>

#include <superbox/core/log.hpp>
#include <superbox/core/url.hpp>

#include <httplib.h>
#include <tinyxml2.h>

namespace superbox {

namespace {

Error MakeResolveError(ErrorKind kind, const std::string& message) {
    return Error::Make(kind, "Resolve", message);
}

const char* ChildText(const tinyxml2::XMLElement* parent, const char* name) {
    const auto* child = parent->FirstChildElement(name);
    if (child == nullptr || child->GetText() == nullptr) {
        return "";
    }
    return child->GetText();
}

} // anonymous namespace

std::string S3Endpoint(const std::string& bucket, const std::string& region) {
    return "https://" + bucket + ".s3." + region + ".amazonaws.com";
}

std::optional<StoreErrorBody> ParseStoreErrorXml(std::string_view body) {
    if (body.empty()) {
        return std::nullopt;
    }
    tinyxml2::XMLDocument doc;
    if (doc.Parse(body.data(), body.size()) != tinyxml2::XML_SUCCESS) {
        return std::nullopt;
    }
    const auto* root = doc.FirstChildElement("Error");
    if (root == nullptr) {
        return std::nullopt;
    }
    return StoreErrorBody{ChildText(root, "Code"), ChildText(root, "Message")};
}

HttpDescriptorResolver::HttpDescriptorResolver(HttpResolverOptions options)
    : timeout_(options.timeout) {
    auto endpoint = options.endpoint;
    while (!endpoint.empty() && endpoint.back() == '/') {
        endpoint.pop_back();
    }
    auto scheme_end = endpoint.find("://");
    auto path_start = endpoint.find('/', scheme_end == std::string::npos ? 0 : scheme_end + 3);
    if (path_start == std::string::npos) {
        origin_ = endpoint;
    } else {
        origin_ = endpoint.substr(0, path_start);
        base_path_ = endpoint.substr(path_start);
    }
}

Result<Descriptor, Error> HttpDescriptorResolver::Resolve(const ServerName& name) {
    const auto key = name.Value() + ".json";
    const auto path = base_path_ + "/" + UrlEncode(key);
    LogDebug("resolver", "GET " + origin_ + path);

    // One client per lookup: sessions resolve concurrently.
    httplib::Client client(origin_);
    client.set_connection_timeout(timeout_);
    client.set_read_timeout(timeout_);

    auto res = client.Get(path);
    if (!res) {
        return Result<Descriptor, Error>::Err(MakeResolveError(ErrorKind::StoreError,
            "Store request for " + key + " failed: " + httplib::to_string(res.error())));
    }

    if (res->status == 200) {
        return ParseDescriptor(res->body, key);
    }

    auto xml = ParseStoreErrorXml(res->body);
    if (res->status == 404 || (xml.has_value() && xml->code == "NoSuchKey")) {
        return Result<Descriptor, Error>::Err(MakeResolveError(ErrorKind::NotFound,
            "MCP definition not found: " + key));
    }

    std::string message = "Store returned HTTP " + std::to_string(res->status) +
                          " for " + key;
    if (xml.has_value()) {
        message += ": " + xml->code;
        if (!xml->message.empty()) {
            message += " (" + xml->message + ")";
        }
    }
    return Result<Descriptor, Error>::Err(MakeResolveError(ErrorKind::StoreError, message));
}

} // namespace superbox
