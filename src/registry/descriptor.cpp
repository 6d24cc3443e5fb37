#include <superbox/registry/descriptor.hpp>

#include <superbox/core/types.hpp>

#include <nlohmann/json.hpp>

#include <initializer_list>

namespace superbox {

namespace {

Error MakeStoreError(std::string_view source, const std::string& message) {
    return Error::Make(ErrorKind::StoreError, "Resolve",
                       message + " in " + std::string(source));
}

// Look up a dotted path ("repository.url") and require a non-empty string.
Result<std::string, Error> RequireString(const nlohmann::json& root,
                                         std::initializer_list<const char*> path,
                                         std::string_view source) {
    std::string dotted;
    const nlohmann::json* node = &root;
    for (const char* key : path) {
        if (!dotted.empty()) dotted += ".";
        dotted += key;
        if (!node->is_object() || !node->contains(key)) {
            return Result<std::string, Error>::Err(
                MakeStoreError(source, "Descriptor is missing '" + dotted + "'"));
        }
        node = &(*node)[key];
    }
    if (!node->is_string() || node->get_ref<const std::string&>().empty()) {
        return Result<std::string, Error>::Err(
            MakeStoreError(source, "Descriptor field '" + dotted + "' must be a non-empty string"));
    }
    return Result<std::string, Error>::Ok(node->get<std::string>());
}

} // anonymous namespace

Result<Descriptor, Error> ParseDescriptor(std::string_view json_text,
                                          std::string_view source) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::exception& e) {
        return Result<Descriptor, Error>::Err(
            MakeStoreError(source, "Malformed descriptor JSON (" + std::string(e.what()) + ")"));
    }
    if (!root.is_object()) {
        return Result<Descriptor, Error>::Err(
            MakeStoreError(source, "Descriptor must be a JSON object"));
    }

    auto url = RequireString(root, {"repository", "url"}, source);
    if (url.IsErr()) return Result<Descriptor, Error>::Err(std::move(url).Error());
    auto entrypoint = RequireString(root, {"entrypoint"}, source);
    if (entrypoint.IsErr()) return Result<Descriptor, Error>::Err(std::move(entrypoint).Error());
    auto lang = RequireString(root, {"lang"}, source);
    if (lang.IsErr()) return Result<Descriptor, Error>::Err(std::move(lang).Error());

    Descriptor descriptor{std::move(url).Value(), std::move(entrypoint).Value(),
                          std::move(lang).Value()};
    auto valid = ValidateDescriptor(descriptor);
    if (valid.IsErr()) {
        return Result<Descriptor, Error>::Err(std::move(valid).Error());
    }
    return Result<Descriptor, Error>::Ok(std::move(descriptor));
}

Result<void, Error> ValidateDescriptor(const Descriptor& descriptor) {
    if (!IsSupportedLanguage(descriptor.language)) {
        return Result<void, Error>::Err(Error::Make(ErrorKind::UnsupportedLanguage, "Resolve",
            "Unsupported language: " + descriptor.language + ". Only python is supported"));
    }
    if (descriptor.repository_url.empty()) {
        return Result<void, Error>::Err(Error::Make(ErrorKind::InvalidRequest, "Resolve",
            "Repository URL must not be empty"));
    }
    if (descriptor.entrypoint.empty()) {
        return Result<void, Error>::Err(Error::Make(ErrorKind::InvalidRequest, "Resolve",
            "Entrypoint must not be empty"));
    }
    return Result<void, Error>::Ok();
}

} // namespace superbox
