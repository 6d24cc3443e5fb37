#pragma once

#include <superbox/registry/i_descriptor_resolver.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace superbox {

struct HttpResolverOptions {
    // Base URL of the object store, optionally with a path prefix
    // ("https://bucket.s3.region.amazonaws.com", "http://minio:9000/bucket").
    std::string endpoint;
    std::chrono::seconds timeout{10};
};

// Virtual-hosted-style S3 endpoint for a bucket.
std::string S3Endpoint(const std::string& bucket, const std::string& region);

// ---------------------------------------------------------------------------
// StoreErrorBody: the <Error><Code/><Message/></Error> document S3-style
// stores return with non-2xx responses.
// ---------------------------------------------------------------------------
struct StoreErrorBody {
    std::string code;
    std::string message;
};

std::optional<StoreErrorBody> ParseStoreErrorXml(std::string_view body);

// ---------------------------------------------------------------------------
// HttpDescriptorResolver: GET <endpoint>/<name>.json over cpp-httplib.
//
// 404 or an XML <Code>NoSuchKey</Code> is NotFound; every other failure is a
// StoreError. Requests are unsigned: the bucket must allow anonymous reads or
// sit behind a proxy that signs for us.
// ---------------------------------------------------------------------------
class HttpDescriptorResolver : public IDescriptorResolver {
public:
    explicit HttpDescriptorResolver(HttpResolverOptions options);

    [[nodiscard]] Result<Descriptor, Error> Resolve(const ServerName& name) override;

private:
    std::string origin_;      // scheme://host[:port]
    std::string base_path_;   // "" or "/prefix"
    std::chrono::seconds timeout_;
};

} // namespace superbox
