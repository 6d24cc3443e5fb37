#pragma once

#include <superbox/bridge/protocol_bridge.hpp>
#include <superbox/core/result.hpp>

#include <memory>
#include <string>

namespace superbox {

struct HttpGatewayOptions {
    std::string host = "127.0.0.1";
    int port = 8080;
    ConnectionParams defaults; // entrypoint/lang when a query omits them
};

// 400 InvalidRequest, 404 NotFound, 504 Timeout, 500 for everything else.
int HttpStatusFor(ErrorKind kind);

// ---------------------------------------------------------------------------
// HttpGateway: cpp-httplib server in front of a ProtocolBridge.
//
//   POST    /mcp/<name>                 single-shot call
//   OPTIONS /mcp/<name>                 CORS preflight
//   POST    /connections/<id>           connect
//   POST    /connections/<id>/messages  relay one message
//   DELETE  /connections/<id>           disconnect
//   GET     /health
//
// Requests run on httplib's worker pool; the bridge serializes per id.
// ---------------------------------------------------------------------------
class HttpGateway {
public:
    HttpGateway(ProtocolBridge& bridge, HttpGatewayOptions options);
    ~HttpGateway();

    HttpGateway(const HttpGateway&) = delete;
    HttpGateway& operator=(const HttpGateway&) = delete;

    // Bind and serve until Stop(). Error if the address cannot be bound.
    [[nodiscard]] Result<void, Error> Listen();

    // Bind to an ephemeral port on `host`; serve with ListenAfterBind().
    [[nodiscard]] Result<int, Error> BindToAnyPort();
    [[nodiscard]] Result<void, Error> ListenAfterBind();

    // Wait until the server loop accepts connections.
    void WaitUntilReady() const;

    void Stop();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace superbox
