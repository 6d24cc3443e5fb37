#include <superbox/transport/http_gateway.hpp>

#include <superbox/core/log.hpp>
#include <superbox/core/version.hpp>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <vector>

namespace superbox {

namespace {

constexpr const char* kJsonType = "application/json";

void SetCorsHeaders(httplib::Response& res) {
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Access-Control-Allow-Methods", "POST, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type");
}

void SetError(httplib::Response& res, const Error& error) {
    res.status = HttpStatusFor(error.kind);
    res.set_content(error.ToEnvelope(), kJsonType);
}

// Collects everything the bridge posts during one HTTP request.
class BufferSink : public IConnectionSink {
public:
    Result<void, Error> Post(std::string_view message) override {
        messages_.emplace_back(message);
        return Result<void, Error>::Ok();
    }

    [[nodiscard]] bool Empty() const noexcept { return messages_.empty(); }

    [[nodiscard]] std::string Body() const {
        std::string body;
        for (const auto& message : messages_) {
            if (!body.empty()) body += "\n";
            body += message;
        }
        return body;
    }

private:
    std::vector<std::string> messages_;
};

} // anonymous namespace

int HttpStatusFor(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidRequest: return 400;
        case ErrorKind::NotFound:       return 404;
        case ErrorKind::Timeout:        return 504;
        default:                        return 500;
    }
}

// ---------------------------------------------------------------------------
// Impl: pimpl body holding the httplib::Server and its routes.
// ---------------------------------------------------------------------------
class HttpGateway::Impl {
public:
    Impl(ProtocolBridge& bridge, HttpGatewayOptions options)
        : bridge(bridge), options(std::move(options)) {
        RegisterRoutes();
    }

    ProtocolBridge& bridge;
    HttpGatewayOptions options;
    httplib::Server server;

private:
    void RegisterRoutes() {
        server.set_logger([](const httplib::Request& req, const httplib::Response& res) {
            LogDebug("http", req.method + " " + req.path + " -> " + std::to_string(res.status));
        });

        server.Options(R"(/mcp/([^/]+))",
                       [](const httplib::Request&, httplib::Response& res) {
            SetCorsHeaders(res);
            res.status = 204;
        });

        server.Post(R"(/mcp/([^/]+))",
                    [this](const httplib::Request& req, httplib::Response& res) {
            SetCorsHeaders(res);
            auto params = ConnectionParams::FromQuery(req.params, options.defaults);
            params.name = req.matches[1].str();
            auto response = bridge.HandleSingleShot(params, req.body);
            if (response.IsErr()) {
                LogError("http", "Single-shot " + params.name + ": " + response.Error().ToString());
                SetError(res, response.Error());
                return;
            }
            res.status = 200;
            res.set_content(response.Value(), kJsonType);
        });

        server.Post(R"(/connections/([^/]+))",
                    [this](const httplib::Request& req, httplib::Response& res) {
            auto params = ConnectionParams::FromQuery(req.params, options.defaults);
            auto connected = bridge.Connect(req.matches[1].str(), params);
            if (connected.IsErr()) {
                SetError(res, connected.Error());
                return;
            }
            res.status = 200;
            res.set_content(R"({"status":"connected"})", kJsonType);
        });

        server.Post(R"(/connections/([^/]+)/messages)",
                    [this](const httplib::Request& req, httplib::Response& res) {
            BufferSink sink;
            auto handled = bridge.HandleMessage(req.matches[1].str(), req.body, sink);
            if (handled.IsErr()) {
                res.status = HttpStatusFor(handled.Error().kind);
            } else {
                res.status = sink.Empty() ? 202 : 200;
            }
            if (!sink.Empty()) {
                res.set_content(sink.Body(), kJsonType);
            }
        });

        server.Delete(R"(/connections/([^/]+))",
                      [this](const httplib::Request& req, httplib::Response& res) {
            bridge.Disconnect(req.matches[1].str());
            res.status = 200;
            res.set_content(R"({"status":"disconnected"})", kJsonType);
        });

        server.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            nlohmann::ordered_json health;
            health["status"] = "ok";
            health["sessions"] = bridge.ActiveSessions();
            health["version"] = kVersion;
            res.set_content(health.dump(), kJsonType);
        });
    }
};

HttpGateway::HttpGateway(ProtocolBridge& bridge, HttpGatewayOptions options)
    : impl_(std::make_unique<Impl>(bridge, std::move(options))) {}

HttpGateway::~HttpGateway() {
    Stop();
}

Result<void, Error> HttpGateway::Listen() {
    const auto& options = impl_->options;
    LogInfo("http", "Listening on " + options.host + ":" + std::to_string(options.port));
    if (!impl_->server.listen(options.host, options.port)) {
        return Result<void, Error>::Err(Error::Make(ErrorKind::ConfigError, "Listen",
            "Cannot listen on " + options.host + ":" + std::to_string(options.port)));
    }
    return Result<void, Error>::Ok();
}

Result<int, Error> HttpGateway::BindToAnyPort() {
    int port = impl_->server.bind_to_any_port(impl_->options.host);
    if (port < 0) {
        return Result<int, Error>::Err(Error::Make(ErrorKind::ConfigError, "Listen",
            "Cannot bind to " + impl_->options.host));
    }
    impl_->options.port = port;
    return Result<int, Error>::Ok(port);
}

Result<void, Error> HttpGateway::ListenAfterBind() {
    LogInfo("http", "Listening on " + impl_->options.host + ":" +
                        std::to_string(impl_->options.port));
    if (!impl_->server.listen_after_bind()) {
        return Result<void, Error>::Err(Error::Make(ErrorKind::Internal, "Listen",
            "Server loop ended with an error"));
    }
    return Result<void, Error>::Ok();
}

void HttpGateway::WaitUntilReady() const {
    impl_->server.wait_until_ready();
}

void HttpGateway::Stop() {
    if (impl_->server.is_running()) {
        impl_->server.stop();
        LogInfo("http", "Stopped");
    }
}

} // namespace superbox
