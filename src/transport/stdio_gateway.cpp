#include <superbox/transport/stdio_gateway.hpp>

#include <superbox/core/log.hpp>

namespace superbox {

namespace {

class StreamSink : public IConnectionSink {
public:
    explicit StreamSink(std::ostream& out) : out_(out) {}

    Result<void, Error> Post(std::string_view message) override {
        out_ << message << "\n";
        out_.flush();
        if (!out_) {
            return Result<void, Error>::Err(Error::Make(
                ErrorKind::BrokenPipe, "Post", "stdout is closed"));
        }
        return Result<void, Error>::Ok();
    }

    [[nodiscard]] bool Good() const { return static_cast<bool>(out_); }

private:
    std::ostream& out_;
};

} // anonymous namespace

StdioGateway::StdioGateway(ProtocolBridge& bridge, ConnectionParams params,
                           std::istream& in, std::ostream& out)
    : bridge_(bridge), params_(std::move(params)), in_(in), out_(out) {}

void StdioGateway::Run() {
    // Without a name, every message must carry _mcp_name.
    auto connected = bridge_.Connect(kConnectionId, params_);
    if (connected.IsErr()) {
        LogInfo("stdio", "No server named up front; expecting _mcp_name in messages");
    }

    StreamSink sink(out_);
    std::string line;
    while (std::getline(in_, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) continue;

        auto handled = bridge_.HandleMessage(kConnectionId, line, sink);
        if (handled.IsErr()) {
            LogDebug("stdio", "Message failed: " + handled.Error().ToString());
        }
        if (!sink.Good()) {
            LogWarn("stdio", "stdout closed, stopping");
            break;
        }
    }

    bridge_.Disconnect(kConnectionId);
    LogInfo("stdio", "Input closed");
}

} // namespace superbox
