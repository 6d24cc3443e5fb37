#include <superbox/bridge/protocol_bridge.hpp>
#include <superbox/config/config_loader.hpp>
#include <superbox/core/log.hpp>
#include <superbox/core/terminal.hpp>
#include <superbox/core/version.hpp>
#include <superbox/provision/github_provisioner.hpp>
#include <superbox/registry/file_descriptor_resolver.hpp>
#include <superbox/registry/http_descriptor_resolver.hpp>
#include <superbox/transport/http_gateway.hpp>
#include <superbox/transport/stdio_gateway.hpp>

#include <csignal>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <pthread.h>
#include <signal.h>
#include <unistd.h>

namespace {

constexpr int kExitSuccess  = 0;
constexpr int kExitUsage    = 2;
constexpr int kExitInternal = 99;

struct SubcommandParse {
    superbox::Subcommand cmd;
    bool found_subcommand;
};

SubcommandParse ParseSubcommand(int argc, const char* const* argv) {
    if (argc < 2) {
        return {superbox::Subcommand::Serve, false};
    }
    std::string_view arg1{argv[1]};
    if (arg1 == "serve") {
        return {superbox::Subcommand::Serve, true};
    }
    if (arg1 == "stdio") {
        return {superbox::Subcommand::Stdio, true};
    }
    if (arg1 == "call") {
        return {superbox::Subcommand::Call, true};
    }
    // Bare flags run the HTTP gateway.
    return {superbox::Subcommand::Serve, false};
}

bool HandleVersionFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::string_view{argv[i]} == "--version") {
            std::cout << "superbox-bridge " << superbox::kVersion << "\n";
            return true;
        }
    }
    return false;
}

// argv without the subcommand token and, for `call`, the server name.
std::vector<const char*> StripPositionals(int argc, const char* const* argv,
                                          const SubcommandParse& parse,
                                          std::optional<std::string>& call_name) {
    std::vector<const char*> stripped;
    stripped.push_back(argv[0]);
    int i = parse.found_subcommand ? 2 : 1;
    if (parse.cmd == superbox::Subcommand::Call && i < argc && argv[i][0] != '-') {
        call_name = argv[i];
        ++i;
    }
    for (; i < argc; ++i) {
        stripped.push_back(argv[i]);
    }
    return stripped;
}

void PrintError(const superbox::Error& error) {
    std::cerr << "Error: " << error.ToString() << "\n";
}

// Keeps the log file open for the life of the process.
std::ofstream& LogFileStream() {
    static std::ofstream stream;
    return stream;
}

bool InitLogging(const superbox::AppConfig& config) {
    using namespace superbox;

    auto level = LogLevel::Info;
    if (config.verbose) level = LogLevel::Debug;
    if (config.quiet) level = LogLevel::Error;

    if (config.log_file.has_value()) {
        auto& file = LogFileStream();
        file.open(*config.log_file, std::ios::app);
        if (!file) {
            std::cerr << "Error: cannot open log file " << *config.log_file << "\n";
            return false;
        }
        if (config.json_logs) {
            InitGlobalLogger(std::make_unique<JsonSink>(file), level);
        } else {
            InitGlobalLogger(std::make_unique<ColorConsoleSink>(false, file), level);
        }
        return true;
    }

    if (config.json_logs) {
        InitGlobalLogger(std::make_unique<JsonSink>(std::cerr), level);
    } else {
        bool use_color = IsStderrTty() && !NoColorEnvSet();
        InitGlobalLogger(std::make_unique<ColorConsoleSink>(use_color), level);
    }
    return true;
}

std::unique_ptr<superbox::IDescriptorResolver> MakeResolver(const superbox::AppConfig& config) {
    using namespace superbox;
    if (config.store.kind == StoreKind::File) {
        LogInfo("resolver", "Descriptors from " + config.store.directory);
        return std::make_unique<FileDescriptorResolver>(config.store.directory);
    }
    HttpResolverOptions options;
    options.endpoint = config.store.endpoint.value_or(
        S3Endpoint(config.store.bucket, config.store.region));
    options.timeout = std::chrono::seconds(config.store.timeout_seconds);
    LogInfo("resolver", "Descriptors from " + options.endpoint);
    return std::make_unique<HttpDescriptorResolver>(std::move(options));
}

superbox::ProvisionOptions MakeProvisionOptions(const superbox::AppConfig& config) {
    superbox::ProvisionOptions options;
    options.workspace_root = config.provision.workspace_root;
    options.dependency_dir = config.provision.dependency_dir;
    options.python_executable = config.runtime.python;
    options.unzip_executable = config.provision.unzip;
    options.branch = config.provision.branch;
    options.archive_base = config.provision.archive_base;
    options.download_timeout = std::chrono::seconds(config.provision.download_timeout_seconds);
    options.install_timeout = std::chrono::seconds(config.provision.install_timeout_seconds);
    return options;
}

superbox::BridgeOptions MakeBridgeOptions(const superbox::AppConfig& config) {
    superbox::BridgeOptions options;
    options.supervisor.python_executable = config.runtime.python;
    options.supervisor.dependency_dir = config.provision.dependency_dir;
    options.supervisor.protocol_version = config.runtime.protocol_version;
    options.supervisor.client_name = config.runtime.client_name;
    options.single_shot_timeout = std::chrono::seconds(config.runtime.timeout_seconds);
    return options;
}

superbox::ConnectionParams MakeTargetParams(const superbox::AppConfig& config) {
    superbox::ConnectionParams params;
    params.name = config.target.name;
    params.test_mode = config.target.test_mode;
    params.repo_url = config.target.repo_url;
    params.entrypoint = config.target.entrypoint.value_or(config.runtime.default_entrypoint);
    params.language = config.target.language.value_or(config.runtime.default_language);
    return params;
}

// ---------------------------------------------------------------------------
// Subcommands
// ---------------------------------------------------------------------------

int RunServe(superbox::ProtocolBridge& bridge, const superbox::AppConfig& config) {
    using namespace superbox;

    // Worker threads inherit the mask; only the waiter below sees the signals.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    HttpGatewayOptions options{config.server.host, config.server.port};
    options.defaults.entrypoint = config.runtime.default_entrypoint;
    options.defaults.language = config.runtime.default_language;
    HttpGateway gateway(bridge, std::move(options));

    std::thread waiter([&gateway, &bridge, &signals]() {
        int received = 0;
        sigwait(&signals, &received);
        LogInfo("main", "Signal " + std::to_string(received) + ", shutting down");
        gateway.Stop();
        // Releases workers blocked on a child so the listener can return.
        bridge.Shutdown();
    });

    auto served = gateway.Listen();
    if (served.IsErr()) {
        PrintError(served.Error());
        ::kill(::getpid(), SIGTERM); // release the waiter
    }
    waiter.join();
    bridge.Shutdown();
    return served.IsErr() ? served.Error().ExitCode() : kExitSuccess;
}

int RunStdio(superbox::ProtocolBridge& bridge, const superbox::AppConfig& config) {
    superbox::StdioGateway gateway(bridge, MakeTargetParams(config));
    gateway.Run();
    return kExitSuccess;
}

int RunCall(superbox::ProtocolBridge& bridge, const superbox::AppConfig& config) {
    std::string body;
    if (config.target.body.has_value()) {
        body = *config.target.body;
    } else if (superbox::IsStdinTty()) {
        std::cerr << "Error: no request body; pass --body or pipe one on stdin\n";
        return kExitUsage;
    } else {
        body.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }

    auto response = bridge.HandleSingleShot(MakeTargetParams(config), body);
    if (response.IsErr()) {
        superbox::LogError("main", response.Error().ToString());
        std::cout << response.Error().ToEnvelope() << "\n";
        return response.Error().ExitCode();
    }
    std::cout << response.Value();
    if (response.Value().empty() || response.Value().back() != '\n') {
        std::cout << "\n";
    }
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace superbox;

    if (HandleVersionFlag(argc, argv)) {
        return kExitSuccess;
    }

    std::signal(SIGPIPE, SIG_IGN);

    auto parse = ParseSubcommand(argc, argv);
    std::optional<std::string> call_name;
    auto stripped = StripPositionals(argc, argv, parse, call_name);

    // Parse CLI args (handles --help internally via argparse).
    auto cli_result = LoadFromCli(static_cast<int>(stripped.size()), stripped.data());
    if (cli_result.IsErr()) {
        PrintError(cli_result.Error());
        return kExitUsage;
    }
    auto cli_config = std::move(cli_result).Value();
    if (call_name.has_value()) {
        cli_config.target.name = *call_name;
    }

    AppConfig config;
    if (cli_config.config_file.has_value()) {
        auto yaml_result = LoadFromYaml(*cli_config.config_file);
        if (yaml_result.IsErr()) {
            PrintError(yaml_result.Error());
            return yaml_result.Error().ExitCode();
        }
        config = MergeConfigs(std::move(yaml_result).Value(), cli_config);
    } else {
        config = std::move(cli_config);
    }

    auto valid = ValidateConfig(config, parse.cmd);
    if (valid.IsErr()) {
        PrintError(valid.Error());
        return valid.Error().ExitCode();
    }

    if (!InitLogging(config)) {
        return kExitUsage;
    }
    LogDebug("main", std::string("superbox-bridge ") + kVersion);

    auto resolver = MakeResolver(config);
    GithubProvisioner provisioner(MakeProvisionOptions(config));
    ProtocolBridge bridge(*resolver, provisioner, MakeBridgeOptions(config));

    switch (parse.cmd) {
        case Subcommand::Serve: return RunServe(bridge, config);
        case Subcommand::Stdio: return RunStdio(bridge, config);
        case Subcommand::Call:  return RunCall(bridge, config);
    }
    return kExitInternal;
}
