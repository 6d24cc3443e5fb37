#include <superbox/config/config_loader.hpp>

#include <superbox/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <stdexcept>

namespace superbox {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error::Make(ErrorKind::ConfigError, "ConfigLoader", message);
}

Result<StoreKind, Error> ParseStoreKind(const std::string& value) {
    if (value == "s3") {
        return Result<StoreKind, Error>::Ok(StoreKind::S3);
    }
    if (value == "file") {
        return Result<StoreKind, Error>::Ok(StoreKind::File);
    }
    return Result<StoreKind, Error>::Err(
        MakeConfigError("Unknown store kind '" + value + "' (expected s3 or file)"));
}

template <typename T>
void ReadIfPresent(const YAML::Node& node, const char* key, T& target) {
    if (node[key]) {
        target = node[key].as<T>();
    }
}

template <typename T>
void ReadIfPresent(const YAML::Node& node, const char* key, std::optional<T>& target) {
    if (node[key]) {
        target = node[key].as<T>();
    }
}

// Take `cli` when it differs from the default.
template <typename T>
void Override(T& merged, const T& cli, const T& fallback) {
    if (!(cli == fallback)) {
        merged = cli;
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    AppConfig config;
    config.config_file = std::string(file_path);

    try {
        auto root = YAML::LoadFile(std::string(file_path));

        // -- Store --
        if (const auto store = root["store"]) {
            if (store["kind"]) {
                auto kind = ParseStoreKind(store["kind"].as<std::string>());
                if (kind.IsErr()) {
                    return Result<AppConfig, Error>::Err(std::move(kind).Error());
                }
                config.store.kind = kind.Value();
            }
            ReadIfPresent(store, "bucket", config.store.bucket);
            ReadIfPresent(store, "region", config.store.region);
            ReadIfPresent(store, "endpoint", config.store.endpoint);
            ReadIfPresent(store, "directory", config.store.directory);
            ReadIfPresent(store, "timeout", config.store.timeout_seconds);
        }

        // -- Provision --
        if (const auto provision = root["provision"]) {
            ReadIfPresent(provision, "workspace_root", config.provision.workspace_root);
            ReadIfPresent(provision, "dependency_dir", config.provision.dependency_dir);
            ReadIfPresent(provision, "unzip", config.provision.unzip);
            ReadIfPresent(provision, "branch", config.provision.branch);
            ReadIfPresent(provision, "archive_base", config.provision.archive_base);
            ReadIfPresent(provision, "download_timeout", config.provision.download_timeout_seconds);
            ReadIfPresent(provision, "install_timeout", config.provision.install_timeout_seconds);
        }

        // -- Runtime --
        if (const auto runtime = root["runtime"]) {
            ReadIfPresent(runtime, "python", config.runtime.python);
            ReadIfPresent(runtime, "protocol_version", config.runtime.protocol_version);
            ReadIfPresent(runtime, "client_name", config.runtime.client_name);
            ReadIfPresent(runtime, "default_entrypoint", config.runtime.default_entrypoint);
            ReadIfPresent(runtime, "default_language", config.runtime.default_language);
            ReadIfPresent(runtime, "timeout", config.runtime.timeout_seconds);
        }

        // -- Server --
        if (const auto server = root["server"]) {
            ReadIfPresent(server, "host", config.server.host);
            ReadIfPresent(server, "port", config.server.port);
        }

        // -- Options --
        ReadIfPresent(root, "log_file", config.log_file);
        ReadIfPresent(root, "json_logs", config.json_logs);
        ReadIfPresent(root, "verbose", config.verbose);
        ReadIfPresent(root, "quiet", config.quiet);
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("superbox-bridge", kVersion);

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");

    // Descriptor store
    program.add_argument("--store")
        .help("Descriptor store: s3 or file");
    program.add_argument("--bucket")
        .help("Object store bucket");
    program.add_argument("--region")
        .help("Object store region");
    program.add_argument("--store-endpoint")
        .help("Object store base URL (overrides bucket/region)");
    program.add_argument("--store-dir")
        .help("Descriptor directory for --store file");

    // Provisioning and runtime
    program.add_argument("--workspace-root")
        .help("Parent directory for session workspaces");
    program.add_argument("--deps-dir")
        .help("Shared pip --target directory");
    program.add_argument("--python")
        .help("Python interpreter");
    program.add_argument("--timeout")
        .help("Single-shot timeout in seconds")
        .scan<'i', int>();

    // HTTP gateway
    program.add_argument("--host")
        .help("Listen address");
    program.add_argument("--port")
        .help("Listen port")
        .scan<'i', int>();

    // Target server (stdio, call)
    program.add_argument("--name")
        .help("MCP server name");
    program.add_argument("--repo-url")
        .help("Repository URL (test mode)");
    program.add_argument("--test-mode")
        .help("Run --repo-url directly, without a stored descriptor")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--entrypoint")
        .help("Entrypoint inside the repository (test mode)");
    program.add_argument("--lang")
        .help("Server language (test mode)");
    program.add_argument("--body")
        .help("Request body for call (default: stdin)");

    // Options
    program.add_argument("--json-logs")
        .help("Log as JSON lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Log file path");
    program.add_argument("-v", "--verbose")
        .help("Verbose output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-q", "--quiet")
        .help("Quiet output")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::runtime_error& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    } catch (const std::invalid_argument& e) {
        // Non-numeric --port / --timeout.
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;

    if (auto val = program.present("--config")) {
        config.config_file = *val;
    }

    // Store
    if (auto val = program.present("--store")) {
        auto kind = ParseStoreKind(*val);
        if (kind.IsErr()) {
            return Result<AppConfig, Error>::Err(std::move(kind).Error());
        }
        config.store.kind = kind.Value();
    }
    if (auto val = program.present("--bucket")) {
        config.store.bucket = *val;
    }
    if (auto val = program.present("--region")) {
        config.store.region = *val;
    }
    if (auto val = program.present("--store-endpoint")) {
        config.store.endpoint = *val;
    }
    if (auto val = program.present("--store-dir")) {
        config.store.directory = *val;
    }

    // Provisioning and runtime
    if (auto val = program.present("--workspace-root")) {
        config.provision.workspace_root = *val;
    }
    if (auto val = program.present("--deps-dir")) {
        config.provision.dependency_dir = *val;
    }
    if (auto val = program.present("--python")) {
        config.runtime.python = *val;
    }
    if (auto val = program.present<int>("--timeout")) {
        config.runtime.timeout_seconds = *val;
    }

    // Server
    if (auto val = program.present("--host")) {
        config.server.host = *val;
    }
    if (auto val = program.present<int>("--port")) {
        config.server.port = *val;
    }

    // Target
    if (auto val = program.present("--name")) {
        config.target.name = *val;
    }
    if (auto val = program.present("--repo-url")) {
        config.target.repo_url = *val;
    }
    config.target.test_mode = program.get<bool>("--test-mode");
    if (auto val = program.present("--entrypoint")) {
        config.target.entrypoint = *val;
    }
    if (auto val = program.present("--lang")) {
        config.target.language = *val;
    }
    if (auto val = program.present("--body")) {
        config.target.body = *val;
    }

    // Options
    config.json_logs = program.get<bool>("--json-logs");
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    config.verbose = program.get<bool>("--verbose");
    config.quiet = program.get<bool>("--quiet");

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    const AppConfig defaults;
    AppConfig merged = yaml_base;

    Override(merged.store.kind, cli_overrides.store.kind, defaults.store.kind);
    Override(merged.store.bucket, cli_overrides.store.bucket, defaults.store.bucket);
    Override(merged.store.region, cli_overrides.store.region, defaults.store.region);
    Override(merged.store.endpoint, cli_overrides.store.endpoint, defaults.store.endpoint);
    Override(merged.store.directory, cli_overrides.store.directory, defaults.store.directory);

    Override(merged.provision.workspace_root, cli_overrides.provision.workspace_root,
             defaults.provision.workspace_root);
    Override(merged.provision.dependency_dir, cli_overrides.provision.dependency_dir,
             defaults.provision.dependency_dir);

    Override(merged.runtime.python, cli_overrides.runtime.python, defaults.runtime.python);
    Override(merged.runtime.timeout_seconds, cli_overrides.runtime.timeout_seconds,
             defaults.runtime.timeout_seconds);

    Override(merged.server.host, cli_overrides.server.host, defaults.server.host);
    Override(merged.server.port, cli_overrides.server.port, defaults.server.port);

    // The target only ever comes from the command line.
    merged.target = cli_overrides.target;

    if (cli_overrides.log_file.has_value()) {
        merged.log_file = cli_overrides.log_file;
    }
    if (cli_overrides.config_file.has_value()) {
        merged.config_file = cli_overrides.config_file;
    }
    if (cli_overrides.json_logs) {
        merged.json_logs = true;
    }
    if (cli_overrides.verbose) {
        merged.verbose = true;
    }
    if (cli_overrides.quiet) {
        merged.quiet = true;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config, Subcommand command) {
    if (config.store.kind == StoreKind::File && config.store.directory.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("Missing required field: store.directory for file store"));
    }
    if (config.store.kind == StoreKind::S3 && !config.store.endpoint.has_value() &&
        (config.store.bucket.empty() || config.store.region.empty())) {
        return Result<void, Error>::Err(
            MakeConfigError("Missing required field: store.bucket and store.region"));
    }
    if (config.store.timeout_seconds <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Store timeout must be positive, got " +
                            std::to_string(config.store.timeout_seconds)));
    }
    if (config.runtime.timeout_seconds <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Timeout must be positive, got " +
                            std::to_string(config.runtime.timeout_seconds)));
    }
    if (config.provision.download_timeout_seconds <= 0 ||
        config.provision.install_timeout_seconds <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Provision timeouts must be positive"));
    }
    if (config.runtime.python.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required field: runtime.python"));
    }
    if (command == Subcommand::Serve &&
        (config.server.port <= 0 || config.server.port > 65535)) {
        return Result<void, Error>::Err(
            MakeConfigError("Invalid port: " + std::to_string(config.server.port)));
    }
    if (config.target.test_mode && config.target.repo_url.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("--test-mode requires --repo-url"));
    }
    if (command == Subcommand::Call && config.target.name.empty() &&
        !config.target.test_mode) {
        return Result<void, Error>::Err(
            MakeConfigError("call requires a server name (or --test-mode --repo-url)"));
    }
    return Result<void, Error>::Ok();
}

} // namespace superbox
