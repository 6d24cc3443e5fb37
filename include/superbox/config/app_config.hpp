#pragma once

#include <optional>
#include <string>

namespace superbox {

enum class Subcommand {
    Serve, // HTTP gateway
    Stdio, // stdin/stdout as one persistent connection
    Call,  // one single-shot request
};

enum class StoreKind {
    S3,   // HTTP object store
    File, // local directory
};

struct StoreConfig {
    StoreKind kind = StoreKind::S3;
    std::string bucket = "superbox-mcp-registry";
    std::string region = "ap-south-1";
    std::optional<std::string> endpoint; // overrides the bucket/region URL
    std::string directory;               // StoreKind::File
    int timeout_seconds = 10;
};

struct ProvisionConfig {
    std::string workspace_root;          // empty: system temp directory
    std::string dependency_dir = "/tmp/pip_modules";
    std::string unzip = "unzip";
    std::string branch = "main";
    std::string archive_base = "https://github.com"; // origin serving branch archives
    int download_timeout_seconds = 120;
    int install_timeout_seconds = 180;
};

struct RuntimeConfig {
    std::string python = "python3";
    std::string protocol_version = "2025-11-25";
    std::string client_name = "superbox";
    std::string default_entrypoint = "main.py";
    std::string default_language = "python";
    int timeout_seconds = 30;            // single-shot wall clock
};

struct ServerConfig {
    std::string host = "127.0.0.1";
    int port = 8080;
};

// Connection parameters given on the command line (stdio and call).
struct TargetConfig {
    std::string name;
    std::string repo_url;
    bool test_mode = false;
    std::optional<std::string> entrypoint;
    std::optional<std::string> language;
    std::optional<std::string> body;     // call: request body, else stdin
};

struct AppConfig {
    StoreConfig store;
    ProvisionConfig provision;
    RuntimeConfig runtime;
    ServerConfig server;
    TargetConfig target;
    std::optional<std::string> config_file;
    std::optional<std::string> log_file;
    bool json_logs = false;
    bool verbose = false;
    bool quiet = false;
};

} // namespace superbox
