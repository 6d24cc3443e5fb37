#include <catch2/catch_test_macros.hpp>

#include <superbox/config/config_loader.hpp>

#include <string>
#include <vector>

using namespace superbox;

// ===========================================================================
// Helper: path to test data files
// ===========================================================================

// Tests run from the build directory; derive the source tree's testdata
// directory from this file's path.
namespace {

std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);           // .../test/config
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));  // .../test
    return test_root + "/testdata/" + filename;
}

Result<AppConfig, Error> ParseCli(std::vector<const char*> args) {
    args.insert(args.begin(), "superbox-bridge");
    return LoadFromCli(static_cast<int>(args.size()), args.data());
}

} // anonymous namespace

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: valid full config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.store.kind == StoreKind::S3);
    CHECK(config.store.bucket == "acme-mcp-registry");
    CHECK(config.store.region == "eu-central-1");
    CHECK_FALSE(config.store.endpoint.has_value());
    CHECK(config.store.timeout_seconds == 5);

    CHECK(config.provision.workspace_root == "/var/tmp/superbox");
    CHECK(config.provision.dependency_dir == "/var/tmp/superbox/pip");
    CHECK(config.provision.branch == "release");
    CHECK(config.provision.archive_base == "https://github.mirror.internal");
    CHECK(config.provision.unzip == "unzip");
    CHECK(config.provision.download_timeout_seconds == 60);
    CHECK(config.provision.install_timeout_seconds == 90);

    CHECK(config.runtime.python == "/usr/bin/python3.11");
    CHECK(config.runtime.timeout_seconds == 45);
    CHECK(config.runtime.protocol_version == "2025-11-25");

    CHECK(config.server.host == "0.0.0.0");
    CHECK(config.server.port == 9090);

    REQUIRE(config.log_file.has_value());
    CHECK(*config.log_file == "/var/log/superbox.log");
    CHECK(config.json_logs);
    CHECK_FALSE(config.verbose);
    REQUIRE(config.config_file.has_value());
    CHECK(*config.config_file == TestDataPath("valid_config.yaml"));
}

TEST_CASE("LoadFromYaml: file store keeps other defaults", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("file_store.yaml"));
    REQUIRE(result.IsOk());
    CHECK(result.Value().store.kind == StoreKind::File);
    CHECK(result.Value().store.directory == "./descriptors");
    CHECK(result.Value().runtime.timeout_seconds == 30);
    CHECK(result.Value().server.port == 8080);
}

TEST_CASE("LoadFromYaml: unknown store kind", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("invalid_store_kind.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::ConfigError);
    CHECK(result.Error().message.find("gcs") != std::string::npos);
}

TEST_CASE("LoadFromYaml: malformed YAML", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("malformed.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::ConfigError);
    CHECK(result.Error().message.find("Failed to parse YAML file") != std::string::npos);
}

TEST_CASE("LoadFromYaml: missing file", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("does_not_exist.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::ConfigError);
}

// ===========================================================================
// LoadFromCli
// ===========================================================================

TEST_CASE("LoadFromCli: defaults", "[config][cli]") {
    auto result = ParseCli({});
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    CHECK(config.store.kind == StoreKind::S3);
    CHECK(config.store.bucket == "superbox-mcp-registry");
    CHECK(config.store.region == "ap-south-1");
    CHECK(config.server.port == 8080);
    CHECK(config.runtime.timeout_seconds == 30);
    CHECK_FALSE(config.target.test_mode);
    CHECK_FALSE(config.config_file.has_value());
}

TEST_CASE("LoadFromCli: all flags", "[config][cli]") {
    auto result = ParseCli({"--config", "bridge.yaml", "--store", "file", "--store-dir", "/srv/d",
                            "--workspace-root", "/ws", "--deps-dir", "/deps",
                            "--python", "python3.12", "--timeout", "12",
                            "--host", "0.0.0.0", "--port", "9000",
                            "--name", "weather", "--test-mode",
                            "--repo-url", "https://github.com/acme/weather",
                            "--entrypoint", "server.py", "--lang", "python",
                            "--body", "{}", "--json-logs", "--log-file", "/tmp/b.log", "-v"});
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    CHECK(*config.config_file == "bridge.yaml");
    CHECK(config.store.kind == StoreKind::File);
    CHECK(config.store.directory == "/srv/d");
    CHECK(config.provision.workspace_root == "/ws");
    CHECK(config.provision.dependency_dir == "/deps");
    CHECK(config.runtime.python == "python3.12");
    CHECK(config.runtime.timeout_seconds == 12);
    CHECK(config.server.host == "0.0.0.0");
    CHECK(config.server.port == 9000);
    CHECK(config.target.name == "weather");
    CHECK(config.target.test_mode);
    CHECK(config.target.repo_url == "https://github.com/acme/weather");
    CHECK(*config.target.entrypoint == "server.py");
    CHECK(*config.target.language == "python");
    CHECK(*config.target.body == "{}");
    CHECK(config.json_logs);
    CHECK(*config.log_file == "/tmp/b.log");
    CHECK(config.verbose);
    CHECK_FALSE(config.quiet);
}

TEST_CASE("LoadFromCli: bad store kind", "[config][cli]") {
    auto result = ParseCli({"--store", "gcs"});
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::ConfigError);
}

TEST_CASE("LoadFromCli: unknown flag", "[config][cli]") {
    auto result = ParseCli({"--nope"});
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::ConfigError);
}

// ===========================================================================
// MergeConfigs
// ===========================================================================

TEST_CASE("MergeConfigs: CLI overrides only what it sets", "[config][merge]") {
    auto yaml = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(yaml.IsOk());
    auto cli = ParseCli({"--port", "7000", "--name", "weather"});
    REQUIRE(cli.IsOk());

    auto merged = MergeConfigs(yaml.Value(), cli.Value());
    CHECK(merged.server.port == 7000);
    CHECK(merged.server.host == "0.0.0.0");
    CHECK(merged.store.bucket == "acme-mcp-registry");
    CHECK(merged.runtime.python == "/usr/bin/python3.11");
    CHECK(merged.runtime.timeout_seconds == 45);
    CHECK(merged.target.name == "weather");
    CHECK(merged.json_logs);
    CHECK(*merged.log_file == "/var/log/superbox.log");
}

TEST_CASE("MergeConfigs: CLI flags switch logging on", "[config][merge]") {
    AppConfig base;
    auto cli = ParseCli({"-q", "--log-file", "/tmp/x.log"});
    REQUIRE(cli.IsOk());
    auto merged = MergeConfigs(base, cli.Value());
    CHECK(merged.quiet);
    CHECK(*merged.log_file == "/tmp/x.log");
}

// ===========================================================================
// ValidateConfig
// ===========================================================================

TEST_CASE("ValidateConfig: defaults are valid for serve and stdio", "[config][validate]") {
    AppConfig config;
    CHECK(ValidateConfig(config, Subcommand::Serve).IsOk());
    CHECK(ValidateConfig(config, Subcommand::Stdio).IsOk());
}

TEST_CASE("ValidateConfig: call needs a target", "[config][validate]") {
    AppConfig config;
    CHECK(ValidateConfig(config, Subcommand::Call).IsErr());

    config.target.name = "weather";
    CHECK(ValidateConfig(config, Subcommand::Call).IsOk());

    AppConfig direct;
    direct.target.test_mode = true;
    CHECK(ValidateConfig(direct, Subcommand::Call).IsErr());
    direct.target.repo_url = "https://github.com/acme/weather";
    CHECK(ValidateConfig(direct, Subcommand::Call).IsOk());
}

TEST_CASE("ValidateConfig: store settings", "[config][validate]") {
    AppConfig file_store;
    file_store.store.kind = StoreKind::File;
    CHECK(ValidateConfig(file_store, Subcommand::Serve).IsErr());
    file_store.store.directory = "/srv/descriptors";
    CHECK(ValidateConfig(file_store, Subcommand::Serve).IsOk());

    AppConfig no_bucket;
    no_bucket.store.bucket.clear();
    CHECK(ValidateConfig(no_bucket, Subcommand::Serve).IsErr());
    no_bucket.store.endpoint = "http://minio:9000/registry";
    CHECK(ValidateConfig(no_bucket, Subcommand::Serve).IsOk());
}

TEST_CASE("ValidateConfig: numeric ranges", "[config][validate]") {
    AppConfig bad_timeout;
    bad_timeout.runtime.timeout_seconds = 0;
    CHECK(ValidateConfig(bad_timeout, Subcommand::Serve).IsErr());

    AppConfig bad_port;
    bad_port.server.port = 70000;
    CHECK(ValidateConfig(bad_port, Subcommand::Serve).IsErr());
    CHECK(ValidateConfig(bad_port, Subcommand::Stdio).IsOk());

    AppConfig no_python;
    no_python.runtime.python.clear();
    auto result = ValidateConfig(no_python, Subcommand::Stdio);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("runtime.python") != std::string::npos);
}

TEST_CASE("LoadFromCli: non-numeric port", "[config][cli]") {
    auto result = ParseCli({"--port", "eighty"});
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::ConfigError);
}
