#include <catch2/catch_test_macros.hpp>

#include <superbox/registry/descriptor.hpp>

#include <string>

using namespace superbox;

TEST_CASE("ParseDescriptor: stored form", "[registry][descriptor]") {
    auto parsed = ParseDescriptor(
        R"({"repository":{"url":"https://github.com/acme/weather"},"entrypoint":"server.py","lang":"python"})",
        "weather.json");
    REQUIRE(parsed.IsOk());
    CHECK(parsed.Value().repository_url == "https://github.com/acme/weather");
    CHECK(parsed.Value().entrypoint == "server.py");
    CHECK(parsed.Value().language == "python");
}

TEST_CASE("ParseDescriptor: extra fields are ignored", "[registry][descriptor]") {
    auto parsed = ParseDescriptor(
        R"({"name":"weather","repository":{"url":"https://github.com/a/b","type":"git"},"entrypoint":"main.py","lang":"Python","description":"x"})",
        "weather.json");
    REQUIRE(parsed.IsOk());
    CHECK(parsed.Value().language == "Python");
}

TEST_CASE("ParseDescriptor: missing fields name the field", "[registry][descriptor]") {
    auto no_repo = ParseDescriptor(R"({"entrypoint":"main.py","lang":"python"})", "a.json");
    REQUIRE(no_repo.IsErr());
    CHECK(no_repo.Error().kind == ErrorKind::StoreError);
    CHECK(no_repo.Error().message.find("repository.url") != std::string::npos);
    CHECK(no_repo.Error().message.find("a.json") != std::string::npos);

    auto no_entry = ParseDescriptor(
        R"({"repository":{"url":"https://github.com/a/b"},"lang":"python"})", "a.json");
    REQUIRE(no_entry.IsErr());
    CHECK(no_entry.Error().message.find("entrypoint") != std::string::npos);

    auto bad_type = ParseDescriptor(
        R"({"repository":{"url":42},"entrypoint":"main.py","lang":"python"})", "a.json");
    REQUIRE(bad_type.IsErr());
    CHECK(bad_type.Error().kind == ErrorKind::StoreError);
}

TEST_CASE("ParseDescriptor: malformed JSON is a store error", "[registry][descriptor]") {
    auto parsed = ParseDescriptor("{not json", "broken.json");
    REQUIRE(parsed.IsErr());
    CHECK(parsed.Error().kind == ErrorKind::StoreError);

    auto array = ParseDescriptor("[1,2]", "array.json");
    REQUIRE(array.IsErr());
    CHECK(array.Error().kind == ErrorKind::StoreError);
}

TEST_CASE("ParseDescriptor: other languages are rejected", "[registry][descriptor]") {
    auto parsed = ParseDescriptor(
        R"({"repository":{"url":"https://github.com/a/b"},"entrypoint":"index.js","lang":"node"})",
        "node.json");
    REQUIRE(parsed.IsErr());
    CHECK(parsed.Error().kind == ErrorKind::UnsupportedLanguage);
    CHECK(parsed.Error().message.find("node") != std::string::npos);
}

TEST_CASE("ValidateDescriptor: direct descriptors", "[registry][descriptor]") {
    CHECK(ValidateDescriptor({"https://github.com/a/b", "main.py", "python"}).IsOk());
    CHECK(ValidateDescriptor({"", "main.py", "python"}).Error().kind ==
          ErrorKind::InvalidRequest);
    CHECK(ValidateDescriptor({"https://github.com/a/b", "", "python"}).Error().kind ==
          ErrorKind::InvalidRequest);
    CHECK(ValidateDescriptor({"https://github.com/a/b", "main.rb", "ruby"}).Error().kind ==
          ErrorKind::UnsupportedLanguage);
}
