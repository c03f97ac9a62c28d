#include <catch2/catch_test_macros.hpp>
#include "chatgate/core/config.hpp"

#include <cstdlib>
#include <fstream>

using namespace chatgate::core;

namespace {

// Temporary YAML file removed at scope exit
struct TempConfig {
    fs::path path;

    explicit TempConfig(const std::string& yaml) {
        path = fs::temp_directory_path() / ("chatgate_test_" + std::to_string(std::rand()) + ".yaml");
        std::ofstream(path) << yaml;
    }

    ~TempConfig() {
        std::error_code ec;
        fs::remove(path, ec);
    }
};

// Unset OPENAI_API_KEY for the duration of a test
struct ClearApiKeyEnv {
    std::optional<std::string> saved;

    ClearApiKeyEnv() {
        if (const char* key = std::getenv("OPENAI_API_KEY")) saved = key;
        unsetenv("OPENAI_API_KEY");
    }

    ~ClearApiKeyEnv() {
        if (saved) setenv("OPENAI_API_KEY", saved->c_str(), 1);
    }
};

}  // namespace

TEST_CASE("Default config values", "[config]") {
    GatewayConfig config;

    REQUIRE(config.llm.provider == "Stub");
    REQUIRE_FALSE(config.llm.reject_oversized_prompt);
    REQUIRE(config.openai.model == "gpt-4.1-mini");
    REQUIRE(config.openai.max_tokens == 8000);
    REQUIRE(config.openai.timeout_seconds == 240);
    REQUIRE(config.tokenizer.tokens_per_message == 3);
    REQUIRE(config.tokenizer.priming_tokens == 3);
    REQUIRE(config.stub.first_delay == Duration{1000});
    REQUIRE(config.stub.second_delay == Duration{2000});
}

TEST_CASE("Provider kinds parse case-insensitively", "[config]") {
    REQUIRE(parse_provider_kind("Stub") == ProviderKind::Stub);
    REQUIRE(parse_provider_kind("stub") == ProviderKind::Stub);
    REQUIRE(parse_provider_kind("OpenAI") == ProviderKind::OpenAI);
    REQUIRE(parse_provider_kind("OPENAI") == ProviderKind::OpenAI);
    REQUIRE_FALSE(parse_provider_kind("claude").has_value());
    REQUIRE_FALSE(parse_provider_kind("").has_value());
    REQUIRE(provider_kind_name(ProviderKind::OpenAI) == "OpenAI");
}

TEST_CASE("Default config validates", "[config]") {
    GatewayConfig config;
    REQUIRE(config.validate().is_ok());
}

TEST_CASE("OpenAI provider without key fails validation", "[config]") {
    GatewayConfig config;
    config.llm.provider = "OpenAI";

    auto result = config.validate();
    REQUIRE(result.is_err());
    REQUIRE(result.error().code == ErrorCode::LLMApiKeyMissing);

    config.openai.api_key = "sk-test";
    REQUIRE(config.validate().is_ok());
}

TEST_CASE("Non-positive limits fail validation", "[config]") {
    GatewayConfig config;

    config.openai.max_tokens = 0;
    REQUIRE(config.validate().error().code == ErrorCode::ConfigValidationFailed);

    config.openai.max_tokens = 8000;
    config.openai.timeout_seconds = -1;
    REQUIRE(config.validate().error().code == ErrorCode::ConfigValidationFailed);

    config.openai.timeout_seconds = 240;
    config.tokenizer.priming_tokens = -3;
    REQUIRE(config.validate().error().code == ErrorCode::ConfigValidationFailed);
}

TEST_CASE("Empty provider fails validation", "[config]") {
    GatewayConfig config;
    config.llm.provider = "";
    REQUIRE(config.validate().error().code == ErrorCode::ConfigKeyMissing);
}

TEST_CASE("Load missing file", "[config]") {
    auto result = GatewayConfig::load("/nonexistent/chatgate/config.yaml");

    REQUIRE(result.is_err());
    REQUIRE(result.error().code == ErrorCode::ConfigNotFound);
}

TEST_CASE("Load YAML config", "[config]") {
    ClearApiKeyEnv env;
    TempConfig file(R"(
llm:
  provider: OpenAI
  reject_oversized_prompt: true
openai:
  api_key: sk-from-file
  model: gpt-4o-mini
  max_tokens: 4096
  timeout_seconds: 60
stub:
  first_delay_ms: 5
  second_delay_ms: 10
tokenizer:
  tokens_per_message: 4
observability:
  log_level: debug
)");

    auto result = GatewayConfig::load(file.path);
    REQUIRE(result.is_ok());

    const auto& config = result.value();
    REQUIRE(config.llm.provider == "OpenAI");
    REQUIRE(config.llm.reject_oversized_prompt);
    REQUIRE(config.openai.api_key == "sk-from-file");
    REQUIRE(config.openai.model == "gpt-4o-mini");
    REQUIRE(config.openai.max_tokens == 4096);
    REQUIRE(config.openai.timeout_seconds == 60);
    REQUIRE(config.openai.base_url == "https://api.openai.com");
    REQUIRE(config.stub.first_delay == Duration{5});
    REQUIRE(config.stub.second_delay == Duration{10});
    REQUIRE(config.tokenizer.tokens_per_message == 4);
    REQUIRE(config.tokenizer.priming_tokens == 3);
    REQUIRE(config.observability.log_level == "debug");
}

TEST_CASE("Environment key overrides file", "[config]") {
    ClearApiKeyEnv env;
    setenv("OPENAI_API_KEY", "sk-from-env", 1);
    TempConfig file("llm:\n  provider: OpenAI\nopenai:\n  api_key: sk-from-file\n");

    auto result = GatewayConfig::load(file.path);
    REQUIRE(result.is_ok());
    REQUIRE(result.value().openai.api_key == "sk-from-env");
}

TEST_CASE("Key expanded from environment variable reference", "[config]") {
    ClearApiKeyEnv env;
    setenv("CHATGATE_TEST_KEY", "sk-expanded", 1);
    TempConfig file("llm:\n  provider: OpenAI\nopenai:\n  api_key: ${CHATGATE_TEST_KEY}\n");

    auto result = GatewayConfig::load(file.path);
    REQUIRE(result.is_ok());
    REQUIRE(result.value().openai.api_key == "sk-expanded");
    unsetenv("CHATGATE_TEST_KEY");
}

TEST_CASE("Loaded OpenAI config without key is rejected", "[config]") {
    ClearApiKeyEnv env;
    TempConfig file("llm:\n  provider: OpenAI\n");

    auto result = GatewayConfig::load(file.path);
    REQUIRE(result.is_err());
    REQUIRE(result.error().code == ErrorCode::LLMApiKeyMissing);
}

TEST_CASE("Malformed YAML reports parse failure", "[config]") {
    TempConfig file("llm: [unterminated\n");

    auto result = GatewayConfig::load(file.path);
    REQUIRE(result.is_err());
    REQUIRE(result.error().code == ErrorCode::ConfigParseFailed);
}

TEST_CASE("Literal dollar signs in a key are kept", "[config]") {
    ClearApiKeyEnv env;
    setenv("cd", "expanded", 1);
    TempConfig file("llm:\n  provider: OpenAI\nopenai:\n  api_key: sk-ab$cd\n");

    auto result = GatewayConfig::load(file.path);
    REQUIRE(result.is_ok());
    REQUIRE(result.value().openai.api_key == "sk-ab$cd");
    unsetenv("cd");
}

TEST_CASE("Env references resolve only as the whole value", "[config]") {
    setenv("CHATGATE_TEST_KEY", "sk-expanded", 1);

    REQUIRE(resolve_env_reference("${CHATGATE_TEST_KEY}") == "sk-expanded");
    REQUIRE(resolve_env_reference("$CHATGATE_TEST_KEY") == "sk-expanded");
    REQUIRE(resolve_env_reference("pre-$CHATGATE_TEST_KEY") == "pre-$CHATGATE_TEST_KEY");
    REQUIRE(resolve_env_reference("${CHATGATE_TEST_KEY}x") == "${CHATGATE_TEST_KEY}x");
    REQUIRE(resolve_env_reference("$") == "$");
    unsetenv("CHATGATE_TEST_KEY");
}

TEST_CASE("load_or_default uses defaults when the file is missing", "[config]") {
    ClearApiKeyEnv env;
    auto result = GatewayConfig::load_or_default("/nonexistent/chatgate/config.yaml");

    REQUIRE(result.is_ok());
    REQUIRE(result.value().llm.provider == "Stub");
    REQUIRE(result.value().openai.api_key.empty());
}

TEST_CASE("load_or_default reports an invalid file", "[config]") {
    ClearApiKeyEnv env;
    TempConfig file("llm:\n  provider: OpenAI\n");

    auto result = GatewayConfig::load_or_default(file.path);
    REQUIRE(result.is_err());
    REQUIRE(result.error().code == ErrorCode::LLMApiKeyMissing);
}

TEST_CASE("load_or_default reports a malformed file", "[config]") {
    TempConfig file("llm: [unterminated\n");

    auto result = GatewayConfig::load_or_default(file.path);
    REQUIRE(result.is_err());
    REQUIRE(result.error().code == ErrorCode::ConfigParseFailed);
}

TEST_CASE("Default path lives under the home directory", "[config]") {
    const char* home = std::getenv("HOME");
    auto path = GatewayConfig::default_path();

    REQUIRE(path.filename() == "config.yaml");
    REQUIRE(path.parent_path().filename() == ".chatgate");
    if (home) {
        REQUIRE(path.string().rfind(home, 0) == 0);
    }
}
