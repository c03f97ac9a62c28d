#include "chatgate/llm/adapter_resolver.hpp"
#include "chatgate/llm/adapters/openai.hpp"
#include "chatgate/llm/adapters/stub.hpp"
#include "chatgate/llm/bpe_encoder.hpp"
#include "chatgate/net/httplib_transport.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace chatgate::llm {

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}  // namespace

AdapterResolver::AdapterResolver(const GatewayConfig& config,
                                 std::shared_ptr<net::HttpTransport> transport)
    : config_(config)
    , transport_(std::move(transport))
{
    if (!transport_) {
        transport_ = std::make_shared<net::HttplibTransport>();
    }
}

Result<void, Error> AdapterResolver::register_extension(const std::string& name, Factory factory) {
    if (name.empty() || !factory) {
        return Result<void, Error>::err(ErrorCode::InvalidArgument, "Extension needs a name and a factory");
    }
    if (parse_provider_kind(name)) {
        return Result<void, Error>::err(
            ErrorCode::InvalidArgument,
            "Cannot override built-in provider",
            name
        );
    }

    extensions_[to_lower(name)] = std::move(factory);
    return Result<void, Error>::ok();
}

Result<TokenCounter, Error> AdapterResolver::make_token_counter() const {
    const auto& tok = config_.tokenizer;

    if (tok.vocab_path.empty()) {
        return Result<TokenCounter, Error>::ok(TokenCounter(
            std::make_shared<ApproximateEncoder>(), tok.tokens_per_message, tok.priming_tokens));
    }

    return BpeEncoder::load(tok.vocab_path).map([&tok](const std::shared_ptr<BpeEncoder>& encoder) {
        return TokenCounter(encoder, tok.tokens_per_message, tok.priming_tokens);
    });
}

Result<std::unique_ptr<LLMAdapter>, Error> AdapterResolver::resolve() const {
    return resolve(config_.llm.provider);
}

Result<std::unique_ptr<LLMAdapter>, Error> AdapterResolver::resolve(std::string_view selection) const {
    if (auto kind = parse_provider_kind(selection)) {
        auto adapter = resolve_builtin(*kind);
        if (adapter.is_ok()) {
            spdlog::info("Using {} backend", provider_kind_name(*kind));
        }
        return adapter;
    }

    auto it = extensions_.find(to_lower(selection));
    if (it != extensions_.end()) {
        spdlog::info("Using extension backend {}", selection);
        return it->second(config_);
    }

    return Result<std::unique_ptr<LLMAdapter>, Error>::err(
        ErrorCode::LLMProviderUnknown,
        "Unknown LLM provider selection",
        std::string(selection)
    );
}

Result<std::unique_ptr<LLMAdapter>, Error> AdapterResolver::resolve_builtin(ProviderKind kind) const {
    switch (kind) {
        case ProviderKind::Stub:
            return Result<std::unique_ptr<LLMAdapter>, Error>::ok(
                std::make_unique<StubAdapter>(config_.stub));

        case ProviderKind::OpenAI: {
            auto counter = make_token_counter();
            if (counter.is_err()) {
                return Result<std::unique_ptr<LLMAdapter>, Error>::err(std::move(counter).error());
            }
            // The API key is checked when generate() is first called
            return Result<std::unique_ptr<LLMAdapter>, Error>::ok(
                std::make_unique<OpenAIAdapter>(config_.openai, std::move(counter).value(),
                                                transport_, config_.llm.reject_oversized_prompt));
        }
    }

    return Result<std::unique_ptr<LLMAdapter>, Error>::err(ErrorCode::LLMProviderUnknown);
}

}  // namespace chatgate::llm
