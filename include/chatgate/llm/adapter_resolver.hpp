#pragma once

#include "chatgate/core/config.hpp"
#include "chatgate/llm/llm_adapter.hpp"
#include "chatgate/llm/token_counter.hpp"
#include "chatgate/net/http_transport.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace chatgate::llm {

// Turns the configured provider selection into the process's adapter.
//
// Built-in backends come from the closed ProviderKind set. Other names must
// be registered as extensions first; anything unknown is a configuration
// error, never a silent fallback to the stub.
class AdapterResolver {
public:
    using Factory = std::function<Result<std::unique_ptr<LLMAdapter>, Error>(const GatewayConfig&)>;

    // config must outlive the resolver. transport defaults to HttplibTransport.
    explicit AdapterResolver(const GatewayConfig& config,
                             std::shared_ptr<net::HttpTransport> transport = nullptr);

    // Register a backend under a name that is not a built-in kind
    Result<void, Error> register_extension(const std::string& name, Factory factory);

    // Resolve config.llm.provider
    Result<std::unique_ptr<LLMAdapter>, Error> resolve() const;

    Result<std::unique_ptr<LLMAdapter>, Error> resolve(std::string_view selection) const;

    // Counter for the configured cost model (loads the vocabulary if one is set)
    Result<TokenCounter, Error> make_token_counter() const;

private:
    const GatewayConfig& config_;
    std::shared_ptr<net::HttpTransport> transport_;
    std::map<std::string, Factory> extensions_;  // keyed by lower-case name

    Result<std::unique_ptr<LLMAdapter>, Error> resolve_builtin(ProviderKind kind) const;
};

}  // namespace chatgate::llm
