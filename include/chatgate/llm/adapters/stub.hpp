#pragma once

#include "chatgate/core/config.hpp"
#include "chatgate/llm/llm_adapter.hpp"

#include <string>
#include <vector>

namespace chatgate::llm {

// Offline backend for development and UI testing. Ignores its input and
// answers "Hello World!" in two fragments, each after an artificial delay.
class StubAdapter : public LLMAdapter {
public:
    StubAdapter() = default;
    explicit StubAdapter(const StubConfig& config);

    std::string name() const override { return "stub"; }
    bool is_available() const override { return true; }

    Result<ChunkStream, Error> generate(const std::string& context,
                                        const std::vector<Message>& history,
                                        const std::string& prompt) const override;

    static const std::vector<std::string>& fragments();

private:
    StubConfig config_;
};

}  // namespace chatgate::llm
