#pragma once

#include "chatgate/core/result.hpp"
#include "chatgate/core/types.hpp"
#include "chatgate/llm/chunk_stream.hpp"

#include <string>
#include <vector>

namespace chatgate::llm {

using namespace chatgate::core;

// Base backend interface
class LLMAdapter {
public:
    virtual ~LLMAdapter() = default;

    // Get adapter name
    virtual std::string name() const = 0;

    // Check if the adapter has what it needs to generate (API key set, etc.)
    virtual bool is_available() const = 0;

    // Start generating a reply to prompt. history is read, never modified.
    // Configuration problems are reported here, before any network traffic;
    // transport problems surface from the returned stream.
    virtual Result<ChunkStream, Error> generate(const std::string& context,
                                                const std::vector<Message>& history,
                                                const std::string& prompt) const = 0;
};

}  // namespace chatgate::llm
