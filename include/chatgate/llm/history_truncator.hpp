#pragma once

#include "chatgate/core/types.hpp"
#include "chatgate/llm/token_counter.hpp"

#include <string>
#include <vector>

namespace chatgate::llm {

using namespace chatgate::core;

// Fits a conversation into a token budget by dropping the oldest turns.
//
// The result is always a contiguous suffix of the given history (possibly
// empty) and the caller's vector is never modified. A request is accepted
// only when its estimated cost is strictly below the budget.
//
// Cost is recomputed from scratch after every drop, so the worst case is
// quadratic in history length.
class HistoryTruncator {
public:
    explicit HistoryTruncator(TokenCounter counter);

    std::vector<Message> truncate(const std::string& context,
                                  const std::vector<Message>& history,
                                  const std::string& prompt,
                                  int budget) const;

    // True when [context, prompt] alone is strictly under the budget
    bool fits(const std::string& context, const std::string& prompt, int budget) const;

    const TokenCounter& counter() const { return counter_; }

private:
    TokenCounter counter_;

    static std::vector<Message> candidate(const std::string& context,
                                          std::vector<Message>::const_iterator first,
                                          std::vector<Message>::const_iterator last,
                                          const std::string& prompt);
};

}  // namespace chatgate::llm
