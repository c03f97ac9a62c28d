#pragma once

#include "chatgate/core/result.hpp"
#include "chatgate/llm/token_counter.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace chatgate::llm {

// Byte-level BPE encoder over a tiktoken rank file (one "<base64 token> <rank>"
// per line, e.g. cl100k_base.tiktoken). Text is first split into pieces with a
// cl100k-style pre-tokenizer, then each piece is merged pair by pair, lowest
// rank first. Bytes >= 0x80 are treated as letters during the split, which is
// close to the real pattern for Latin scripts and cheaper than full Unicode
// classification.
class BpeEncoder : public Encoder {
public:
    BpeEncoder(std::unordered_map<std::string, int> ranks, std::string name);

    static Result<std::shared_ptr<BpeEncoder>, Error> load(const std::filesystem::path& path);

    std::string name() const override { return name_; }

    int count(std::string_view text) const override;

    // Token ranks for text. Single bytes missing from the vocabulary map to -1.
    std::vector<int> encode(std::string_view text) const;

    size_t vocab_size() const { return ranks_.size(); }

    // Pre-tokenization step, exposed for tests
    static std::vector<std::string_view> split_pieces(std::string_view text);

private:
    std::unordered_map<std::string, int> ranks_;
    std::string name_;

    void encode_piece(std::string_view piece, std::vector<int>& out) const;
    int rank_of(std::string_view bytes) const;
};

}  // namespace chatgate::llm
