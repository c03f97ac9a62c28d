#include "chatgate/llm/bpe_encoder.hpp"

#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <climits>
#include <fstream>
#include <optional>
#include <sstream>

namespace chatgate::llm {

namespace {

bool is_letter(unsigned char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c >= 0x80;
}

bool is_digit(unsigned char c) {
    return c >= '0' && c <= '9';
}

bool is_newline(unsigned char c) {
    return c == '\n' || c == '\r';
}

bool is_space(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool is_other(unsigned char c) {
    return !is_space(c) && !is_letter(c) && !is_digit(c);
}

char lower(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

// Length of a contraction suffix ('s 'd 'm 't 'll 've 're) at pos, or 0
size_t contraction_at(std::string_view text, size_t pos) {
    if (text[pos] != '\'' || pos + 1 >= text.size()) return 0;

    if (pos + 2 < text.size()) {
        char a = lower(text[pos + 1]);
        char b = lower(text[pos + 2]);
        if ((a == 'l' && b == 'l') || (a == 'v' && b == 'e') || (a == 'r' && b == 'e')) {
            return 3;
        }
    }

    char a = lower(text[pos + 1]);
    if (a == 's' || a == 'd' || a == 'm' || a == 't') {
        return 2;
    }
    return 0;
}

std::optional<std::string> decode_base64(const std::string& encoded) {
    if (encoded.empty() || encoded.size() % 4 != 0) {
        return std::nullopt;
    }

    std::vector<unsigned char> in(encoded.begin(), encoded.end());
    std::vector<unsigned char> out(encoded.size() / 4 * 3);
    int len = EVP_DecodeBlock(out.data(), in.data(), static_cast<int>(in.size()));
    if (len < 0) {
        return std::nullopt;
    }

    // EVP_DecodeBlock counts padding as zero bytes
    size_t padding = 0;
    if (encoded[encoded.size() - 1] == '=') padding++;
    if (encoded[encoded.size() - 2] == '=') padding++;
    return std::string(out.begin(), out.begin() + (len - static_cast<int>(padding)));
}

}  // namespace

BpeEncoder::BpeEncoder(std::unordered_map<std::string, int> ranks, std::string name)
    : ranks_(std::move(ranks))
    , name_(std::move(name))
{
}

Result<std::shared_ptr<BpeEncoder>, Error> BpeEncoder::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Result<std::shared_ptr<BpeEncoder>, Error>::err(
            ErrorCode::TokenizerLoadFailed,
            "Cannot open vocabulary file",
            path.string()
        );
    }

    std::unordered_map<std::string, int> ranks;
    std::string line;
    size_t line_no = 0;

    while (std::getline(file, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) continue;

        std::istringstream fields(line);
        std::string token_b64;
        int rank = -1;
        if (!(fields >> token_b64 >> rank) || rank < 0) {
            return Result<std::shared_ptr<BpeEncoder>, Error>::err(
                ErrorCode::TokenizerLoadFailed,
                "Malformed vocabulary entry on line " + std::to_string(line_no),
                path.string()
            );
        }

        auto token = decode_base64(token_b64);
        if (!token) {
            return Result<std::shared_ptr<BpeEncoder>, Error>::err(
                ErrorCode::TokenizerLoadFailed,
                "Invalid base64 token on line " + std::to_string(line_no),
                path.string()
            );
        }

        ranks.emplace(std::move(*token), rank);
    }

    if (ranks.empty()) {
        return Result<std::shared_ptr<BpeEncoder>, Error>::err(
            ErrorCode::TokenizerLoadFailed,
            "Vocabulary file is empty",
            path.string()
        );
    }

    spdlog::info("Loaded BPE vocabulary {} ({} tokens)", path.stem().string(), ranks.size());

    return Result<std::shared_ptr<BpeEncoder>, Error>::ok(
        std::make_shared<BpeEncoder>(std::move(ranks), path.stem().string()));
}

std::vector<std::string_view> BpeEncoder::split_pieces(std::string_view text) {
    std::vector<std::string_view> pieces;
    const auto at = [&](size_t i) { return static_cast<unsigned char>(text[i]); };

    size_t i = 0;
    while (i < text.size()) {
        size_t start = i;

        // Contractions
        if (size_t n = contraction_at(text, i)) {
            pieces.push_back(text.substr(i, n));
            i += n;
            continue;
        }

        // Letter run with at most one leading non-letter, non-digit, non-newline
        bool prefixed = !is_letter(at(i)) && !is_digit(at(i)) && !is_newline(at(i)) &&
                        i + 1 < text.size() && is_letter(at(i + 1));
        if (is_letter(at(i)) || prefixed) {
            i += prefixed ? 1 : 0;
            while (i < text.size() && is_letter(at(i))) ++i;
            pieces.push_back(text.substr(start, i - start));
            continue;
        }

        // Numbers in groups of up to three digits
        if (is_digit(at(i))) {
            while (i < text.size() && is_digit(at(i)) && i - start < 3) ++i;
            pieces.push_back(text.substr(start, i - start));
            continue;
        }

        // Punctuation run with an optional leading space, plus trailing newlines
        bool spaced = at(i) == ' ' && i + 1 < text.size() && is_other(at(i + 1));
        if (is_other(at(i)) || spaced) {
            i += spaced ? 1 : 0;
            while (i < text.size() && is_other(at(i))) ++i;
            while (i < text.size() && is_newline(at(i))) ++i;
            pieces.push_back(text.substr(start, i - start));
            continue;
        }

        // Whitespace
        size_t end = i;
        size_t last_newline = std::string_view::npos;
        while (end < text.size() && is_space(at(end))) {
            if (is_newline(at(end))) last_newline = end;
            ++end;
        }

        if (last_newline != std::string_view::npos) {
            i = last_newline + 1;
        } else if (end == text.size() || end - start == 1) {
            i = end;
        } else {
            // Leave the last space to prefix the following word
            i = end - 1;
        }
        pieces.push_back(text.substr(start, i - start));
    }

    return pieces;
}

int BpeEncoder::rank_of(std::string_view bytes) const {
    auto it = ranks_.find(std::string(bytes));
    return it == ranks_.end() ? -1 : it->second;
}

void BpeEncoder::encode_piece(std::string_view piece, std::vector<int>& out) const {
    if (int whole = rank_of(piece); whole >= 0) {
        out.push_back(whole);
        return;
    }

    // Part boundaries; merging two parts removes the boundary between them
    std::vector<size_t> bounds;
    bounds.reserve(piece.size() + 1);
    for (size_t i = 0; i <= piece.size(); ++i) {
        bounds.push_back(i);
    }

    while (bounds.size() > 2) {
        int best_rank = INT_MAX;
        size_t best = 0;
        for (size_t k = 0; k + 2 < bounds.size(); ++k) {
            int r = rank_of(piece.substr(bounds[k], bounds[k + 2] - bounds[k]));
            if (r >= 0 && r < best_rank) {
                best_rank = r;
                best = k;
            }
        }
        if (best_rank == INT_MAX) break;
        bounds.erase(bounds.begin() + static_cast<std::ptrdiff_t>(best + 1));
    }

    for (size_t k = 0; k + 1 < bounds.size(); ++k) {
        out.push_back(rank_of(piece.substr(bounds[k], bounds[k + 1] - bounds[k])));
    }
}

std::vector<int> BpeEncoder::encode(std::string_view text) const {
    std::vector<int> tokens;
    for (auto piece : split_pieces(text)) {
        encode_piece(piece, tokens);
    }
    return tokens;
}

int BpeEncoder::count(std::string_view text) const {
    return static_cast<int>(encode(text).size());
}

}  // namespace chatgate::llm
