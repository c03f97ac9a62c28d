#include "chatgate/llm/chunk_stream.hpp"

namespace chatgate::llm {

ChunkStream::ChunkStream(std::unique_ptr<ChunkSource> source)
    : source_(std::move(source))
    , closed_(source_ == nullptr)
{
}

ChunkStream::~ChunkStream() {
    close();
}

ChunkStream::ChunkStream(ChunkStream&& other) noexcept
    : source_(std::move(other.source_))
    , closed_(other.closed_)
{
    other.closed_ = true;
}

ChunkStream& ChunkStream::operator=(ChunkStream&& other) noexcept {
    if (this != &other) {
        close();
        source_ = std::move(other.source_);
        closed_ = other.closed_;
        other.closed_ = true;
    }
    return *this;
}

Result<std::optional<std::string>, Error> ChunkStream::next() {
    using NextResult = Result<std::optional<std::string>, Error>;

    while (!closed_) {
        auto result = source_->next();
        if (result.is_err()) {
            close();
            return result;
        }

        auto& chunk = result.value();
        if (!chunk) {
            close();
            break;
        }
        if (!chunk->empty()) {
            return result;
        }
    }

    return NextResult::ok(std::nullopt);
}

void ChunkStream::close() {
    if (closed_) return;
    closed_ = true;
    if (source_) {
        source_->close();
    }
}

Result<std::string, Error> ChunkStream::collect() {
    std::string text;
    while (true) {
        auto chunk = next();
        if (chunk.is_err()) {
            return Result<std::string, Error>::err(std::move(chunk).error());
        }
        if (!chunk.value()) {
            return Result<std::string, Error>::ok(std::move(text));
        }
        text += *chunk.value();
    }
}

}  // namespace chatgate::llm
