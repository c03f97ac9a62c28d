#pragma once

#include "chatgate/core/result.hpp"

#include <memory>
#include <optional>
#include <string>

namespace chatgate::llm {

using namespace chatgate::core;

// Producer behind a ChunkStream. next() returns nullopt when exhausted.
class ChunkSource {
public:
    virtual ~ChunkSource() = default;

    virtual Result<std::optional<std::string>, Error> next() = 0;

    // Release whatever the source holds (sockets, timers). Idempotent.
    virtual void close() = 0;
};

// Pull-based, finite, non-restartable sequence of generated text.
//
// Each next() call blocks until the following fragment is available and
// returns nullopt at the end. Fragments are never empty. The stream closes
// its source when it is exhausted, when an error is returned, on close(),
// and on destruction, so abandoning a stream part way releases the
// connection immediately.
class ChunkStream {
public:
    explicit ChunkStream(std::unique_ptr<ChunkSource> source);
    ~ChunkStream();

    ChunkStream(ChunkStream&& other) noexcept;
    ChunkStream& operator=(ChunkStream&& other) noexcept;

    ChunkStream(const ChunkStream&) = delete;
    ChunkStream& operator=(const ChunkStream&) = delete;

    Result<std::optional<std::string>, Error> next();

    void close();
    bool is_closed() const { return closed_; }

    // Drain the remaining fragments into one string
    Result<std::string, Error> collect();

private:
    std::unique_ptr<ChunkSource> source_;
    bool closed_ = false;
};

}  // namespace chatgate::llm
