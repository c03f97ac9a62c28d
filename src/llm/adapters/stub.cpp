#include "chatgate/llm/adapters/stub.hpp"

#include <spdlog/spdlog.h>

#include <thread>

namespace chatgate::llm {

namespace {

class StubChunkSource : public ChunkSource {
public:
    explicit StubChunkSource(std::vector<Duration> delays)
        : delays_(std::move(delays))
    {
    }

    Result<std::optional<std::string>, Error> next() override {
        const auto& fragments = StubAdapter::fragments();
        if (closed_ || index_ >= fragments.size()) {
            return Result<std::optional<std::string>, Error>::ok(std::nullopt);
        }

        std::this_thread::sleep_for(delays_[index_]);
        return Result<std::optional<std::string>, Error>::ok(fragments[index_++]);
    }

    void close() override {
        closed_ = true;
    }

private:
    std::vector<Duration> delays_;
    size_t index_ = 0;
    bool closed_ = false;
};

}  // namespace

StubAdapter::StubAdapter(const StubConfig& config)
    : config_(config)
{
}

const std::vector<std::string>& StubAdapter::fragments() {
    static const std::vector<std::string> kFragments = {"Hello ", "World!"};
    return kFragments;
}

Result<ChunkStream, Error> StubAdapter::generate(const std::string& context,
                                                 const std::vector<Message>& history,
                                                 const std::string& prompt) const {
    spdlog::debug("Stub generation (context_len={}, history={}, prompt_len={})",
                  context.size(), history.size(), prompt.size());

    auto source = std::make_unique<StubChunkSource>(
        std::vector<Duration>{config_.first_delay, config_.second_delay});
    return Result<ChunkStream, Error>::ok(ChunkStream(std::move(source)));
}

}  // namespace chatgate::llm
