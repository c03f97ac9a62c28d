#include "chatgate/net/httplib_transport.hpp"

#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>
#include <spdlog/spdlog.h>

#include <condition_variable>
#include <mutex>
#include <thread>

namespace chatgate::net {

ErrorCode error_code_for_status(int status) {
    if (status == 401 || status == 403) return ErrorCode::LLMAuthFailed;
    if (status == 429) return ErrorCode::LLMRateLimited;
    if (status == 408) return ErrorCode::Timeout;
    if (status >= 500) return ErrorCode::LLMProviderUnavailable;
    if (status >= 400) return ErrorCode::LLMInvalidRequest;
    return ErrorCode::LLMInvalidResponse;
}

namespace {

using SteadyClock = std::chrono::steady_clock;

ErrorCode error_code_for(httplib::Error error) {
    switch (error) {
        case httplib::Error::Connection:
            return ErrorCode::LLMConnectionFailed;
        case httplib::Error::ConnectionTimeout:
            return ErrorCode::Timeout;
        case httplib::Error::Read:
        case httplib::Error::Write:
            return ErrorCode::NetworkError;
        case httplib::Error::SSLConnection:
        case httplib::Error::SSLLoadingCerts:
        case httplib::Error::SSLServerVerification:
            return ErrorCode::SSLError;
        case httplib::Error::Canceled:
            return ErrorCode::Cancelled;
        default:
            return ErrorCode::NetworkError;
    }
}

class HttplibConnection : public StreamConnection {
public:
    HttplibConnection(const HttpRequest& request, std::chrono::seconds connect_timeout)
        : client_(request.base_url)
        , deadline_(SteadyClock::now() + request.timeout)
        , endpoint_(request.base_url + request.path)
    {
        client_.set_connection_timeout(connect_timeout);
        client_.set_read_timeout(request.timeout);
        client_.set_write_timeout(request.timeout);
    }

    ~HttplibConnection() override {
        close();
    }

    void start(const HttpRequest& request) {
        reader_ = std::thread([this, request] { run(request); });
    }

    Result<void, Error> wait_for_headers() {
        std::unique_lock lock(mutex_);
        if (!cv_.wait_until(lock, deadline_, [this] { return headers_ready_; })) {
            return Result<void, Error>::err(ErrorCode::Timeout, "Timed out waiting for response", endpoint_);
        }
        if (failure_) {
            return Result<void, Error>::err(*failure_);
        }
        if (status_ < 200 || status_ >= 300) {
            // Collect the whole error body before reporting it
            if (!cv_.wait_until(lock, deadline_, [this] { return finished_; })) {
                return Result<void, Error>::err(ErrorCode::Timeout, "Timed out reading error response", endpoint_);
            }
            return Result<void, Error>::err(
                error_code_for_status(status_),
                error_body_.empty() ? "HTTP " + std::to_string(status_) : error_body_,
                "HTTP " + std::to_string(status_)
            );
        }
        return Result<void, Error>::ok();
    }

    Result<std::optional<std::string>, Error> read() override {
        using ReadResult = Result<std::optional<std::string>, Error>;

        std::unique_lock lock(mutex_);
        if (closed_) {
            return ReadResult::err(ErrorCode::InvalidState, "Read from closed connection", endpoint_);
        }

        bool ready = cv_.wait_until(lock, deadline_, [this] {
            return slot_.has_value() || finished_;
        });
        if (!ready || SteadyClock::now() > deadline_) {
            lock.unlock();
            close();
            return ReadResult::err(ErrorCode::Timeout, "Request exceeded its time limit", endpoint_);
        }

        if (slot_) {
            std::optional<std::string> fragment = std::move(slot_);
            slot_.reset();
            cv_.notify_all();
            return ReadResult::ok(std::move(fragment));
        }

        if (failure_) {
            return ReadResult::err(*failure_);
        }
        return ReadResult::ok(std::nullopt);
    }

    void close() override {
        {
            std::lock_guard lock(mutex_);
            if (closed_) return;
            closed_ = true;
            cancelled_ = true;
        }
        cv_.notify_all();
        client_.stop();
        if (reader_.joinable()) {
            reader_.join();
        }
        spdlog::debug("Closed connection to {}", endpoint_);
    }

    bool is_closed() const override {
        std::lock_guard lock(mutex_);
        return closed_;
    }

private:
    httplib::Client client_;
    SteadyClock::time_point deadline_;
    std::string endpoint_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<std::string> slot_;
    std::string error_body_;
    std::optional<Error> failure_;
    int status_ = 0;
    bool headers_ready_ = false;
    bool finished_ = false;
    bool cancelled_ = false;
    bool closed_ = false;
    std::thread reader_;

    void run(const HttpRequest& request) {
        httplib::Request req;
        req.method = "POST";
        req.path = request.path;
        for (const auto& [name, value] : request.headers) {
            req.set_header(name, value);
        }
        req.set_header("Content-Type", request.content_type);
        req.body = request.body;

        req.response_handler = [this](const httplib::Response& res) {
            std::lock_guard lock(mutex_);
            status_ = res.status;
            headers_ready_ = true;
            cv_.notify_all();
            return !cancelled_;
        };

        req.content_receiver = [this](const char* data, size_t len, uint64_t, uint64_t) {
            std::unique_lock lock(mutex_);
            if (status_ < 200 || status_ >= 300) {
                error_body_.append(data, len);
                return !cancelled_;
            }

            // Hand over one fragment at a time
            cv_.wait(lock, [this] { return !slot_.has_value() || cancelled_; });
            if (cancelled_) {
                return false;
            }
            slot_ = std::string(data, len);
            cv_.notify_all();
            return true;
        };

        httplib::Response res;
        httplib::Error error = httplib::Error::Success;
        bool sent = client_.send(req, res, error);

        std::lock_guard lock(mutex_);
        if (!sent && !cancelled_) {
            // A socket read timeout at the total deadline is the deadline
            ErrorCode code = SteadyClock::now() >= deadline_ ? ErrorCode::Timeout : error_code_for(error);
            failure_ = Error{code, httplib::to_string(error), endpoint_};
            spdlog::warn("Request to {} failed: {}", endpoint_, httplib::to_string(error));
        }
        finished_ = true;
        headers_ready_ = true;
        cv_.notify_all();
    }
};

}  // namespace

HttplibTransport::HttplibTransport(std::chrono::seconds connect_timeout)
    : connect_timeout_(connect_timeout)
{
}

Result<std::unique_ptr<StreamConnection>, Error> HttplibTransport::open_stream(const HttpRequest& request) {
    using OpenResult = Result<std::unique_ptr<StreamConnection>, Error>;

    auto connection = std::make_unique<HttplibConnection>(request, connect_timeout_);
    connection->start(request);

    auto headers = connection->wait_for_headers();
    if (headers.is_err()) {
        connection->close();
        return OpenResult::err(std::move(headers).error());
    }

    return OpenResult::ok(std::move(connection));
}

}  // namespace chatgate::net
