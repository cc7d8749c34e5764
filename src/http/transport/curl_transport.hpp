#ifndef CONDUIT_CURL_TRANSPORT_HPP
#define CONDUIT_CURL_TRANSPORT_HPP

#include <curl/curl.h>

#include <array>
#include <memory>
#include <mutex>
#include <string>

#include "../../utils/thread_pool.hpp"
#include "curl_global.hpp"
#include "interface.hpp"
#include "response_headers.hpp"

namespace conduit::transport {
    const size_t ERROR_BUFFER_SIZE = 256;

    struct CurlTransportOptions {
        long connect_timeout_ms_ = 10'000L;
        long timeout_ms_ = 30'000L;
        std::string user_agent_ = "conduit/1.0";
        // Redirects are the redirect policy's job; enable only for pipelines without one.
        bool follow_redirects_ = false;
        bool verify_tls_ = true;
        bool prefer_http2_ = true;
        bool enable_compression_ = true;
        size_t max_connections_ = 4;
    };

    enum class CurlMethodMode { HTTP_GET, NO_BODY, CUSTOM };

    struct CurlMethodPlan {
        CurlMethodMode mode_;
        bool send_body_ = false;
    };

    // How a request's method and body map onto curl's method options. A GET with a body
    // goes out as a custom request so the body is not dropped.
    [[nodiscard]] CurlMethodPlan plan_method(const model::Request& req);

    // One libcurl easy handle, valid for a single exchange.
    class CurlEasy {
       public:
        explicit CurlEasy(const CurlTransportOptions& defaults);

        ~CurlEasy();
        CurlEasy(const CurlEasy&) = delete;
        CurlEasy& operator=(const CurlEasy&) = delete;
        CurlEasy(CurlEasy&&) = delete;
        CurlEasy& operator=(CurlEasy&&) = delete;

        model::Response perform(const model::Request& req, const model::Options& options);

       private:
        template <typename T>
        void setopt(int option, T value);

        void set_method(const model::Request& req);
        void set_headers(const model::Headers& headers);
        void apply_call_options(const model::Options& options);
        void perform_throw();
        model::Response make_response(std::string& incoming_body);
        static size_t header_cb(char* buffer, size_t size, size_t n_items, void* userdata);

        ResponseHeaders received_;
        std::array<char, ERROR_BUFFER_SIZE> error_buf_{};
        curl_slist* headers_{};
        CURL* handle_{};
    };

    class CurlTransport final : public ITransport {
       public:
        explicit CurlTransport(CurlTransportOptions options = {});

        void open() override;
        void close() override;
        model::Response send(const model::Request& req, const model::Options& options) override;

        [[nodiscard]] bool is_open() const;
        [[nodiscard]] const CurlTransportOptions& options() const { return options_; }

       private:
        CurlTransportOptions options_;
        mutable std::mutex mutex_;
        std::unique_ptr<CurlGlobal> global_;
    };

    // Runs blocking curl exchanges on a worker pool created by open().
    class AsyncCurlTransport final : public IAsyncTransport {
       public:
        explicit AsyncCurlTransport(CurlTransportOptions options = {});

        void open() override;
        void close() override;
        std::future<model::Response> send(const model::Request& req, const model::Options& options) override;

       private:
        CurlTransport transport_;
        std::mutex mutex_;
        std::unique_ptr<concurrency::ThreadPool> pool_;
    };
}  // namespace conduit::transport

#endif
