#include "curl_transport.hpp"

#include <algorithm>
#include <string>

#include "../../utils/constants.hpp"
#include "../../utils/logging.hpp"
#include "../../utils/string_utils.hpp"
#include "../error/http_error.hpp"

namespace conduit::transport {
    struct CurlDefaults {
        static constexpr long NO_PROGRESS = 1L;
        static constexpr long NO_SIGNAL = 1L;
        static constexpr long TCP_KEEPALIVE = 1L;
        static constexpr long TCP_KEEPIDLE = 120L;
        static constexpr long TCP_KEEPINTVL = 60L;
        static constexpr long MAX_REDIRECTS = 10L;
        static constexpr const char* ACCEPT_ENCODING = "";
    };

    CurlMethodPlan plan_method(const model::Request& req) {
        if (req.method_ == "GET" && req.body_.empty()) {
            return CurlMethodPlan{.mode_ = CurlMethodMode::HTTP_GET};
        }
        if (req.method_ == "HEAD") {
            return CurlMethodPlan{.mode_ = CurlMethodMode::NO_BODY};
        }
        return CurlMethodPlan{
            .mode_ = CurlMethodMode::CUSTOM,
            .send_body_ = !req.body_.empty() || req.method_ == "POST" || req.method_ == "PUT" || req.method_ == "PATCH",
        };
    }

    //
    // CurlEasy implementation
    //

    CurlEasy::CurlEasy(const CurlTransportOptions& defaults) : handle_(curl_easy_init()) {
        if (handle_ == nullptr) {
            throw http_error::TransportError("Failed to create CURL easy handle");
        }

        error_buf_[0] = '\0';

        setopt(CURLOPT_ERRORBUFFER, error_buf_.data());
        setopt(CURLOPT_NOPROGRESS, CurlDefaults::NO_PROGRESS);
        setopt(CURLOPT_NOSIGNAL, CurlDefaults::NO_SIGNAL);  // safe in multithreaded apps
        setopt(CURLOPT_CONNECTTIMEOUT_MS, defaults.connect_timeout_ms_);
        setopt(CURLOPT_TIMEOUT_MS, defaults.timeout_ms_);
        setopt(CURLOPT_USERAGENT, defaults.user_agent_.c_str());
        setopt(CURLOPT_FOLLOWLOCATION, defaults.follow_redirects_ ? 1L : 0L);
        setopt(CURLOPT_MAXREDIRS, CurlDefaults::MAX_REDIRECTS);
        setopt(CURLOPT_SSL_VERIFYPEER, defaults.verify_tls_ ? 1L : 0L);
        setopt(CURLOPT_SSL_VERIFYHOST, defaults.verify_tls_ ? 2L : 0L);
        setopt(CURLOPT_TCP_KEEPALIVE, CurlDefaults::TCP_KEEPALIVE);
        setopt(CURLOPT_TCP_KEEPIDLE, CurlDefaults::TCP_KEEPIDLE);
        setopt(CURLOPT_TCP_KEEPINTVL, CurlDefaults::TCP_KEEPINTVL);
        if (defaults.enable_compression_) {
            // Empty string => accept all supported encodings (gzip/deflate/br)
            setopt(CURLOPT_ACCEPT_ENCODING, CurlDefaults::ACCEPT_ENCODING);
        }
        if (defaults.prefer_http2_) {
            setopt(CURLOPT_HTTP_VERSION, static_cast<long>(CURL_HTTP_VERSION_2TLS));
        }
    }

    CurlEasy::~CurlEasy() {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
        }

        if (handle_ != nullptr) {
            curl_easy_cleanup(handle_);
        }
    }

    model::Response CurlEasy::perform(const model::Request& req, const model::Options& options) {
        setopt(CURLOPT_URL, req.url_.c_str());
        set_method(req);
        set_headers(req.headers_);
        apply_call_options(options);

        std::string body;
        setopt(CURLOPT_WRITEFUNCTION, &string_utils::write_to_string);
        setopt(CURLOPT_WRITEDATA, &body);
        setopt(CURLOPT_HEADERFUNCTION, &CurlEasy::header_cb);
        setopt(CURLOPT_HEADERDATA, this);

        perform_throw();
        return make_response(body);
    }

    void CurlEasy::set_method(const model::Request& req) {
        const CurlMethodPlan plan = plan_method(req);
        switch (plan.mode_) {
            case CurlMethodMode::HTTP_GET:
                setopt(CURLOPT_HTTPGET, 1L);
                return;
            case CurlMethodMode::NO_BODY:
                setopt(CURLOPT_NOBODY, 1L);
                return;
            case CurlMethodMode::CUSTOM:
                setopt(CURLOPT_CUSTOMREQUEST, req.method_.c_str());
                break;
        }

        if (plan.send_body_) {
            setopt(CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(req.body_.size()));
            setopt(CURLOPT_POSTFIELDS, req.body_.c_str());
        }
    }

    void CurlEasy::set_headers(const model::Headers& headers) {
        for (const auto& [name, value] : headers) {
            // "Name;" makes curl send a header with an empty value.
            const std::string line = value.empty() ? name + ";" : name + ": " + value;
            curl_slist* appended = curl_slist_append(headers_, line.c_str());
            if (appended == nullptr) {
                throw http_error::TransportError("curl_slist_append failed for header " + name);
            }
            headers_ = appended;
        }
        // Stop curl from adding "Expect: 100-continue" to large bodies.
        if (!headers.contains("Expect")) {
            headers_ = curl_slist_append(headers_, "Expect:");
        }
        if (headers_ != nullptr) {
            setopt(CURLOPT_HTTPHEADER, headers_);
        }
    }

    void CurlEasy::apply_call_options(const model::Options& options) {
        if (auto timeout = model::get_option<long long>(options, constants::TIMEOUT_MS)) {
            setopt(CURLOPT_TIMEOUT_MS, static_cast<long>(*timeout));
        }
        if (auto connect_timeout = model::get_option<long long>(options, constants::CONNECT_TIMEOUT_MS)) {
            setopt(CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(*connect_timeout));
        }
        if (auto verify = model::get_option<bool>(options, constants::VERIFY_TLS)) {
            setopt(CURLOPT_SSL_VERIFYPEER, *verify ? 1L : 0L);
            setopt(CURLOPT_SSL_VERIFYHOST, *verify ? 2L : 0L);
        }
    }

    size_t CurlEasy::header_cb(char* buffer, size_t size, size_t n_items, void* userdata) {
        auto* self = static_cast<CurlEasy*>(userdata);
        const size_t bytes = size * n_items;
        self->received_.feed(std::string_view(buffer, bytes));
        return bytes;
    }

    template <typename T>
    void CurlEasy::setopt(int option, T value) {
        const auto rc = curl_easy_setopt(handle_, static_cast<CURLoption>(option), value);

        if (rc != CURLE_OK) {
            throw http_error::TransportError(std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc), static_cast<int>(rc));
        }
    }

    void CurlEasy::perform_throw() {
        const auto rc = curl_easy_perform(handle_);

        if (rc == CURLE_OK) {
            return;
        }

        std::string err = "curl_easy_perform failed: ";

        if (error_buf_[0] != '\0') {
            err += error_buf_.data();
        } else {
            err += curl_easy_strerror(rc);
        }

        throw http_error::TransportError(err, static_cast<int>(rc), rc == CURLE_OPERATION_TIMEDOUT);
    }

    model::Response CurlEasy::make_response(std::string& incoming_body) {
        long code = 0;
        char* eff = nullptr;
        curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &code);
        curl_easy_getinfo(handle_, CURLINFO_EFFECTIVE_URL, &eff);

        model::Response r;
        r.status_ = code;
        r.reason_ = received_.take_reason();
        r.body_ = std::move(incoming_body);
        r.effective_url_ = eff != nullptr ? eff : std::string{};
        r.headers_ = received_.take_headers();
        return r;
    }

    //
    // CurlTransport implementation
    //

    CurlTransport::CurlTransport(CurlTransportOptions options) : options_(std::move(options)) {}

    void CurlTransport::open() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (global_ == nullptr) {
            global_ = std::make_unique<CurlGlobal>();
            logging::logger()->debug("curl transport opened");
        }
    }

    void CurlTransport::close() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (global_ != nullptr) {
            global_.reset();
            logging::logger()->debug("curl transport closed");
        }
    }

    bool CurlTransport::is_open() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return global_ != nullptr;
    }

    model::Response CurlTransport::send(const model::Request& req, const model::Options& options) {
        if (!is_open()) {
            open();
        }
        CurlEasy easy(options_);
        return easy.perform(req, options);
    }

    //
    // AsyncCurlTransport implementation
    //

    AsyncCurlTransport::AsyncCurlTransport(CurlTransportOptions options) : transport_(std::move(options)) {}

    void AsyncCurlTransport::open() {
        transport_.open();
        std::lock_guard<std::mutex> lock(mutex_);
        if (pool_ == nullptr) {
            pool_ = std::make_unique<concurrency::ThreadPool>(std::max<size_t>(1, transport_.options().max_connections_));
        }
    }

    void AsyncCurlTransport::close() {
        std::unique_ptr<concurrency::ThreadPool> pool;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pool = std::move(pool_);
        }
        // Joins the workers after in-flight exchanges finish.
        pool.reset();
        transport_.close();
    }

    std::future<model::Response> AsyncCurlTransport::send(const model::Request& req, const model::Options& options) {
        open();
        std::lock_guard<std::mutex> lock(mutex_);
        return pool_->submit([this, req, options]() { return transport_.send(req, options); });
    }
}  // namespace conduit::transport
