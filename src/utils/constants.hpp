#ifndef CONDUIT_CONSTANTS_HPP
#define CONDUIT_CONSTANTS_HPP

#include <array>
#include <cstddef>

namespace conduit::constants {
    inline constexpr int BASE_10 = 10;
    inline constexpr int BASE_16 = 16;
    inline constexpr long MS_PER_SECOND = 1000L;

    inline constexpr long HTTP_OK = 200;
    inline constexpr long HTTP_MULTIPLE_CHOICES = 300;
    inline constexpr long HTTP_UNAUTHORIZED = 401;

    // Per-call option keys understood by policies. PIPELINE_ONLY_OPTIONS never reach a transport.
    inline constexpr const char* INSECURE_DOMAIN_CHANGE = "insecure_domain_change";
    inline constexpr const char* ENABLE_CAE = "enable_cae";
    inline constexpr const char* TRACING_OPTIONS = "tracing_options";
    inline constexpr const char* PERMIT_REDIRECTS = "permit_redirects";
    inline constexpr std::array<const char*, 4> PIPELINE_ONLY_OPTIONS = {INSECURE_DOMAIN_CHANGE, ENABLE_CAE, TRACING_OPTIONS, PERMIT_REDIRECTS};

    inline constexpr const char* TIMEOUT_MS = "timeout_ms";
    inline constexpr const char* CONNECT_TIMEOUT_MS = "connect_timeout_ms";
    inline constexpr const char* VERIFY_TLS = "verify_tls";
    inline constexpr const char* HEADERS = "headers";
    inline constexpr const char* USER_AGENT = "user_agent";
    inline constexpr const char* REQUEST_ID = "request_id";
    inline constexpr const char* RETRY_TOTAL = "retry_total";
    inline constexpr const char* SPAN_NAME = "span_name";

    // Context data keys.
    inline constexpr const char* RETRY_COUNT = "retry_count";
    inline constexpr const char* REDIRECT_COUNT = "redirect_count";
    inline constexpr const char* SPAN_START_NS = "span_start_ns";
    inline constexpr const char* TRACE_ID = "trace_id";

    inline constexpr std::size_t DEFAULT_MULTIPART_WORKERS = 4;
}  // namespace conduit::constants

#endif
