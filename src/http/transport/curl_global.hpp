#ifndef CONDUIT_CURL_GLOBAL_HPP
#define CONDUIT_CURL_GLOBAL_HPP

namespace conduit::transport {
    // Pairs curl_global_init with curl_global_cleanup. Held by an open transport.
    class CurlGlobal {
       public:
        CurlGlobal();

        ~CurlGlobal();
        CurlGlobal(const CurlGlobal&) = delete;
        CurlGlobal& operator=(const CurlGlobal&) = delete;
        CurlGlobal(CurlGlobal&&) = delete;
        CurlGlobal& operator=(CurlGlobal&&) = delete;
    };
}  // namespace conduit::transport

#endif
