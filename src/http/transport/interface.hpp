#ifndef CONDUIT_TRANSPORT_INTERFACE_HPP
#define CONDUIT_TRANSPORT_INTERFACE_HPP

#include <future>

#include "../model/model.hpp"
#include "../model/options.hpp"

namespace conduit::transport {
    // Performs the network I/O for one request. open/close bracket the lifetime of
    // connection resources and are driven by the owning pipeline's scope.
    class ITransport {
       public:
        ITransport() = default;
        virtual ~ITransport() = default;
        ITransport(const ITransport&) = delete;
        ITransport& operator=(const ITransport&) = delete;
        ITransport(ITransport&&) = delete;
        ITransport& operator=(ITransport&&) = delete;

        virtual void open() = 0;
        virtual void close() = 0;
        virtual model::Response send(const model::Request& req, const model::Options& options) = 0;
    };

    class IAsyncTransport {
       public:
        IAsyncTransport() = default;
        virtual ~IAsyncTransport() = default;
        IAsyncTransport(const IAsyncTransport&) = delete;
        IAsyncTransport& operator=(const IAsyncTransport&) = delete;
        IAsyncTransport(IAsyncTransport&&) = delete;
        IAsyncTransport& operator=(IAsyncTransport&&) = delete;

        virtual void open() = 0;
        virtual void close() = 0;
        virtual std::future<model::Response> send(const model::Request& req, const model::Options& options) = 0;
    };
}  // namespace conduit::transport

#endif
