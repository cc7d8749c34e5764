#ifndef CONDUIT_POLICY_HPP
#define CONDUIT_POLICY_HPP

#include <exception>
#include <future>
#include <variant>

#include "../pipeline/context.hpp"

namespace conduit::policies {
    // Observes and mutates a call without controlling its progression.
    // on_exception never suppresses the error: it keeps propagating once the hook returns.
    class SansIOPolicy {
       public:
        SansIOPolicy() = default;
        virtual ~SansIOPolicy() = default;
        SansIOPolicy(const SansIOPolicy&) = delete;
        SansIOPolicy& operator=(const SansIOPolicy&) = delete;
        SansIOPolicy(SansIOPolicy&&) = delete;
        SansIOPolicy& operator=(SansIOPolicy&&) = delete;

        virtual void on_request(pipeline::PipelineRequest& /*request*/) {}
        virtual void on_response(pipeline::PipelineRequest& /*request*/, pipeline::PipelineResponse& /*response*/) {}
        virtual void on_exception(pipeline::PipelineRequest& /*request*/, const std::exception_ptr& /*error*/) {}
    };

    // A link in the chain with full control over calling next.
    class HttpPolicy {
       public:
        HttpPolicy() = default;
        virtual ~HttpPolicy() = default;
        HttpPolicy(const HttpPolicy&) = delete;
        HttpPolicy& operator=(const HttpPolicy&) = delete;
        HttpPolicy(HttpPolicy&&) = delete;
        HttpPolicy& operator=(HttpPolicy&&) = delete;

        virtual pipeline::PipelineResponse send(pipeline::PipelineRequest& request) = 0;

        void set_next(HttpPolicy* next) { next_ = next; }
        [[nodiscard]] HttpPolicy* next() const { return next_; }

       protected:
        HttpPolicy* next_ = nullptr;
    };

    class AsyncSansIOPolicy {
       public:
        AsyncSansIOPolicy() = default;
        virtual ~AsyncSansIOPolicy() = default;
        AsyncSansIOPolicy(const AsyncSansIOPolicy&) = delete;
        AsyncSansIOPolicy& operator=(const AsyncSansIOPolicy&) = delete;
        AsyncSansIOPolicy(AsyncSansIOPolicy&&) = delete;
        AsyncSansIOPolicy& operator=(AsyncSansIOPolicy&&) = delete;

        virtual std::future<void> on_request(pipeline::PipelineRequest& request);
        virtual std::future<void> on_response(pipeline::PipelineRequest& request, pipeline::PipelineResponse& response);
        virtual std::future<void> on_exception(pipeline::PipelineRequest& request, const std::exception_ptr& error);
    };

    class AsyncHttpPolicy {
       public:
        AsyncHttpPolicy() = default;
        virtual ~AsyncHttpPolicy() = default;
        AsyncHttpPolicy(const AsyncHttpPolicy&) = delete;
        AsyncHttpPolicy& operator=(const AsyncHttpPolicy&) = delete;
        AsyncHttpPolicy(AsyncHttpPolicy&&) = delete;
        AsyncHttpPolicy& operator=(AsyncHttpPolicy&&) = delete;

        // The request must outlive the returned future.
        virtual std::future<pipeline::PipelineResponse> send(pipeline::PipelineRequest& request) = 0;

        void set_next(AsyncHttpPolicy* next) { next_ = next; }
        [[nodiscard]] AsyncHttpPolicy* next() const { return next_; }

       protected:
        AsyncHttpPolicy* next_ = nullptr;
    };

    // Runs a synchronous SansIOPolicy's hooks inside an async pipeline.
    class SyncSansIOPolicyAdapter final : public AsyncSansIOPolicy {
       public:
        explicit SyncSansIOPolicyAdapter(std::shared_ptr<SansIOPolicy> policy) : policy_(std::move(policy)) {}

        std::future<void> on_request(pipeline::PipelineRequest& request) override;
        std::future<void> on_response(pipeline::PipelineRequest& request, pipeline::PipelineResponse& response) override;
        std::future<void> on_exception(pipeline::PipelineRequest& request, const std::exception_ptr& error) override;

       private:
        std::shared_ptr<SansIOPolicy> policy_;
    };

    // Outcome of one downstream send, for chaining policies that branch on it.
    using SendResult = std::variant<pipeline::PipelineResponse, std::exception_ptr>;

    SendResult try_send(HttpPolicy& next, pipeline::PipelineRequest& request);
    SendResult try_send(AsyncHttpPolicy& next, pipeline::PipelineRequest& request);

    std::future<void> ready_future();
}  // namespace conduit::policies

#endif
