#include "multipart_preparer.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <vector>

#include "../../utils/logging.hpp"
#include "../../utils/thread_pool.hpp"
#include "../model/multipart.hpp"
#include "../policies/policy.hpp"
#include "context.hpp"

namespace conduit::pipeline {
    namespace {
        void prepare_part(model::Request& part, const model::MultipartMixed& bundle, std::size_t max_workers) {
            if (part.multipart_mixed_) {
                prepare_multipart_mixed_request(part, max_workers);
            }

            PipelineRequest pipeline_request{
                .http_request_ = std::move(part),
                .context_ = std::make_shared<PipelineContext>(bundle.options_),
            };

            try {
                for (const auto& policy : bundle.policies_) {
                    policy->on_request(pipeline_request);
                }
            } catch (...) {
                part = std::move(pipeline_request.http_request_);
                throw;
            }

            part = std::move(pipeline_request.http_request_);
        }
    }  // namespace

    void prepare_multipart_mixed_request(model::Request& request, std::size_t max_workers) {
        if (!request.multipart_mixed_ || request.multipart_mixed_->requests_.empty()) {
            return;
        }

        model::MultipartMixed& bundle = *request.multipart_mixed_;
        const std::size_t workers = std::clamp<std::size_t>(max_workers, 1, bundle.requests_.size());
        logging::logger()->debug("Preparing {} multipart sub-requests on {} workers", bundle.requests_.size(), workers);

        concurrency::ThreadPool pool(workers);
        std::vector<std::future<void>> pending;
        pending.reserve(bundle.requests_.size());

        for (auto& part : bundle.requests_) {
            pending.push_back(pool.submit([&part, &bundle, max_workers]() { prepare_part(part, bundle, max_workers); }));
        }

        std::exception_ptr first_error;
        for (auto& result : pending) {
            try {
                result.get();
            } catch (const std::exception& e) {
                if (!first_error) {
                    first_error = std::current_exception();
                } else {
                    logging::logger()->warn("Additional multipart preparation failure: {}", e.what());
                }
            } catch (...) {
                if (!first_error) {
                    first_error = std::current_exception();
                }
            }
        }

        if (first_error) {
            std::rethrow_exception(first_error);
        }
    }

    void prepare_multipart(model::Request& request, std::size_t max_workers) {
        if (!request.multipart_mixed_) {
            return;
        }
        prepare_multipart_mixed_request(request, max_workers);
        model::prepare_multipart_body(request);
    }
}  // namespace conduit::pipeline
