#ifndef CONDUIT_MULTIPART_PREPARER_HPP
#define CONDUIT_MULTIPART_PREPARER_HPP

#include <cstddef>

#include "../model/model.hpp"

namespace conduit::pipeline {
    // Runs the bundle's on_request hooks over every sub-request, up to max_workers at a time.
    // Nested changesets are prepared first. Does nothing for requests without a bundle.
    // If any part fails, the first failure is rethrown once every part has finished.
    void prepare_multipart_mixed_request(model::Request& request, std::size_t max_workers);

    // prepare_multipart_mixed_request followed by body serialisation.
    void prepare_multipart(model::Request& request, std::size_t max_workers);
}  // namespace conduit::pipeline

#endif
