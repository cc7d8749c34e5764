#ifndef CONDUIT_MULTIPART_HPP
#define CONDUIT_MULTIPART_HPP

#include <memory>
#include <string>
#include <vector>

#include "model.hpp"

namespace conduit::model {
    inline constexpr const char* BATCH_BOUNDARY_PREFIX = "batch_";
    inline constexpr const char* CHANGESET_BOUNDARY_PREFIX = "changeset_";

    void set_multipart_mixed(Request& request, std::vector<Request> requests, std::vector<std::shared_ptr<policies::SansIOPolicy>> policies = {},
                             std::string boundary = {}, Options options = {});

    // Serialises the bundle into request.body_ and sets the multipart Content-Type.
    // Content-IDs are numbered across nested changesets; returns the next free index.
    int prepare_multipart_body(Request& request, int content_index = 0);

    std::string serialize_request(const Request& request);
}  // namespace conduit::model

#endif
