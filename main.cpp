#include <cstdlib>
#include <iostream>
#include <string>

#include "src/config/pipeline_config.hpp"
#include "src/http/credentials/credential.hpp"
#include "src/http/error/http_error.hpp"
#include "src/http/model/url.hpp"
#include "src/http/pipeline/pipeline_builder.hpp"
#include "src/http/transport/curl_transport.hpp"
#include "src/utils/logging.hpp"

namespace {
    void print_usage() { std::cerr << "usage: conduit_cli <METHOD> <URL> [BODY]\n"; }

    std::string env_or_empty(const char* name) {
        const char* value = std::getenv(name);
        return value != nullptr ? std::string(value) : std::string{};
    }
}  // namespace

int main(int argc, char** argv) {
    if (argc < 3 || argc > 4) {
        print_usage();
        return 1;
    }

    try {
        //
        // Collect
        //

        const std::string config_path = env_or_empty("CONDUIT_CONFIG");
        const std::string token = env_or_empty("CONDUIT_TOKEN");
        const std::string scope = env_or_empty("CONDUIT_SCOPE");

        conduit::model::Request request{.method_ = argv[1], .url_ = argv[2], .body_ = argc == 4 ? argv[3] : ""};

        auto config = config_path.empty() ? conduit::config::PipelineConfig{} : conduit::config::PipelineConfig::load_from_file(config_path);
        conduit::logging::set_level(config.log_level_);

        //
        // Build
        //

        conduit::pipeline::PipelineBuilder builder;
        builder.with_transport(std::make_unique<conduit::transport::CurlTransport>(config.transport_)).with_config(config);

        if (!token.empty()) {
            auto url = conduit::model::parse_url(request.url_);
            if (!url) {
                throw std::runtime_error("Invalid URL: " + request.url_);
            }
            builder.with_credential(std::make_shared<conduit::credentials::StaticTokenCredential>(token),
                                    {scope.empty() ? url->origin() + "/.default" : scope});
        }

        auto pipeline = builder.validate().build();

        //
        // Send
        //

        conduit::pipeline::PipelineScope scope_guard(*pipeline);
        auto response = scope_guard->run(std::move(request));

        std::cout << response.http_response_.status_ << " " << response.http_response_.reason_ << "\n";
        std::cout << response.http_response_.body_ << std::endl;

        conduit::http_error::throw_for_status(response);
    } catch (const conduit::http_error::HttpError& e) {
        std::cerr << "HTTP Error: " << e.what() << " (URL: " << e.url_ << ")\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
