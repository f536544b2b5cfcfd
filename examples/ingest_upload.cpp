#include "ingest/api/api_client.hpp"
#include "ingest/config/config.hpp"
#include "ingest/events/components.hpp"
#include "ingest/events/event_bus.hpp"
#include "ingest/network/http_transport.hpp"
#include "ingest/upload/coordinator.hpp"
#include "ingest/upload/file_upload.hpp"
#include "ingest/upload/progress.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct Options {
    std::optional<fs::path> config_file;
    std::string organization_id;
    std::string dataset_id;
    std::string session_token;
    std::optional<std::string> destination_id;
    std::optional<fs::path> base_path;
    bool recursive = false;
    bool append = false;
    bool complete = true;
    bool verbose = false;
    std::optional<std::size_t> parallelism;
    std::vector<fs::path> files;
};

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] <file>...\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  --org <id>            Organization id (required)\n";
    std::cout << "  --dataset <id>        Dataset id (required)\n";
    std::cout << "  --token <token>       Session token (default: $INGEST_SESSION_TOKEN)\n";
    std::cout << "  --config <file>       JSON configuration file\n";
    std::cout << "  --base <dir>          Resolve files against this directory\n";
    std::cout << "  --recursive           Keep folder structure below --base\n";
    std::cout << "  --destination <id>    Target collection inside the dataset\n";
    std::cout << "  --append              Append to an existing package\n";
    std::cout << "  --parallelism <n>     Concurrent part uploads\n";
    std::cout << "  --no-complete         Upload parts but do not complete the import\n";
    std::cout << "  --verbose             Debug logging\n";
    std::cout << "  --help                Show this message\n";
}

/// Returns the exit code to use when parsing should stop the program.
std::optional<int> parse_args(int argc, char* argv[], Options& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto require_value = [&](const char* name) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                spdlog::error("{} requires a value", name);
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--org" || arg == "--dataset" || arg == "--token" || arg == "--config" ||
                   arg == "--base" || arg == "--destination" || arg == "--parallelism") {
            auto value = require_value(arg.c_str());
            if (!value) {
                return 1;
            }
            if (arg == "--org") {
                options.organization_id = *value;
            } else if (arg == "--dataset") {
                options.dataset_id = *value;
            } else if (arg == "--token") {
                options.session_token = *value;
            } else if (arg == "--config") {
                options.config_file = fs::path(*value);
            } else if (arg == "--base") {
                options.base_path = fs::path(*value);
            } else if (arg == "--destination") {
                options.destination_id = *value;
            } else {
                try {
                    options.parallelism = std::stoul(*value);
                } catch (const std::exception&) {
                    spdlog::error("Invalid parallelism: {}", *value);
                    return 1;
                }
            }
        } else if (arg == "--recursive") {
            options.recursive = true;
        } else if (arg == "--append") {
            options.append = true;
        } else if (arg == "--no-complete") {
            options.complete = false;
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            spdlog::error("Unknown option: {}", arg);
            print_usage(argv[0]);
            return 1;
        } else {
            options.files.emplace_back(arg);
        }
    }

    if (options.organization_id.empty() || options.dataset_id.empty() || options.files.empty()) {
        print_usage(argv[0]);
        return 1;
    }
    return std::nullopt;
}

int fail(const ingest::Error& error) {
    spdlog::error("{}", error.describe());
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    Options options;
    if (auto exit_code = parse_args(argc, argv, options)) {
        return *exit_code;
    }
    if (options.verbose) {
        spdlog::set_level(spdlog::level::debug);
    }
    if (options.session_token.empty()) {
        options.session_token = ingest::config::process_env("INGEST_SESSION_TOKEN").value_or("");
    }

    auto config = ingest::config::load_config(options.config_file);
    if (config.is_error()) {
        return fail(config.error());
    }
    if (options.parallelism) {
        config.value().parallelism = *options.parallelism;
    }

    auto api_url = config.value().resolved_api_url();
    if (api_url.is_error()) {
        return fail(api_url.error());
    }
    auto endpoint = ingest::network::Url::parse(api_url.value());
    if (endpoint.is_error()) {
        return fail(endpoint.error());
    }

    spdlog::info("Uploading {} file(s) to {} ({})", options.files.size(), api_url.value(),
                 ingest::config::to_string(config.value().environment));

    ingest::network::AsioHttpTransport transport(endpoint.value(), config.value().request_timeout);
    ingest::api::ApiClient client(transport, ingest::api::RetryPolicy::from_config(config.value()));
    const ingest::api::RequestContext context{options.session_token, options.organization_id};

    std::vector<std::pair<ingest::upload::UploadId, fs::path>> numbered;
    for (std::size_t i = 0; i < options.files.size(); ++i) {
        numbered.emplace_back(static_cast<ingest::upload::UploadId>(i), options.files[i]);
    }

    auto uploads = ingest::upload::collect_uploads(options.base_path, numbered, options.recursive);
    if (uploads.is_error()) {
        return fail(uploads.error());
    }

    std::vector<ingest::upload::RemoteFile> remote_files;
    for (const auto& upload : uploads.value()) {
        auto remote = upload.to_remote_file();
        if (remote.is_error()) {
            return fail(remote.error());
        }
        remote_files.push_back(std::move(remote.value()));
    }

    auto preview = client.preview_upload(context, options.dataset_id, remote_files, options.append);
    if (preview.is_error()) {
        return fail(preview.error());
    }

    ingest::events::EventBus bus;
    ingest::events::LoggerComponent logger(bus);
    ingest::upload::LoggingProgress progress;
    ingest::upload::UploadCoordinator coordinator(
        client, ingest::upload::CoordinatorOptions::from_config(config.value()), progress, &bus);

    int exit_code = 0;
    for (const auto& package : preview.value().packages) {
        spdlog::info("Package {} ({} file(s), import {})",
                     package.package_name, package.files.size(), package.import_id);

        auto files = ingest::upload::attach_local_paths(package.files, uploads.value());
        if (files.is_error()) {
            return fail(files.error());
        }

        ingest::upload::TransferRequest request;
        request.context = context;
        request.import_id = package.import_id;
        request.files = std::move(files.value());
        if (options.complete) {
            request.completion = ingest::upload::CompletionRequest{
                options.dataset_id, options.destination_id, options.append};
        }

        auto outcome = coordinator.run(request);
        if (outcome.is_error()) {
            spdlog::error("Package {} failed: {}", package.package_name, outcome.error().describe());
            exit_code = 1;
            continue;
        }

        if (outcome.value().manifests) {
            for (const auto& entry : *outcome.value().manifests) {
                for (const auto& key : entry.files) {
                    spdlog::info("  stored {}", key);
                }
            }
        }
    }

    return exit_code;
}
