/**
 * @file bulk_cp.cpp
 * @brief Command-line front end for the bulk copy engine
 *
 * Copies files to or from a directory-backed object store:
 * - Uploading several local files into a remote directory
 * - Downloading remote objects into a local directory
 * - Controlling worker count and diagnostic logging
 */

#include <kcenon/bulk_copy/bulk_copy.h>

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using namespace kcenon::bulk_copy;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options] <source>... <dest>" << std::endl;
    std::cout << std::endl;
    std::cout << "Copy files to or from the object store. Remote paths carry a scheme" << std::endl;
    std::cout << "prefix (data://); anything else, or file://, is a local path." << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -c <n>                 Number of parallel transfers (default: 8)" << std::endl;
    std::cout << "  --store-root <dir>     Store root (default: $" << directory_store::root_env_var
              << ")" << std::endl;
    std::cout << "  --log-level <level>    trace, debug, info, warn, error (default: warn)"
              << std::endl;
    std::cout << "  --json-logs            Emit diagnostic logs as JSON" << std::endl;
    std::cout << "  --help                 Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " file1.jpg file2.jpg data://.my/foo" << std::endl;
    std::cout << "  " << program << " data://.my/foo/file1.jpg ." << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::size_t concurrency = 8;
    std::string store_root;
    std::string log_level_name;
    bool json_logs = false;
    std::vector<std::string> positional;

    if (const char* env_level = std::getenv("BULK_COPY_LOG_LEVEL")) {
        log_level_name = env_level;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-c") {
            if (++i >= argc) {
                std::cerr << "Error: -c requires an argument" << std::endl;
                return 1;
            }
            auto parsed = parse_concurrency(argv[i]);
            if (!parsed.has_value()) {
                std::cerr << "Error: " << parsed.error().message << std::endl;
                return 1;
            }
            concurrency = parsed.value();
        } else if (arg == "--store-root") {
            if (++i >= argc) {
                std::cerr << "Error: --store-root requires an argument" << std::endl;
                return 1;
            }
            store_root = argv[i];
        } else if (arg == "--log-level") {
            if (++i >= argc) {
                std::cerr << "Error: --log-level requires an argument" << std::endl;
                return 1;
            }
            log_level_name = argv[i];
        } else if (arg == "--json-logs") {
            json_logs = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Error: unknown option " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() < 2) {
        print_usage(argv[0]);
        return 1;
    }

    auto& logger = get_logger();
    logger.set_level(log_level::warn);
    if (!log_level_name.empty()) {
        auto level = parse_log_level(log_level_name);
        if (!level) {
            std::cerr << "Error: unknown log level " << log_level_name << std::endl;
            return 1;
        }
        logger.set_level(*level);
    }
    if (json_logs) {
        logger.set_output_format(log_output_format::json);
    }
    logger.initialize();

    auto store = store_root.empty() ? directory_store::create_from_environment()
                                    : directory_store::create(store_root);
    if (!store.has_value()) {
        std::cerr << "Error: " << store.error().message << std::endl;
        return 1;
    }

    BC_LOG_DEBUG(log_category::cli,
                 "Using store at " + store.value()->root().string());

    auto engine = copy_engine::builder()
        .with_store(std::move(store.value()))
        .with_concurrency(concurrency)
        .with_fatal_policy(fatal_policy::exit_process)
        .build();

    if (!engine.has_value()) {
        std::cerr << "Error: " << engine.error().message << std::endl;
        return 1;
    }

    std::string destination = positional.back();
    positional.pop_back();

    auto report = engine.value().run(positional, destination);

    logger.flush();
    logger.shutdown();
    return report.ok() ? 0 : 1;
}
