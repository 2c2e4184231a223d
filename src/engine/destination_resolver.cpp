/**
 * @file destination_resolver.cpp
 * @brief Implementation of destination_resolver
 */

#include "kcenon/bulk_copy/engine/destination_resolver.h"

#include <kcenon/bulk_copy/core/data_path.h>
#include <kcenon/bulk_copy/core/logging.h>
#include <kcenon/bulk_copy/store/remote_store.h>

namespace kcenon::bulk_copy {

destination_resolver::destination_resolver(std::shared_ptr<remote_store> store)
    : store_(std::move(store)) {}

auto destination_resolver::resolve_upload(const std::string& destination,
                                          const std::string& local_item) const
    -> write_target {
    auto info = store_->stat(destination);
    if (!info.has_value()) {
        copy_log_context ctx;
        ctx.item = local_item;
        ctx.target = destination;
        ctx.error_message = info.error().message;
        BC_LOG_DEBUG_CTX(log_category::resolver,
                         "stat failed, creating destination as new object", ctx);
        return write_target{destination, write_mode::create_new};
    }

    switch (info.value().kind) {
        case object_kind::file:
            return write_target{destination, write_mode::overwrite};

        case object_kind::directory: {
            auto name = std::filesystem::path(local_item).filename().string();
            return write_target{join_remote(destination, name), write_mode::insert_child};
        }

        case object_kind::not_found:
        default:
            return write_target{destination, write_mode::create_new};
    }
}

auto destination_resolver::resolve_download(const std::filesystem::path& destination,
                                            const std::string& remote_item)
    -> result<std::filesystem::path> {
    std::error_code ec;
    if (!std::filesystem::is_directory(destination, ec)) {
        return destination;
    }

    auto name = remote_basename(remote_item);
    if (name.empty() || name == "." || name == "..") {
        return unexpected{error{error_code::invalid_remote_path,
                                "no file name in " + remote_item}};
    }
    return destination / name;
}

}  // namespace kcenon::bulk_copy
