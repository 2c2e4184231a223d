/**
 * @file destination_resolver.h
 * @brief Per-item target selection for uploads and downloads
 */

#ifndef KCENON_BULK_COPY_ENGINE_DESTINATION_RESOLVER_H
#define KCENON_BULK_COPY_ENGINE_DESTINATION_RESOLVER_H

#include <filesystem>
#include <memory>
#include <string>

#include "kcenon/bulk_copy/core/types.h"
#include "kcenon/bulk_copy/engine/copy_types.h"

namespace kcenon::bulk_copy {

class remote_store;

/**
 * @brief Decides where each item of a batch is written
 *
 * Upload resolution queries the store once per item; nothing is cached, as
 * the destination may be a directory receiving many children. Calls are
 * independent and may run concurrently from every worker.
 */
class destination_resolver {
public:
    explicit destination_resolver(std::shared_ptr<remote_store> store);

    /**
     * @brief Resolve the remote target for one local item
     *
     * - destination is an existing file: overwrite it
     * - destination is an existing directory: destination/basename(item)
     * - anything else (including a failed query): create the literal
     *   destination
     *
     * @param destination Remote destination URI of the batch
     * @param local_item Local path of the item being uploaded
     */
    [[nodiscard]] auto resolve_upload(const std::string& destination,
                                      const std::string& local_item) const -> write_target;

    /**
     * @brief Resolve the local file path for one remote item
     *
     * destination/basename(item) when destination is an existing directory,
     * otherwise destination itself.
     *
     * @return Target path, or invalid_remote_path when the item has no
     *         basename to place inside a directory
     */
    [[nodiscard]] static auto resolve_download(const std::filesystem::path& destination,
                                               const std::string& remote_item)
        -> result<std::filesystem::path>;

private:
    std::shared_ptr<remote_store> store_;
};

}  // namespace kcenon::bulk_copy

#endif  // KCENON_BULK_COPY_ENGINE_DESTINATION_RESOLVER_H
