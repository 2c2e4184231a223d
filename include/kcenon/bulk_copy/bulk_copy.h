/**
 * @file bulk_copy.h
 * @brief Main header for the bulk_copy library
 * @version 0.1.0
 *
 * Include this header to access the copy engine, the remote store
 * interface and its directory-backed implementation.
 *
 * @code
 * #include <kcenon/bulk_copy/bulk_copy.h>
 *
 * using namespace kcenon::bulk_copy;
 *
 * auto store = directory_store::create_from_environment();
 * auto engine = copy_engine::builder()
 *     .with_store(std::move(store.value()))
 *     .build();
 *
 * engine.value().run({"data://photos/cat.jpg"}, ".");
 * @endcode
 */

#ifndef KCENON_BULK_COPY_BULK_COPY_H
#define KCENON_BULK_COPY_BULK_COPY_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/bulk_copy/core/types.h"
#include "kcenon/bulk_copy/core/data_path.h"
#include "kcenon/bulk_copy/core/logging.h"

// Stores
#include "kcenon/bulk_copy/store/remote_store.h"
#include "kcenon/bulk_copy/store/directory_store.h"

// Engine
#include "kcenon/bulk_copy/engine/copy_types.h"
#include "kcenon/bulk_copy/engine/copy_engine.h"

namespace kcenon::bulk_copy {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::bulk_copy

#endif  // KCENON_BULK_COPY_BULK_COPY_H
