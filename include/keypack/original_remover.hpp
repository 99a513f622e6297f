#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "keypack/file_set.hpp"
#include "keypack/pack_status.hpp"

namespace keypack {

struct RemovalOptions {
    // 0 unlinks without overwriting.
    std::size_t wipe_passes = 0;
    std::size_t buffer_size = 1024 * 1024;
};

// Deletes the inputs of a finished operation.
class OriginalRemover {
public:
    // Removes one regular file. With wipe passes the content is overwritten
    // (0x00, 0xFF, 0x55, 0xAA, then random), flushed, truncated and the name
    // scrambled before the unlink. Symlinks are refused.
    static PackStatus RemoveFile(const std::string& path, const RemovalOptions& options = {});

    // Removes every file of the set. When the set was resolved from a
    // directory, directories left empty beneath the root are pruned and so is
    // the root itself. Each failed path is appended to out_failures and the
    // rest are still attempted.
    static PackStatus RemoveSet(
        const FileSet& files,
        const RemovalOptions& options,
        std::vector<std::string>& out_failures);
};

}  // namespace keypack
