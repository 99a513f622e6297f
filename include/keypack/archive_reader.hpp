#pragma once

#include <istream>
#include <string>
#include <vector>

#include "keypack/archive_format.hpp"
#include "keypack/key_stream.hpp"
#include "keypack/pack_status.hpp"
#include "keypack/progress_channel.hpp"

namespace keypack {

struct StagedFile {
    std::string temp_path;
    std::string final_path;
};

class ArchiveReader {
public:
    // Decodes every entry of the archive on in into its own temporary file.
    // Accounts for 75% of the progress range. On failure every temporary
    // file created so far is deleted and out_staged is left empty.
    static PackStatus Stage(
        std::istream& in,
        KeyStream& key,
        const std::string& destination_root,
        ProgressChannel& channel,
        const ArchiveOptions& options,
        std::vector<StagedFile>& out_staged);

    // Moves staged files to their final paths, replacing existing files.
    // Every file is attempted; any failure makes the result FileIOError.
    // Accounts for the remaining 25% of the progress range.
    static PackStatus Relocate(const std::vector<StagedFile>& staged, ProgressChannel& channel);

    // Stage() then, only if staging succeeded, Relocate().
    static PackStatus Read(
        std::istream& in,
        KeyStream& key,
        const std::string& destination_root,
        ProgressChannel& channel,
        const ArchiveOptions& options = {});

    static PackStatus ReadFile(
        const std::string& archive_path,
        KeyStream& key,
        const std::string& destination_root,
        ProgressChannel& channel,
        const ArchiveOptions& options = {});

    // Rejects empty, absolute and drive-prefixed paths, '\\', and '.'/'..'
    // components.
    static bool ValidateRelativePath(const std::string& path);
};

}  // namespace keypack
