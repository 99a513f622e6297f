#pragma once

#include <ostream>
#include <string>

#include "keypack/archive_format.hpp"
#include "keypack/file_set.hpp"
#include "keypack/key_stream.hpp"
#include "keypack/pack_status.hpp"
#include "keypack/progress_channel.hpp"

namespace keypack {

class ArchiveWriter {
public:
    // Encodes every file of the set, in order, into a gzip stream on out.
    // Progress advances by 1/count per finished file. The first file that
    // cannot be read aborts the whole write; out then holds a partial archive.
    static PackStatus Write(
        const FileSet& files,
        KeyStream& key,
        std::ostream& out,
        ProgressChannel& channel,
        const ArchiveOptions& options = {});

    // Write() into a newly created file. A failed write deletes the file.
    static PackStatus WriteFile(
        const FileSet& files,
        KeyStream& key,
        const std::string& destination_path,
        ProgressChannel& channel,
        const ArchiveOptions& options = {});
};

}  // namespace keypack
