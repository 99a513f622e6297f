#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

#include "keypack/archive_format.hpp"
#include "keypack/operation.hpp"

namespace keypack {

using OutputSink = std::function<void(const std::string&)>;

struct SessionOptions {
    std::chrono::milliseconds poll_interval{100};
    bool remove_originals = false;
    std::size_t wipe_passes = 0;
    // Receives progress lines and log messages; empty writes to std::cout.
    OutputSink output;
    ArchiveOptions archive;
};

// Drives an operation from the calling thread and reports what it does.
class PackSession {
public:
    // Identifies the operation unless that was already done, starts it, then
    // prints progress increases and drains its log until it is complete and
    // no message is left. An operation already started is refused. Returns
    // the operation's success flag.
    static bool Monitor(Operation& operation, const SessionOptions& options = {});

    // target: a file or directory. destination: the archive file, which must
    // carry an extension; its parent directory is created.
    static bool Encrypt(
        const std::string& key,
        const std::string& target,
        const std::string& destination,
        bool recurse,
        const std::string& extension_filter,
        const SessionOptions& options = {});

    // target: an archive file. destination: a directory path without an
    // extension; created when missing.
    static bool Decrypt(
        const std::string& key,
        const std::string& target,
        const std::string& destination,
        bool recurse,
        const std::string& extension_filter,
        const SessionOptions& options = {});

    // "\tProgress: NN.NN%"
    static std::string FormatProgress(float progress);
};

}  // namespace keypack
