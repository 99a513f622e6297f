#pragma once

#include <mutex>
#include <string>
#include <thread>

#include "keypack/archive_format.hpp"
#include "keypack/file_set.hpp"
#include "keypack/pack_status.hpp"
#include "keypack/progress_channel.hpp"

namespace keypack {

enum class OperationKind {
    Encrypt,
    Decrypt
};

enum class OperationState {
    Created,
    Identified,
    Running,
    Complete
};

struct OperationOptions {
    bool recurse = true;
    std::string extension_filter = "*.*";
    ArchiveOptions archive;
};

// One archive run: Created -> Identified -> Running -> Complete.
//
// Identify() resolves the input files (encrypt: at least one file; decrypt:
// exactly one archive file). When encrypting, the destination archive is
// never an input: a single-file target naming it is InvalidPath and a
// directory target drops it from the set. Start() runs the writer or reader
// on a worker thread that is the only writer of Channel() until it finishes. Nothing is
// re-enterable and there is no cancellation; the destructor waits for the
// worker.
class Operation {
public:
    Operation(
        OperationKind kind,
        std::string key,
        std::string target_path,
        std::string destination_path,
        OperationOptions options = {});
    ~Operation();

    Operation(const Operation&) = delete;
    Operation& operator=(const Operation&) = delete;

    PackStatus Identify();
    PackStatus Start();
    void Wait();

    OperationState State() const;
    // Final status; Ok until the worker has finished.
    PackStatus Result() const;
    bool Succeeded() const;

    OperationKind Kind() const {
        return kind_;
    }

    const std::string& TargetPath() const {
        return target_path_;
    }

    const std::string& DestinationPath() const {
        return destination_path_;
    }

    // Valid once Identified; not modified afterwards.
    const FileSet& Files() const {
        return files_;
    }

    ProgressChannel& Channel() {
        return channel_;
    }

private:
    void Run();

    const OperationKind kind_;
    std::string key_;
    const std::string target_path_;
    const std::string destination_path_;
    const OperationOptions options_;

    OperationState state_ = OperationState::Created;
    FileSet files_;
    ProgressChannel channel_;

    mutable std::mutex result_mutex_;
    PackStatus result_ = PackStatus::Ok;

    std::thread worker_;
};

}  // namespace keypack
