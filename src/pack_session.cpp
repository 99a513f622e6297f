#include "keypack/pack_session.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>
#include <vector>

#include "keypack/original_remover.hpp"
#include "keypack/pack_status.hpp"
#include "keypack/progress_channel.hpp"
#include "keypack/text_codec.hpp"

namespace keypack {

namespace {

OutputSink ResolveSink(const SessionOptions& options) {
    if (options.output) {
        return options.output;
    }
    return [](const std::string& line) { std::cout << line << "\n"; };
}

void RemoveOriginals(
    const Operation& operation,
    const bool succeeded,
    const SessionOptions& options,
    const OutputSink& emit) {
    if (!options.remove_originals) {
        return;
    }
    if (!succeeded) {
        emit("Operation failed, not removing original files");
        return;
    }

    RemovalOptions removal;
    removal.wipe_passes = options.wipe_passes;
    std::vector<std::string> failures;
    if (OriginalRemover::RemoveSet(operation.Files(), removal, failures) != PackStatus::Ok) {
        for (const std::string& path : failures) {
            emit("Failed to remove original '" + path + "'");
        }
    }
}

bool Run(
    const OperationKind kind,
    const std::string& key,
    const std::string& target,
    const std::string& destination,
    const bool recurse,
    const std::string& extension_filter,
    const SessionOptions& options) {
    OperationOptions operation_options;
    operation_options.recurse = recurse;
    operation_options.extension_filter = extension_filter;
    operation_options.archive = options.archive;

    Operation operation(kind, key, target, destination, operation_options);
    const bool succeeded = PackSession::Monitor(operation, options);
    RemoveOriginals(operation, succeeded, options, ResolveSink(options));
    return succeeded;
}

}  // namespace

bool PackSession::Monitor(Operation& operation, const SessionOptions& options) {
    const OutputSink emit = ResolveSink(options);

    PackStatus status = PackStatus::Ok;
    if (operation.State() == OperationState::Created) {
        status = operation.Identify();
    } else if (operation.State() != OperationState::Identified) {
        emit("Operation has already been started");
        return false;
    }
    if (status != PackStatus::Ok) {
        if (status == PackStatus::InvalidPath && operation.Kind() == OperationKind::Encrypt) {
            emit("Destination '" + operation.DestinationPath() + "' cannot be one of the files being encrypted");
        } else if (status == PackStatus::NoFilesIdentified) {
            emit("Operation failed to identify any files for processing");
        } else {
            emit("Operation failed to identify any files for processing. ERROR: " + std::string(ToString(status)));
        }
        return false;
    }

    ProgressChannel& channel = operation.Channel();
    status = operation.Start();
    if (status != PackStatus::Ok) {
        for (const std::string& message : channel.DrainMessages()) {
            emit(message);
        }
        emit("Operation failed to start. ERROR: " + std::string(ToString(status)));
        return false;
    }

    float reported = 0.0F;
    for (;;) {
        channel.WaitForUpdate(options.poll_interval);
        const ProgressState state = channel.Snapshot();
        if (state.progress > reported) {
            reported = state.progress;
            emit(FormatProgress(reported));
        }
        for (const std::string& message : channel.DrainMessages()) {
            emit(message);
        }
        // Messages logged right before completion are drained above, so only
        // exit once both conditions hold on the same pass.
        if (state.complete && !channel.HasMessages()) {
            break;
        }
    }

    operation.Wait();
    return operation.Succeeded();
}

bool PackSession::Encrypt(
    const std::string& key,
    const std::string& target,
    const std::string& destination,
    const bool recurse,
    const std::string& extension_filter,
    const SessionOptions& options) {
    const OutputSink emit = ResolveSink(options);

    std::error_code ec;
    if (!std::filesystem::exists(PathFromUtf8(target), ec)) {
        emit("Target path '" + target + "' does not exist");
        return false;
    }

    const std::filesystem::path archive = PathFromUtf8(destination);
    if (!archive.has_extension()) {
        emit("Destination '" + destination + "' must be a file path with an extension");
        return false;
    }
    if (archive.has_parent_path()) {
        std::filesystem::create_directories(archive.parent_path(), ec);
        if (ec) {
            emit("Unable to create the destination directory. ERROR: " + ec.message());
            return false;
        }
    }

    return Run(OperationKind::Encrypt, key, target, destination, recurse, extension_filter, options);
}

bool PackSession::Decrypt(
    const std::string& key,
    const std::string& target,
    const std::string& destination,
    const bool recurse,
    const std::string& extension_filter,
    const SessionOptions& options) {
    const OutputSink emit = ResolveSink(options);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(PathFromUtf8(target), ec)) {
        emit("Target path '" + target + "' is not an archive file");
        return false;
    }

    const std::filesystem::path output_dir = PathFromUtf8(destination);
    if (output_dir.has_extension()) {
        emit("Destination '" + destination + "' must be a directory path without an extension");
        return false;
    }
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        emit("Unable to create the destination directory. ERROR: " + ec.message());
        return false;
    }

    return Run(OperationKind::Decrypt, key, target, destination, recurse, extension_filter, options);
}

std::string PackSession::FormatProgress(const float progress) {
    std::ostringstream out;
    out << "\tProgress: " << std::fixed << std::setprecision(2) << (progress * 100.0F) << "%";
    return out.str();
}

}  // namespace keypack
