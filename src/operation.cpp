#include "keypack/operation.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <system_error>
#include <utility>

#include <cryptopp/misc.h>

#include "keypack/archive_reader.hpp"
#include "keypack/archive_writer.hpp"
#include "keypack/key_stream.hpp"
#include "keypack/text_codec.hpp"

namespace keypack {

namespace {

bool SameFile(const std::filesystem::path& lhs, const std::filesystem::path& rhs) {
    std::error_code ec;
    if (std::filesystem::exists(lhs, ec) && std::filesystem::exists(rhs, ec)) {
        const bool same = std::filesystem::equivalent(lhs, rhs, ec);
        if (!ec) {
            return same;
        }
    }
    const std::filesystem::path a = std::filesystem::absolute(lhs, ec).lexically_normal();
    const std::filesystem::path b = std::filesystem::absolute(rhs, ec).lexically_normal();
    return a == b;
}

// The archive being written must never be one of its own inputs.
PackStatus ExcludeDestination(const std::string& destination_path, FileSet& files) {
    const std::filesystem::path destination = PathFromUtf8(destination_path);
    const auto is_destination = [&destination](const FileDescriptor& file) {
        return SameFile(PathFromUtf8(file.path), destination);
    };

    if (!files.target_is_directory) {
        return std::any_of(files.files.begin(), files.files.end(), is_destination) ? PackStatus::InvalidPath
                                                                                   : PackStatus::Ok;
    }
    files.files.erase(
        std::remove_if(files.files.begin(), files.files.end(), is_destination), files.files.end());
    return files.Empty() ? PackStatus::NoFilesIdentified : PackStatus::Ok;
}

}  // namespace

Operation::Operation(
    const OperationKind kind,
    std::string key,
    std::string target_path,
    std::string destination_path,
    OperationOptions options)
    : kind_(kind),
      key_(std::move(key)),
      target_path_(std::move(target_path)),
      destination_path_(std::move(destination_path)),
      options_(std::move(options)) {}

Operation::~Operation() {
    Wait();
    if (!key_.empty()) {
        CryptoPP::memset_z(key_.data(), 0, key_.size());
    }
}

PackStatus Operation::Identify() {
    if (state_ != OperationState::Created) {
        return PackStatus::InvalidState;
    }

    if (kind_ == OperationKind::Decrypt) {
        std::error_code ec;
        const std::filesystem::file_status status = std::filesystem::status(PathFromUtf8(target_path_), ec);
        if (!std::filesystem::exists(status)) {
            return PackStatus::PathNotFound;
        }
        if (!std::filesystem::is_regular_file(status)) {
            return PackStatus::InvalidPath;
        }
    }

    FileSet resolved;
    PackStatus status = FileSet::Resolve(target_path_, options_.recurse, options_.extension_filter, resolved);
    if (status != PackStatus::Ok) {
        return status;
    }
    if (kind_ == OperationKind::Encrypt) {
        status = ExcludeDestination(destination_path_, resolved);
        if (status != PackStatus::Ok) {
            return status;
        }
    }
    if (kind_ == OperationKind::Decrypt && resolved.Count() != 1) {
        return PackStatus::InvalidPath;
    }

    files_ = std::move(resolved);
    state_ = OperationState::Identified;
    return PackStatus::Ok;
}

PackStatus Operation::Start() {
    if (state_ != OperationState::Identified) {
        return PackStatus::InvalidState;
    }

    state_ = OperationState::Running;
    try {
        worker_ = std::thread(&Operation::Run, this);
    } catch (const std::system_error& e) {
        channel_.Log(std::string("Unable to start the operation. ERROR: ") + e.what());
        {
            std::lock_guard<std::mutex> lock(result_mutex_);
            result_ = PackStatus::InvalidState;
        }
        channel_.Finish(false);
        return PackStatus::InvalidState;
    }
    return PackStatus::Ok;
}

void Operation::Wait() {
    if (worker_.joinable()) {
        worker_.join();
    }
}

OperationState Operation::State() const {
    if (state_ == OperationState::Running && channel_.IsComplete()) {
        return OperationState::Complete;
    }
    return state_;
}

PackStatus Operation::Result() const {
    std::lock_guard<std::mutex> lock(result_mutex_);
    return result_;
}

bool Operation::Succeeded() const {
    return channel_.IsComplete() && channel_.Success();
}

void Operation::Run() {
    PackStatus status = PackStatus::Ok;
    try {
        KeyStream key(key_);
        if (kind_ == OperationKind::Encrypt) {
            status = ArchiveWriter::WriteFile(files_, key, destination_path_, channel_, options_.archive);
        } else {
            status = ArchiveReader::ReadFile(
                files_.files.front().path, key, destination_path_, channel_, options_.archive);
        }
    } catch (const std::exception& e) {
        const char* verb = kind_ == OperationKind::Encrypt ? "encryption" : "decryption";
        channel_.Log(std::string("Unexpected error occurred, unable to complete ") + verb + " operation. ERROR: " + e.what());
        status = PackStatus::FileIOError;
        if (kind_ == OperationKind::Encrypt) {
            std::error_code ec;
            std::filesystem::remove(PathFromUtf8(destination_path_), ec);
        }
    }

    {
        std::lock_guard<std::mutex> lock(result_mutex_);
        result_ = status;
    }
    channel_.Finish(status == PackStatus::Ok);
}

}  // namespace keypack
