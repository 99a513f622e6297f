#pragma once

#include <string_view>

namespace keypack {

enum class PackStatus {
    Ok = 0,
    PathNotFound,
    NoFilesIdentified,
    InvalidPath,
    FileIOError,
    TruncatedArchive,
    InvalidArchive,
    InvalidState,
    InvalidArgument
};

inline std::string_view ToString(const PackStatus status) {
    switch (status) {
        case PackStatus::Ok:
            return "Ok";
        case PackStatus::PathNotFound:
            return "PathNotFound";
        case PackStatus::NoFilesIdentified:
            return "NoFilesIdentified";
        case PackStatus::InvalidPath:
            return "InvalidPath";
        case PackStatus::FileIOError:
            return "FileIOError";
        case PackStatus::TruncatedArchive:
            return "TruncatedArchive";
        case PackStatus::InvalidArchive:
            return "InvalidArchive";
        case PackStatus::InvalidState:
            return "InvalidState";
        case PackStatus::InvalidArgument:
            return "InvalidArgument";
    }
    return "UnknownStatus";
}

}  // namespace keypack
