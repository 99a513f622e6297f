#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "keypack/pack_status.hpp"

namespace keypack {

struct FileDescriptor {
    std::string path;
    std::uint64_t size = 0;
    // Relative to the resolution root, '/'-separated.
    std::string relative_path;
};

struct FileSet {
    // The target itself when it is a directory, otherwise its parent.
    std::string root;
    bool target_is_directory = false;
    std::vector<FileDescriptor> files;

    std::size_t Count() const {
        return files.size();
    }

    bool Empty() const {
        return files.empty();
    }

    // Resolves a file or directory into descriptors in directory listing
    // order. Returns PathNotFound when nothing exists at path and
    // NoFilesIdentified when a directory yields no matching files.
    static PackStatus Resolve(
        const std::string& path,
        bool recurse,
        std::string_view extension_filter,
        FileSet& out_set);

    // Glob match against a file name; '*' and '?' wildcards, ASCII
    // case-insensitive. "*", "*.*" and an empty pattern match everything.
    static bool MatchesFilter(std::string_view file_name, std::string_view filter);
};

}  // namespace keypack
