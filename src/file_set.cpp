#include "keypack/file_set.hpp"

#include <cctype>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>

#include "keypack/text_codec.hpp"

namespace keypack {

namespace {

bool IsRegularFile(const std::filesystem::path& p) {
    std::error_code ec;
    return std::filesystem::is_regular_file(p, ec) && !ec;
}

bool IsDirectory(const std::filesystem::path& p) {
    std::error_code ec;
    return std::filesystem::is_directory(p, ec) && !ec;
}

std::uint64_t FileSize(const std::filesystem::path& p, bool& ok) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(p, ec);
    ok = !ec;
    return ok ? static_cast<std::uint64_t>(size) : 0U;
}

std::filesystem::path NormalizeTarget(const std::filesystem::path& input, std::error_code& ec) {
    std::filesystem::path p = std::filesystem::absolute(input, ec);
    if (ec) {
        return {};
    }
    p = p.lexically_normal();
    if (!p.has_filename() && p.has_relative_path()) {
        p = p.parent_path();
    }
    return p;
}

std::string StripRoot(const std::string& root, const std::string& full) {
    const std::size_t skip = (!root.empty() && root.back() == '/') ? root.size() : root.size() + 1U;
    if (full.size() <= skip) {
        return {};
    }
    return full.substr(skip);
}

char FoldAscii(const char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

template <typename Iterator>
PackStatus CollectFiles(
    Iterator it,
    const std::string& root,
    const std::string_view extension_filter,
    std::vector<FileDescriptor>& out_files) {
    std::error_code ec;
    const Iterator end;
    while (it != end) {
        const auto& dir_entry = *it;
        const bool regular = dir_entry.is_regular_file(ec);
        if (ec) {
            return PackStatus::FileIOError;
        }
        if (regular && FileSet::MatchesFilter(Utf8FromPath(dir_entry.path().filename()), extension_filter)) {
            bool size_ok = false;
            const std::uint64_t size = FileSize(dir_entry.path(), size_ok);
            if (!size_ok) {
                return PackStatus::FileIOError;
            }

            FileDescriptor descriptor;
            descriptor.path = Utf8FromPath(dir_entry.path());
            descriptor.size = size;
            descriptor.relative_path = StripRoot(root, descriptor.path);
            out_files.push_back(std::move(descriptor));
        }
        it.increment(ec);
        if (ec) {
            return PackStatus::FileIOError;
        }
    }
    return PackStatus::Ok;
}

}  // namespace

PackStatus FileSet::Resolve(
    const std::string& path,
    const bool recurse,
    const std::string_view extension_filter,
    FileSet& out_set) {
    out_set = FileSet{};

    std::error_code ec;
    const std::filesystem::path target = NormalizeTarget(PathFromUtf8(path), ec);
    if (ec) {
        return PackStatus::PathNotFound;
    }

    if (IsRegularFile(target)) {
        bool size_ok = false;
        const std::uint64_t size = FileSize(target, size_ok);
        if (!size_ok) {
            return PackStatus::FileIOError;
        }
        out_set.root = Utf8FromPath(target.parent_path());
        out_set.target_is_directory = false;

        FileDescriptor descriptor;
        descriptor.path = Utf8FromPath(target);
        descriptor.size = size;
        descriptor.relative_path = StripRoot(out_set.root, descriptor.path);
        out_set.files.push_back(std::move(descriptor));
        return PackStatus::Ok;
    }

    if (!IsDirectory(target)) {
        return PackStatus::PathNotFound;
    }

    out_set.root = Utf8FromPath(target);
    out_set.target_is_directory = true;

    PackStatus status = PackStatus::Ok;
    if (recurse) {
        std::filesystem::recursive_directory_iterator it(target, ec);
        if (ec) {
            return PackStatus::FileIOError;
        }
        status = CollectFiles(it, out_set.root, extension_filter, out_set.files);
    } else {
        std::filesystem::directory_iterator it(target, ec);
        if (ec) {
            return PackStatus::FileIOError;
        }
        status = CollectFiles(it, out_set.root, extension_filter, out_set.files);
    }
    if (status != PackStatus::Ok) {
        out_set.files.clear();
        return status;
    }

    return out_set.files.empty() ? PackStatus::NoFilesIdentified : PackStatus::Ok;
}

bool FileSet::MatchesFilter(const std::string_view file_name, const std::string_view filter) {
    if (filter.empty() || filter == "*" || filter == "*.*") {
        return true;
    }

    // Iterative wildcard match with single-star backtracking.
    std::size_t n = 0;
    std::size_t f = 0;
    std::size_t star = std::string_view::npos;
    std::size_t star_n = 0;
    while (n < file_name.size()) {
        if (f < filter.size() && filter[f] == '*') {
            star = f++;
            star_n = n;
        } else if (f < filter.size() && (filter[f] == '?' || FoldAscii(filter[f]) == FoldAscii(file_name[n]))) {
            ++n;
            ++f;
        } else if (star != std::string_view::npos) {
            f = star + 1U;
            n = ++star_n;
        } else {
            return false;
        }
    }
    while (f < filter.size() && filter[f] == '*') {
        ++f;
    }
    return f == filter.size();
}

}  // namespace keypack
