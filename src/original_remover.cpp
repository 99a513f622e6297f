#include "keypack/original_remover.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <iterator>
#include <set>
#include <system_error>
#include <vector>

#include <cryptopp/misc.h>
#include <cryptopp/osrng.h>

#include "keypack/text_codec.hpp"

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace keypack {

namespace {

constexpr std::uint8_t kFixedPatterns[] = {0x00U, 0xFFU, 0x55U, 0xAAU};
constexpr std::size_t kNameScrambles = 3;

bool SyncFile(std::FILE* file) {
    if (std::fflush(file) != 0) {
        return false;
    }
#ifdef _WIN32
    return _commit(_fileno(file)) == 0;
#else
    return fsync(fileno(file)) == 0;
#endif
}

bool Truncate(std::FILE* file) {
#ifdef _WIN32
    return _chsize_s(_fileno(file), 0) == 0;
#else
    return ftruncate(fileno(file), 0) == 0;
#endif
}

std::FILE* OpenForUpdate(const std::filesystem::path& target) {
#ifdef _WIN32
    return _wfopen(target.c_str(), L"r+b");
#else
    return std::fopen(target.c_str(), "r+b");
#endif
}

void FillPass(const std::size_t pass, std::vector<std::uint8_t>& buffer, const std::size_t count,
              CryptoPP::AutoSeededRandomPool& rng) {
    if (pass < sizeof(kFixedPatterns)) {
        std::fill_n(buffer.begin(), count, kFixedPatterns[pass]);
    } else {
        rng.GenerateBlock(buffer.data(), count);
    }
}

PackStatus Overwrite(const std::filesystem::path& target, const std::uint64_t size, const RemovalOptions& options) {
    std::FILE* file = OpenForUpdate(target);
    if (file == nullptr) {
        return PackStatus::FileIOError;
    }

    std::vector<std::uint8_t> buffer(std::max<std::size_t>(options.buffer_size, 1U), 0U);
    CryptoPP::AutoSeededRandomPool rng;
    bool ok = true;

    for (std::size_t pass = 0; ok && pass < options.wipe_passes; ++pass) {
        ok = std::fseek(file, 0, SEEK_SET) == 0;
        for (std::uint64_t remaining = size; ok && remaining > 0;) {
            const std::size_t chunk =
                remaining > buffer.size() ? buffer.size() : static_cast<std::size_t>(remaining);
            FillPass(pass, buffer, chunk, rng);
            ok = std::fwrite(buffer.data(), 1, chunk, file) == chunk;
            remaining -= chunk;
        }
        ok = ok && SyncFile(file);
    }
    ok = ok && Truncate(file) && SyncFile(file);

    CryptoPP::memset_z(buffer.data(), 0, buffer.size());
    const bool closed = std::fclose(file) == 0;
    return ok && closed ? PackStatus::Ok : PackStatus::FileIOError;
}

// Renames are best effort; the returned path is whatever name the file ended
// up with.
std::filesystem::path ScrambleName(const std::filesystem::path& target) {
    std::filesystem::path current = target;
    for (std::size_t i = 0; i < kNameScrambles; ++i) {
        const std::filesystem::path next = current.parent_path() / RandomHexName(16);
        std::error_code ec;
        std::filesystem::rename(current, next, ec);
        if (ec) {
            break;
        }
        current = next;
    }
    return current;
}

bool IsBeneath(const std::filesystem::path& dir, const std::filesystem::path& root) {
    const auto mismatch = std::mismatch(root.begin(), root.end(), dir.begin(), dir.end());
    return mismatch.first == root.end();
}

std::size_t Depth(const std::filesystem::path& dir) {
    return static_cast<std::size_t>(std::distance(dir.begin(), dir.end()));
}

// Deepest directories first so parents are only tried once their children
// are gone.
void PruneEmptyDirectories(
    const FileSet& files,
    std::vector<std::string>& out_failures) {
    const std::filesystem::path root = PathFromUtf8(files.root);

    std::set<std::filesystem::path> candidates;
    candidates.insert(root);
    for (const FileDescriptor& file : files.files) {
        std::filesystem::path dir = PathFromUtf8(file.path).parent_path();
        while (dir != root && IsBeneath(dir, root) && candidates.insert(dir).second) {
            dir = dir.parent_path();
        }
    }

    std::vector<std::filesystem::path> ordered(candidates.begin(), candidates.end());
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const std::filesystem::path& a, const std::filesystem::path& b) {
                         return Depth(a) > Depth(b);
                     });

    for (const std::filesystem::path& dir : ordered) {
        std::error_code ec;
        if (!std::filesystem::is_directory(dir, ec) || !std::filesystem::is_empty(dir, ec) || ec) {
            continue;
        }
        std::filesystem::remove(dir, ec);
        if (ec) {
            out_failures.push_back(Utf8FromPath(dir));
        }
    }
}

}  // namespace

PackStatus OriginalRemover::RemoveFile(const std::string& path, const RemovalOptions& options) {
    const std::filesystem::path target = PathFromUtf8(path);
    std::error_code ec;
    const std::filesystem::file_status status = std::filesystem::symlink_status(target, ec);
    if (ec || !std::filesystem::exists(status)) {
        return PackStatus::PathNotFound;
    }
    if (!std::filesystem::is_regular_file(status)) {
        return PackStatus::InvalidPath;
    }

    std::filesystem::path current = target;
    if (options.wipe_passes > 0) {
        std::filesystem::permissions(
            target, std::filesystem::perms::owner_write, std::filesystem::perm_options::add, ec);
        const std::uintmax_t size = std::filesystem::file_size(target, ec);
        if (ec) {
            return PackStatus::FileIOError;
        }
        const PackStatus wiped = Overwrite(target, static_cast<std::uint64_t>(size), options);
        if (wiped != PackStatus::Ok) {
            return wiped;
        }
        current = ScrambleName(target);
    }

    std::filesystem::remove(current, ec);
    return ec ? PackStatus::FileIOError : PackStatus::Ok;
}

PackStatus OriginalRemover::RemoveSet(
    const FileSet& files,
    const RemovalOptions& options,
    std::vector<std::string>& out_failures) {
    const std::size_t failures_before = out_failures.size();

    for (const FileDescriptor& file : files.files) {
        if (RemoveFile(file.path, options) != PackStatus::Ok) {
            out_failures.push_back(file.path);
        }
    }

    if (files.target_is_directory) {
        PruneEmptyDirectories(files, out_failures);
    }
    return out_failures.size() == failures_before ? PackStatus::Ok : PackStatus::FileIOError;
}

}  // namespace keypack
