#include "keypack/archive_reader.hpp"

#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <cryptopp/cryptlib.h>
#include <cryptopp/files.h>
#include <cryptopp/filters.h>
#include <cryptopp/gzip.h>
#include <cryptopp/queue.h>
#include <cryptopp/zinflate.h>

#include "keypack/text_codec.hpp"

namespace keypack {

namespace {

// Compressed input pumped per refill. Bounds how much decompressed data can
// pile up in the queue at once.
constexpr CryptoPP::lword kPumpSize = 64 * 1024;

// Pulls decompressed bytes from a gzip stream on demand.
class InflateSource {
public:
    explicit InflateSource(std::istream& in)
        : source_(in, false, new CryptoPP::Gunzip(new CryptoPP::Redirector(queue_))) {}

    // Returns fewer than count bytes only at the end of the stream.
    std::size_t Read(std::uint8_t* out, const std::size_t count) {
        std::size_t got = 0;
        while (got < count) {
            if (queue_.AnyRetrievable()) {
                got += queue_.Get(out + got, count - got);
                continue;
            }
            if (finished_) {
                break;
            }
            Refill();
        }
        return got;
    }

    // Consumes the rest of the stream so the gzip trailer is verified.
    void Finish() {
        while (!finished_) {
            Refill();
            queue_.Skip(queue_.MaxRetrievable());
        }
        queue_.Skip(queue_.MaxRetrievable());
    }

private:
    void Refill() {
        if (source_.Pump(kPumpSize) == 0) {
            source_.PumpAll();
            finished_ = true;
        }
    }

    CryptoPP::ByteQueue queue_;
    CryptoPP::FileSource source_;
    bool finished_ = false;
};

std::int32_t FromBig32(const std::array<std::uint8_t, 4>& in) {
    return static_cast<std::int32_t>(
        (static_cast<std::uint32_t>(in[0]) << 24U) |
        (static_cast<std::uint32_t>(in[1]) << 16U) |
        (static_cast<std::uint32_t>(in[2]) << 8U) |
        static_cast<std::uint32_t>(in[3]));
}

std::int64_t FromBig64(const std::array<std::uint8_t, 8>& in) {
    return static_cast<std::int64_t>(
        (static_cast<std::uint64_t>(in[0]) << 56U) |
        (static_cast<std::uint64_t>(in[1]) << 48U) |
        (static_cast<std::uint64_t>(in[2]) << 40U) |
        (static_cast<std::uint64_t>(in[3]) << 32U) |
        (static_cast<std::uint64_t>(in[4]) << 24U) |
        (static_cast<std::uint64_t>(in[5]) << 16U) |
        (static_cast<std::uint64_t>(in[6]) << 8U) |
        static_cast<std::uint64_t>(in[7]));
}

bool ReadDecrypted(InflateSource& source, KeyStream& key, std::uint8_t* out, const std::size_t count) {
    if (source.Read(out, count) != count) {
        return false;
    }
    key.Decrypt(out, count);
    return true;
}

template <std::size_t N>
bool ReadDecrypted(InflateSource& source, KeyStream& key, std::array<std::uint8_t, N>& out) {
    return ReadDecrypted(source, key, out.data(), out.size());
}

std::filesystem::path StagingDirectory(const ArchiveOptions& options, const std::filesystem::path& fallback) {
    if (!options.staging_dir.empty()) {
        return PathFromUtf8(options.staging_dir);
    }
    std::error_code ec;
    std::filesystem::path dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        return fallback;
    }
    return dir;
}

std::filesystem::path MakeStagingPath(const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::path candidate;
    do {
        candidate = dir / ("keypack_" + RandomHexName(8) + ".tmp");
    } while (std::filesystem::exists(candidate, ec));
    return candidate;
}

// Resolves an archive entry path under base, refusing anything that would
// land outside it.
bool ResolveFinalPath(const std::filesystem::path& base, const std::string& rel, std::filesystem::path& out_path) {
    out_path = (base / PathFromUtf8(rel)).lexically_normal();
    const std::string base_str = Utf8FromPath(base);
    const std::string out_str = Utf8FromPath(out_path);
    const std::string prefix = (!base_str.empty() && base_str.back() == '/') ? base_str : base_str + "/";
    return out_str.size() > prefix.size() && out_str.rfind(prefix, 0) == 0;
}

// Renames within a filesystem; copies then deletes across filesystems.
void MoveFile(const std::filesystem::path& from, const std::filesystem::path& to, std::error_code& ec) {
    std::filesystem::rename(from, to, ec);
    if (ec != std::errc::cross_device_link) {
        return;
    }
    ec.clear();
    std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return;
    }
    std::filesystem::remove(from, ec);
}

void RemoveStaged(const std::vector<StagedFile>& staged, ProgressChannel& channel) {
    for (const StagedFile& file : staged) {
        std::error_code ec;
        std::filesystem::remove(PathFromUtf8(file.temp_path), ec);
        if (ec) {
            channel.Log("Failed to remove the temporary file '" + file.temp_path + "'. ERROR: " + ec.message());
        }
    }
}

struct EntryFailure {
    PackStatus status = PackStatus::Ok;
    std::string message;
};

EntryFailure Fail(const PackStatus status, std::string message) {
    return EntryFailure{status, std::move(message)};
}

// Decodes one entry into a fresh staging file. The staging pair is recorded
// before any payload is written so a failure can still clean it up.
EntryFailure StageEntry(
    InflateSource& source,
    KeyStream& key,
    const std::filesystem::path& base,
    const std::filesystem::path& staging_dir,
    std::vector<std::uint8_t>& buffer,
    std::vector<StagedFile>& staged) {
    std::array<std::uint8_t, 4> path_length_be{};
    if (!ReadDecrypted(source, key, path_length_be)) {
        return Fail(PackStatus::TruncatedArchive, "the archive ended before the entry path length");
    }
    const std::int32_t unit_count = FromBig32(path_length_be);
    if (unit_count <= 0 || static_cast<std::size_t>(unit_count) > kMaxPathUnits) {
        return Fail(PackStatus::InvalidArchive, "invalid entry path length " + std::to_string(unit_count));
    }

    std::u16string units;
    std::uint64_t remaining = static_cast<std::uint64_t>(unit_count) * 2U;
    while (remaining > 0) {
        const std::size_t chunk = remaining > buffer.size() ? buffer.size() : static_cast<std::size_t>(remaining);
        if (!ReadDecrypted(source, key, buffer.data(), chunk)) {
            return Fail(PackStatus::TruncatedArchive, "the archive ended inside an entry path");
        }
        for (std::size_t i = 0; i + 1U < chunk; i += 2U) {
            units.push_back(static_cast<char16_t>((buffer[i] << 8U) | buffer[i + 1U]));
        }
        remaining -= chunk;
    }

    const std::string rel = Utf16ToUtf8(units);
    std::filesystem::path final_path;
    if (!ArchiveReader::ValidateRelativePath(rel) || !ResolveFinalPath(base, rel, final_path)) {
        return Fail(PackStatus::InvalidArchive, "unsafe entry path '" + rel + "'");
    }

    std::array<std::uint8_t, 8> payload_length_be{};
    if (!ReadDecrypted(source, key, payload_length_be)) {
        return Fail(PackStatus::TruncatedArchive, "the archive ended before the length of '" + rel + "'");
    }
    const std::int64_t payload_length = FromBig64(payload_length_be);
    if (payload_length < 0) {
        return Fail(PackStatus::InvalidArchive, "negative payload length for '" + rel + "'");
    }

    const std::filesystem::path temp_path = MakeStagingPath(staging_dir);
    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return Fail(PackStatus::FileIOError, "unable to create a temporary file for '" + rel + "'");
    }
    staged.push_back(StagedFile{Utf8FromPath(temp_path), Utf8FromPath(final_path)});

    remaining = static_cast<std::uint64_t>(payload_length);
    while (remaining > 0) {
        const std::size_t chunk = remaining > buffer.size() ? buffer.size() : static_cast<std::size_t>(remaining);
        if (!ReadDecrypted(source, key, buffer.data(), chunk)) {
            return Fail(
                PackStatus::TruncatedArchive,
                std::to_string(remaining) + " bytes of '" + rel + "' are left to be read but the archive ended");
        }
        out.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(chunk));
        if (!out.good()) {
            return Fail(PackStatus::FileIOError, "unable to write the temporary file for '" + rel + "'");
        }
        remaining -= chunk;
    }

    out.close();
    if (out.fail()) {
        return Fail(PackStatus::FileIOError, "unable to finish the temporary file for '" + rel + "'");
    }
    return {};
}

}  // namespace

PackStatus ArchiveReader::Stage(
    std::istream& in,
    KeyStream& key,
    const std::string& destination_root,
    ProgressChannel& channel,
    const ArchiveOptions& options,
    std::vector<StagedFile>& out_staged) {
    out_staged.clear();

    std::error_code ec;
    const std::filesystem::path base = std::filesystem::absolute(PathFromUtf8(destination_root), ec).lexically_normal();
    if (ec) {
        channel.Log("Invalid destination directory '" + destination_root + "'. ERROR: " + ec.message());
        return PackStatus::InvalidPath;
    }
    const std::filesystem::path staging_dir = StagingDirectory(options, base);

    std::vector<std::uint8_t> buffer(EffectiveBufferSize(options), 0U);
    std::vector<StagedFile> staged;
    PackStatus status = PackStatus::Ok;

    try {
        InflateSource source(in);

        std::array<std::uint8_t, 4> count_be{};
        if (!ReadDecrypted(source, key, count_be)) {
            channel.Log("Decryption failed, the archive ended before the file count. Is the cipher key correct?");
            return PackStatus::TruncatedArchive;
        }
        const std::int32_t file_count = FromBig32(count_be);
        if (file_count < 0) {
            channel.Log("Decryption failed, the archive declares an invalid file count. Is the cipher key correct?");
            return PackStatus::InvalidArchive;
        }

        const float share = file_count > 0 ? 0.75F / static_cast<float>(file_count) : 0.0F;
        for (std::int32_t i = 0; i < file_count; ++i) {
            const EntryFailure failure = StageEntry(source, key, base, staging_dir, buffer, staged);
            if (failure.status != PackStatus::Ok) {
                channel.Log(
                    "Decryption failed to process internal file " + std::to_string(i + 1) + " of " +
                    std::to_string(file_count) + ". Is the cipher key correct? ERROR: " + failure.message);
                status = failure.status;
                break;
            }
            channel.AddProgress(share);
        }
        if (status == PackStatus::Ok) {
            source.Finish();
            if (file_count == 0) {
                channel.AddProgress(0.75F);
            }
        }
    } catch (const CryptoPP::Inflator::UnexpectedEndErr& e) {
        channel.Log(std::string("Decryption failed, the archive is truncated. ERROR: ") + e.what());
        status = PackStatus::TruncatedArchive;
    } catch (const CryptoPP::FileStore::ReadErr& e) {
        channel.Log(std::string("Decryption failed to read the archive. ERROR: ") + e.what());
        status = PackStatus::FileIOError;
    } catch (const CryptoPP::Exception& e) {
        channel.Log(std::string("Decryption failed, the archive is damaged. Is the cipher key correct? ERROR: ") + e.what());
        status = PackStatus::InvalidArchive;
    }

    if (status != PackStatus::Ok) {
        RemoveStaged(staged, channel);
        return status;
    }
    out_staged = std::move(staged);
    return PackStatus::Ok;
}

PackStatus ArchiveReader::Relocate(const std::vector<StagedFile>& staged, ProgressChannel& channel) {
    if (staged.empty()) {
        channel.AddProgress(0.25F);
        return PackStatus::Ok;
    }

    const float share = 0.25F / static_cast<float>(staged.size());
    PackStatus status = PackStatus::Ok;
    for (const StagedFile& file : staged) {
        const std::filesystem::path temp = PathFromUtf8(file.temp_path);
        const std::filesystem::path target = PathFromUtf8(file.final_path);

        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (!ec) {
            std::error_code remove_ec;
            // An existing file that cannot be removed makes the move fail.
            std::filesystem::remove(target, remove_ec);
            MoveFile(temp, target, ec);
        }
        if (ec) {
            channel.Log(
                "Decryption operation failed to relocate decrypted file to '" + file.final_path + "'. ERROR: " +
                ec.message());
            status = PackStatus::FileIOError;

            std::error_code cleanup_ec;
            std::filesystem::remove(temp, cleanup_ec);
            if (cleanup_ec) {
                channel.Log("Failed to remove the temporary file '" + file.temp_path + "'. ERROR: " + cleanup_ec.message());
            }
        }
        channel.AddProgress(share);
    }
    return status;
}

PackStatus ArchiveReader::Read(
    std::istream& in,
    KeyStream& key,
    const std::string& destination_root,
    ProgressChannel& channel,
    const ArchiveOptions& options) {
    std::vector<StagedFile> staged;
    const PackStatus status = Stage(in, key, destination_root, channel, options, staged);
    if (status != PackStatus::Ok) {
        return status;
    }
    return Relocate(staged, channel);
}

PackStatus ArchiveReader::ReadFile(
    const std::string& archive_path,
    KeyStream& key,
    const std::string& destination_root,
    ProgressChannel& channel,
    const ArchiveOptions& options) {
    std::ifstream in(PathFromUtf8(archive_path), std::ios::binary);
    if (!in.is_open()) {
        channel.Log("Unable to open the archive file '" + archive_path + "'");
        return PackStatus::FileIOError;
    }
    return Read(in, key, destination_root, channel, options);
}

bool ArchiveReader::ValidateRelativePath(const std::string& path) {
    if (path.empty()) {
        return false;
    }
    if (path[0] == '/' || path[0] == '\\') {
        return false;
    }
    if (path.size() >= 2 && path[1] == ':') {
        return false;
    }
    if (path.find('\\') != std::string::npos) {
        return false;
    }

    std::size_t start = 0;
    while (start <= path.size()) {
        const std::size_t pos = path.find('/', start);
        const std::size_t end = pos == std::string::npos ? path.size() : pos;
        if (end == start) {
            return false;
        }
        const std::string_view part(path.data() + start, end - start);
        if (part == "." || part == "..") {
            return false;
        }
        if (pos == std::string::npos) {
            break;
        }
        start = pos + 1;
    }
    return true;
}

}  // namespace keypack
