#include "keypack/archive_writer.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string>
#include <vector>

#include <cryptopp/cryptlib.h>
#include <cryptopp/files.h>
#include <cryptopp/gzip.h>

#include "keypack/text_codec.hpp"

namespace keypack {

namespace {

void ToBig32(const std::uint32_t value, std::array<std::uint8_t, 4>& out) {
    out[0] = static_cast<std::uint8_t>((value >> 24U) & 0xFFU);
    out[1] = static_cast<std::uint8_t>((value >> 16U) & 0xFFU);
    out[2] = static_cast<std::uint8_t>((value >> 8U) & 0xFFU);
    out[3] = static_cast<std::uint8_t>(value & 0xFFU);
}

void ToBig64(const std::uint64_t value, std::array<std::uint8_t, 8>& out) {
    out[0] = static_cast<std::uint8_t>((value >> 56U) & 0xFFU);
    out[1] = static_cast<std::uint8_t>((value >> 48U) & 0xFFU);
    out[2] = static_cast<std::uint8_t>((value >> 40U) & 0xFFU);
    out[3] = static_cast<std::uint8_t>((value >> 32U) & 0xFFU);
    out[4] = static_cast<std::uint8_t>((value >> 24U) & 0xFFU);
    out[5] = static_cast<std::uint8_t>((value >> 16U) & 0xFFU);
    out[6] = static_cast<std::uint8_t>((value >> 8U) & 0xFFU);
    out[7] = static_cast<std::uint8_t>(value & 0xFFU);
}

template <std::size_t N>
void PutEncrypted(CryptoPP::BufferedTransformation& sink, KeyStream& key, std::array<std::uint8_t, N>& bytes) {
    key.Encrypt(bytes.data(), bytes.size());
    sink.Put(bytes.data(), bytes.size());
}

void PutEncrypted(CryptoPP::BufferedTransformation& sink, KeyStream& key, std::uint8_t* data, const std::size_t count) {
    key.Encrypt(data, count);
    sink.Put(data, count);
}

// Path code units are packed into the working buffer and flushed whenever
// it fills.
void PutRelativePath(
    CryptoPP::BufferedTransformation& sink,
    KeyStream& key,
    const std::u16string& units,
    std::vector<std::uint8_t>& buffer) {
    std::size_t processed = 0;
    do {
        std::size_t usage = 0;
        for (; processed < units.size() && usage + 2U <= buffer.size(); ++processed, usage += 2U) {
            buffer[usage] = static_cast<std::uint8_t>((units[processed] >> 8U) & 0xFFU);
            buffer[usage + 1U] = static_cast<std::uint8_t>(units[processed] & 0xFFU);
        }
        PutEncrypted(sink, key, buffer.data(), usage);
    } while (processed < units.size());
}

PackStatus PutPayload(
    CryptoPP::BufferedTransformation& sink,
    KeyStream& key,
    const FileDescriptor& file,
    std::vector<std::uint8_t>& buffer,
    std::string& out_error) {
    const std::filesystem::path source = PathFromUtf8(file.path);

    std::error_code ec;
    const std::uintmax_t size = std::filesystem::file_size(source, ec);
    if (ec) {
        out_error = ec.message();
        return PackStatus::FileIOError;
    }

    std::ifstream in(source, std::ios::binary);
    if (!in.is_open()) {
        out_error = "unable to open file for reading";
        return PackStatus::FileIOError;
    }

    std::array<std::uint8_t, 8> length_be{};
    ToBig64(static_cast<std::uint64_t>(size), length_be);
    PutEncrypted(sink, key, length_be);

    std::uint64_t remaining = static_cast<std::uint64_t>(size);
    while (remaining > 0) {
        const std::size_t chunk = remaining > buffer.size() ? buffer.size() : static_cast<std::size_t>(remaining);
        in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(chunk));
        if (static_cast<std::size_t>(in.gcount()) != chunk) {
            out_error = std::to_string(remaining) + " bytes were expected but the file ended early";
            return PackStatus::FileIOError;
        }
        PutEncrypted(sink, key, buffer.data(), chunk);
        remaining -= chunk;
    }
    return PackStatus::Ok;
}

}  // namespace

PackStatus ArchiveWriter::Write(
    const FileSet& files,
    KeyStream& key,
    std::ostream& out,
    ProgressChannel& channel,
    const ArchiveOptions& options) {
    if (files.Empty()) {
        channel.Log("Can't start encryption operation. No files were identified for encryption");
        return PackStatus::NoFilesIdentified;
    }
    if (files.Count() > static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max())) {
        channel.Log("Can't start encryption operation. Too many files were identified");
        return PackStatus::InvalidArgument;
    }

    std::vector<std::uint8_t> buffer(EffectiveBufferSize(options), 0U);
    const float share = 1.0F / static_cast<float>(files.Count());
    const unsigned int level = std::min(options.compression_level, kMaxCompressionLevel);

    try {
        CryptoPP::Gzip gzip(new CryptoPP::FileSink(out), level);

        std::array<std::uint8_t, 4> count_be{};
        ToBig32(static_cast<std::uint32_t>(files.Count()), count_be);
        PutEncrypted(gzip, key, count_be);

        for (const FileDescriptor& file : files.files) {
            const std::u16string units = Utf8ToUtf16(file.relative_path);
            if (units.size() > kMaxPathUnits) {
                channel.Log("Encryption failed to process the file '" + file.path + "'. ERROR: path is too long");
                return PackStatus::InvalidPath;
            }

            std::array<std::uint8_t, 4> path_length_be{};
            ToBig32(static_cast<std::uint32_t>(units.size()), path_length_be);
            PutEncrypted(gzip, key, path_length_be);
            PutRelativePath(gzip, key, units, buffer);

            std::string error;
            const PackStatus status = PutPayload(gzip, key, file, buffer, error);
            if (status != PackStatus::Ok) {
                channel.Log("Encryption failed to process the file '" + file.path + "'. ERROR: " + error);
                return status;
            }
            channel.AddProgress(share);
        }

        gzip.MessageEnd();
    } catch (const CryptoPP::Exception& e) {
        channel.Log(std::string("Unexpected error occurred, unable to complete encryption operation. ERROR: ") + e.what());
        return PackStatus::FileIOError;
    }

    out.flush();
    if (!out.good()) {
        channel.Log("Unexpected error occurred, unable to complete encryption operation. ERROR: archive write failed");
        return PackStatus::FileIOError;
    }
    return PackStatus::Ok;
}

PackStatus ArchiveWriter::WriteFile(
    const FileSet& files,
    KeyStream& key,
    const std::string& destination_path,
    ProgressChannel& channel,
    const ArchiveOptions& options) {
    const std::filesystem::path destination = PathFromUtf8(destination_path);

    std::ofstream out(destination, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        channel.Log("Unable to create the archive file '" + destination_path + "'");
        return PackStatus::FileIOError;
    }

    PackStatus status = Write(files, key, out, channel, options);
    out.close();
    if (status == PackStatus::Ok && out.fail()) {
        channel.Log("Unable to finish writing the archive file '" + destination_path + "'");
        status = PackStatus::FileIOError;
    }

    if (status != PackStatus::Ok) {
        std::error_code ec;
        std::filesystem::remove(destination, ec);
        if (ec) {
            channel.Log("Failed to remove the partial archive '" + destination_path + "'. ERROR: " + ec.message());
        }
    }
    return status;
}

}  // namespace keypack
