#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace keypack {

// Archive layout, all integers big-endian and every byte passed through the
// KeyStream before it reaches the gzip container:
//
//   int32  entry count
//   entry* int32  relative path length in UTF-16 code units
//          uint16 code unit (x length)
//          int64  payload length
//          byte   payload (x length)
//
// There is no magic number and no integrity tag; a wrong key surfaces as an
// impossible length or as garbage content.

constexpr std::size_t kDefaultBufferSize = 1024 * 1024;
constexpr std::size_t kMinBufferSize = 2;
constexpr unsigned int kDefaultCompressionLevel = 6;
constexpr unsigned int kMaxCompressionLevel = 9;
// Longest relative path accepted in either direction, in code units.
constexpr std::size_t kMaxPathUnits = 32767;

struct ArchiveOptions {
    // Upper bound of every working buffer.
    std::size_t buffer_size = kDefaultBufferSize;
    unsigned int compression_level = kDefaultCompressionLevel;
    // Where decoded files are staged; empty selects the system temp directory.
    std::string staging_dir;
};

inline std::size_t EffectiveBufferSize(const ArchiveOptions& options) {
    std::size_t size = options.buffer_size < kMinBufferSize ? kMinBufferSize : options.buffer_size;
    // Whole code units only.
    return size - (size % 2U);
}

}  // namespace keypack
