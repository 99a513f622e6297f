#include "keypack/key_stream.hpp"

#include <string>
#include <vector>

#include <cryptopp/misc.h>

#include "keypack/text_codec.hpp"

namespace keypack {

KeyStream::KeyStream(const std::string_view passphrase) : key_(Derive(passphrase)) {}

CryptoPP::SecByteBlock KeyStream::Derive(const std::string_view passphrase) {
    std::u16string units = Utf8ToUtf16(passphrase);

    std::vector<std::uint8_t> material;
    material.reserve(units.size() * 2U);
    for (const char16_t unit : units) {
        const auto low = static_cast<std::uint8_t>(unit & 0xFFU);
        const auto high = static_cast<std::uint8_t>((unit >> 8U) & 0xFFU);
        if (low != 0U) {
            material.push_back(low);
        }
        if (high != 0U) {
            material.push_back(high);
        }
    }

    if (material.empty()) {
        return CryptoPP::SecByteBlock();
    }
    CryptoPP::SecByteBlock key(material.data(), material.size());
    CryptoPP::memset_z(material.data(), 0, material.size());
    CryptoPP::memset_z(units.data(), 0, units.size() * sizeof(char16_t));
    return key;
}

std::uint8_t KeyStream::Next() {
    if (key_.empty()) {
        return 0U;
    }
    const std::uint8_t value = key_[cursor_];
    cursor_ = (cursor_ + 1U) % key_.size();
    return value;
}

void KeyStream::Encrypt(std::uint8_t* data, const std::size_t count) {
    if (key_.empty()) {
        return;
    }
    for (std::size_t i = 0; i < count; ++i) {
        data[i] = static_cast<std::uint8_t>(data[i] + Next());
    }
}

void KeyStream::Decrypt(std::uint8_t* data, const std::size_t count) {
    if (key_.empty()) {
        return;
    }
    for (std::size_t i = 0; i < count; ++i) {
        data[i] = static_cast<std::uint8_t>(data[i] - Next());
    }
}

void KeyStream::Reset() {
    cursor_ = 0;
}

}  // namespace keypack
