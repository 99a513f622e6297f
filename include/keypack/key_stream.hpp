#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include <cryptopp/secblock.h>

namespace keypack {

// Repeating additive keystream derived from a passphrase.
//
// Each UTF-16 code unit of the passphrase contributes its low byte then its
// high byte, skipping zero bytes, so an ASCII passphrase of n characters
// yields exactly n key bytes. Encrypt adds the next key byte to each data
// byte (mod 256); Decrypt subtracts it. Both consume the keystream in the
// same order, so a stream must be decrypted from the cursor position it was
// encrypted at. An empty key leaves data unchanged.
//
// Not thread-safe: one instance belongs to one running operation.
class KeyStream {
public:
    explicit KeyStream(std::string_view passphrase);

    static CryptoPP::SecByteBlock Derive(std::string_view passphrase);

    std::uint8_t Next();

    void Encrypt(std::uint8_t* data, std::size_t count);
    void Decrypt(std::uint8_t* data, std::size_t count);

    void Reset();

    std::size_t Cursor() const {
        return cursor_;
    }

    std::size_t Size() const {
        return key_.size();
    }

private:
    CryptoPP::SecByteBlock key_;
    std::size_t cursor_ = 0;
};

}  // namespace keypack
