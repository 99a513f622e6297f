#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace keypack {

// Invalid UTF-8 sequences decode to U+FFFD.
std::u16string Utf8ToUtf16(std::string_view input);

// Unpaired surrogates encode as U+FFFD.
std::string Utf16ToUtf8(std::u16string_view input);

std::filesystem::path PathFromUtf8(const std::string& value);

// Generic form, '/' separators on every platform.
std::string Utf8FromPath(const std::filesystem::path& value);

// Lowercase hex of bytes random bytes, for temporary and scrambled names.
std::string RandomHexName(std::size_t bytes);

}  // namespace keypack
