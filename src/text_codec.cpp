#include "keypack/text_codec.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

#include <cryptopp/osrng.h>

namespace keypack {

namespace {

constexpr char32_t kReplacement = 0xFFFDU;

bool IsContinuation(const unsigned char c) {
    return (c & 0xC0U) == 0x80U;
}

// Decodes one scalar value starting at pos and advances pos past it.
char32_t DecodeOne(const std::string_view input, std::size_t& pos) {
    const auto lead = static_cast<unsigned char>(input[pos]);
    if (lead < 0x80U) {
        ++pos;
        return lead;
    }

    std::size_t extra = 0;
    char32_t value = 0;
    char32_t min_value = 0;
    if ((lead & 0xE0U) == 0xC0U) {
        extra = 1;
        value = lead & 0x1FU;
        min_value = 0x80U;
    } else if ((lead & 0xF0U) == 0xE0U) {
        extra = 2;
        value = lead & 0x0FU;
        min_value = 0x800U;
    } else if ((lead & 0xF8U) == 0xF0U) {
        extra = 3;
        value = lead & 0x07U;
        min_value = 0x10000U;
    } else {
        ++pos;
        return kReplacement;
    }

    std::size_t i = 1;
    for (; i <= extra; ++i) {
        if (pos + i >= input.size() || !IsContinuation(static_cast<unsigned char>(input[pos + i]))) {
            pos += i;
            return kReplacement;
        }
        value = (value << 6U) | (static_cast<unsigned char>(input[pos + i]) & 0x3FU);
    }
    pos += i;

    if (value < min_value || value > 0x10FFFFU || (value >= 0xD800U && value <= 0xDFFFU)) {
        return kReplacement;
    }
    return value;
}

void AppendUtf8(std::string& out, const char32_t cp) {
    if (cp < 0x80U) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800U) {
        out.push_back(static_cast<char>(0xC0U | (cp >> 6U)));
        out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    } else if (cp < 0x10000U) {
        out.push_back(static_cast<char>(0xE0U | (cp >> 12U)));
        out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
        out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    } else {
        out.push_back(static_cast<char>(0xF0U | (cp >> 18U)));
        out.push_back(static_cast<char>(0x80U | ((cp >> 12U) & 0x3FU)));
        out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
        out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    }
}

}  // namespace

std::u16string Utf8ToUtf16(const std::string_view input) {
    std::u16string out;
    out.reserve(input.size());
    std::size_t pos = 0;
    while (pos < input.size()) {
        const char32_t cp = DecodeOne(input, pos);
        if (cp >= 0x10000U) {
            const char32_t v = cp - 0x10000U;
            out.push_back(static_cast<char16_t>(0xD800U + (v >> 10U)));
            out.push_back(static_cast<char16_t>(0xDC00U + (v & 0x3FFU)));
        } else {
            out.push_back(static_cast<char16_t>(cp));
        }
    }
    return out;
}

std::string Utf16ToUtf8(const std::u16string_view input) {
    std::string out;
    out.reserve(input.size());
    for (std::size_t i = 0; i < input.size(); ++i) {
        const char16_t unit = input[i];
        if (unit >= 0xD800U && unit <= 0xDBFFU) {
            if (i + 1 < input.size() && input[i + 1] >= 0xDC00U && input[i + 1] <= 0xDFFFU) {
                const char32_t cp =
                    0x10000U + ((static_cast<char32_t>(unit) - 0xD800U) << 10U) +
                    (static_cast<char32_t>(input[i + 1]) - 0xDC00U);
                AppendUtf8(out, cp);
                ++i;
                continue;
            }
            AppendUtf8(out, kReplacement);
            continue;
        }
        if (unit >= 0xDC00U && unit <= 0xDFFFU) {
            AppendUtf8(out, kReplacement);
            continue;
        }
        AppendUtf8(out, unit);
    }
    return out;
}

std::filesystem::path PathFromUtf8(const std::string& value) {
#ifdef _WIN32
    const auto* begin = reinterpret_cast<const char8_t*>(value.data());
    const auto* end = begin + value.size();
    return std::filesystem::path(std::u8string(begin, end));
#else
    return std::filesystem::path(value);
#endif
}

std::string Utf8FromPath(const std::filesystem::path& value) {
#ifdef _WIN32
    const std::u8string u8 = value.generic_u8string();
    return std::string(reinterpret_cast<const char*>(u8.data()), u8.size());
#else
    return value.generic_string();
#endif
}

std::string RandomHexName(const std::size_t bytes) {
    static constexpr char kDigits[] = "0123456789abcdef";

    std::vector<std::uint8_t> raw(bytes, 0U);
    if (!raw.empty()) {
        CryptoPP::AutoSeededRandomPool rng;
        rng.GenerateBlock(raw.data(), raw.size());
    }

    std::string out(bytes * 2U, '0');
    for (std::size_t i = 0; i < raw.size(); ++i) {
        out[2U * i] = kDigits[raw[i] >> 4U];
        out[2U * i + 1U] = kDigits[raw[i] & 0x0FU];
    }
    return out;
}

}  // namespace keypack
