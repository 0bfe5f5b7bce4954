/**
 * @file Utf8.cpp
 * @brief Strict UTF-8 validator (RFC 3629 well-formed byte sequences).
 *
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#include "zyppy/core/Utf8.hpp"

namespace zyppy::core {

namespace {

constexpr bool isContinuation(u8 byte) noexcept { return (byte & 0xC0u) == 0x80u; }

} // anonymous namespace

std::optional<usize> findInvalidUtf8(std::string_view text) noexcept
{
    const usize size = text.size();
    usize i = 0;

    while (i < size)
    {
        const auto lead = static_cast<u8>(text[i]);

        if (lead < 0x80u)
        {
            ++i;
            continue;
        }

        usize length = 0;
        u8 lo = 0x80u;
        u8 hi = 0xBFu;

        if (lead >= 0xC2u && lead <= 0xDFu)
        {
            length = 2;
        }
        else if (lead >= 0xE0u && lead <= 0xEFu)
        {
            length = 3;
            if (lead == 0xE0u) lo = 0xA0u;      // overlong
            if (lead == 0xEDu) hi = 0x9Fu;      // surrogates
        }
        else if (lead >= 0xF0u && lead <= 0xF4u)
        {
            length = 4;
            if (lead == 0xF0u) lo = 0x90u;      // overlong
            if (lead == 0xF4u) hi = 0x8Fu;      // > U+10FFFF
        }
        else
        {
            return i;
        }

        if (i + length > size)
            return i;

        const auto second = static_cast<u8>(text[i + 1]);
        if (second < lo || second > hi)
            return i;

        for (usize k = 2; k < length; ++k)
        {
            if (!isContinuation(static_cast<u8>(text[i + k])))
                return i;
        }

        i += length;
    }

    return std::nullopt;
}

} // namespace zyppy::core
