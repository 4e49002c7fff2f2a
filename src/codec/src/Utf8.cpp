/**
 * @file Utf8.cpp
 * @brief UTF-8 validator.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <zbson/codec/Utf8.hpp>
#include <zbson/core/Types.hpp>

namespace zbson::codec {

namespace {

constexpr bool isContinuation(core::u8 c) noexcept { return (c & 0xC0u) == 0x80u; }

} // anonymous namespace

bool isValidUtf8(std::string_view text) noexcept
{
    const auto* p = reinterpret_cast<const core::u8*>(text.data());
    const auto* e = p + text.size();

    while (p < e)
    {
        const core::u8 c = *p++;

        if (c < 0x80u)
            continue;

        if ((c >> 5) == 0x6)
        {
            if (e - p < 1 || !isContinuation(p[0]))
                return false;

            const core::u32 cp = (c & 0x1Fu) << 6 | (p[0] & 0x3Fu);
            if (cp < 0x80u)
                return false;

            p += 1;
            continue;
        }

        if ((c >> 4) == 0xE)
        {
            if (e - p < 2 || !isContinuation(p[0]) || !isContinuation(p[1]))
                return false;

            const core::u32 cp = (c & 0x0Fu) << 12 | (p[0] & 0x3Fu) << 6 | (p[1] & 0x3Fu);
            if (cp < 0x800u || (cp >= 0xD800u && cp <= 0xDFFFu))
                return false;

            p += 2;
            continue;
        }

        if ((c >> 3) == 0x1E)
        {
            if (e - p < 3 || !isContinuation(p[0]) || !isContinuation(p[1]) ||
                !isContinuation(p[2]))
                return false;

            const core::u32 cp = (c & 0x07u) << 18 | (p[0] & 0x3Fu) << 12 |
                                 (p[1] & 0x3Fu) << 6 | (p[2] & 0x3Fu);
            if (cp < 0x10000u || cp > 0x10FFFFu)
                return false;

            p += 3;
            continue;
        }

        return false;
    }

    return true;
}

} // namespace zbson::codec
