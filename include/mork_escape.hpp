// mork_escape.hpp - Mork database reader - Literal unescaping
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef MORK_ESCAPE_HPP
#define MORK_ESCAPE_HPP

#include "mork_core.hpp"

namespace mork
{
//========================================================================
// UNESCAPE API
//========================================================================

    // Inverts Mork literal escaping, scanning left to right:
    //   $XX         -> the byte 0xXX
    //   \<CR><LF>   -> nothing (line continuation)
    //   \<LF>       -> nothing (line continuation)
    //   \x          -> x, for any other character
    // Anything else, including a '$' without two hex digits or a trailing
    // lone backslash, is copied through unchanged.
    std::string unescape(std::string_view raw);

//========================================================================
// Implementation
//========================================================================

    inline std::string unescape(std::string_view raw)
    {
        using namespace detail;

        std::string out;
        out.reserve(raw.size());

        size_t i = 0;
        while (i < raw.size())
        {
            char c = raw[i];

            if (c == '$' && i + 2 < raw.size() && is_hex_digit(raw[i + 1]) && is_hex_digit(raw[i + 2]))
            {
                out += static_cast<char>(hex_value(raw[i + 1]) * 16 + hex_value(raw[i + 2]));
                i += 3;
                continue;
            }

            if (c == '\\' && i + 1 < raw.size())
            {
                if (raw[i + 1] == '\r' && i + 2 < raw.size() && raw[i + 2] == '\n')
                {
                    i += 3;
                    continue;
                }

                if (raw[i + 1] != '\n')
                    out += raw[i + 1];

                i += 2;
                continue;
            }

            out += c;
            ++i;
        }

        return out;
    }

} // namespace mork

#endif // MORK_ESCAPE_HPP
