// mork_core.hpp - Mork database reader - Core Data Structures
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef MORK_CORE_HPP
#define MORK_CORE_HPP

#include <string>
#include <string_view>
#include <vector>
#include <variant>
#include <optional>
#include <algorithm>
#include <compare>

namespace mork
{
//========================================================================
// Keys
//========================================================================

    inline constexpr size_t npos() { return static_cast<size_t>(-1); }

    // (namespace, identifier) pair addressing a row or table.
    struct object_key
    {
        std::string scope;
        std::string id;

        auto operator<=>(object_key const &) const = default;
        bool operator==(object_key const &) const = default;
    };

    inline std::string to_string(object_key const & k)
    {
        return k.id + ":" + k.scope;
    }

//========================================================================
// Entities
//========================================================================

    struct cell_value
    {
        std::string column;
        std::string value;

        bool operator==(cell_value const &) const = default;
    };

    struct row
    {
        std::vector<cell_value> cells;   // first-seen column order

        bool operator==(row const &) const = default;

        // Last write wins; the column keeps its original position.
        void set(std::string column, std::string value)
        {
            auto it = std::find_if(cells.begin(), cells.end(),
                [&](cell_value const & c) { return c.column == column; });

            if (it != cells.end())
                it->value = std::move(value);
            else
                cells.push_back({ std::move(column), std::move(value) });
        }

        std::optional<std::string_view> get(std::string_view column) const
        {
            for (auto const & c : cells)
                if (c.column == column)
                    return std::string_view(c.value);
            return std::nullopt;
        }
    };

    // Tables never own rows; they name them in the row store.
    struct table
    {
        std::vector<object_key> rows;    // authored order

        bool operator==(table const &) const = default;
    };

//========================================================================
// Errors and build context
//========================================================================

    struct item_location
    {
        size_t item = npos();   // index of the top-level item
    };

    template <typename Kind>
    struct error
    {
        Kind          kind;
        item_location loc;
        std::string   message;
    };

    template <typename T, typename Error>
    struct context
    {
        T result;
        std::vector<Error> errors;

        bool has_errors() const { return !errors.empty(); }
    };

//========================================================================
// UTILITY FUNCTIONS
//========================================================================

    namespace detail
    {
        constexpr std::string_view DEFAULT_VALUE_SCOPE  = "a";
        constexpr std::string_view DEFAULT_COLUMN_SCOPE = "c";
        constexpr std::string_view META_SCOPE_COLUMN    = "a";

        inline bool is_hex_digit(char c)
        {
            return (c >= '0' && c <= '9')
                || (c >= 'a' && c <= 'f')
                || (c >= 'A' && c <= 'F');
        }

        inline int hex_value(char c)
        {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

        inline std::string to_hex(unsigned v, bool zero_pad)
        {
            constexpr char digits[] = "0123456789ABCDEF";

            std::string out;
            do
            {
                out.insert(out.begin(), digits[v & 0xF]);
                v >>= 4;
            }
            while (v != 0);

            if (zero_pad && out.size() < 2)
                out.insert(out.begin(), '0');

            return out;
        }
    }

} // namespace mork

#endif // MORK_CORE_HPP
