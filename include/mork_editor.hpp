// mork_editor.hpp - Mork database reader - Cell value rewriting
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef MORK_EDITOR_HPP
#define MORK_EDITOR_HPP

#include "mork_database.hpp"

#include <functional>

namespace mork
{
    // The one mutation a built database accepts: rewriting the values of
    // existing cells, e.g. turning a hex timestamp into a readable date.
    // Columns are never renamed, and rows and tables are never added or
    // removed. Tables name rows by key, so a rewrite shows through every
    // table holding the row.
    class editor
    {
    public:
        using cell_rewriter = std::function<void(std::string const & column, std::string & value)>;

        explicit editor(database& db) noexcept
            : db_(db)
        {}

    //============================================================
    // Single cells
    //============================================================

        // False if the row or the column does not exist.
        bool set_cell_value( object_key const & row, std::string_view column, std::string value );

    //============================================================
    // Whole rows
    //============================================================

        bool rewrite_cells( object_key const & row, cell_rewriter const & fn );
        size_t rewrite_all_cells( cell_rewriter const & fn );

    private:

        database& db_;
    };

//================================================================================================================
//
// Editor implementations
//
//================================================================================================================

    inline bool editor::set_cell_value( object_key const & row, std::string_view column, std::string value )
    {
        auto r = db_.rows_.find(row);
        if (!r)
            return false;

        for (auto & c : r->cells)
        {
            if (c.column == column)
            {
                c.value = std::move(value);
                return true;
            }
        }

        return false;
    }

    inline bool editor::rewrite_cells( object_key const & row, cell_rewriter const & fn )
    {
        auto r = db_.rows_.find(row);
        if (!r)
            return false;

        for (auto & c : r->cells)
            fn(c.column, c.value);

        return true;
    }

    // Returns the number of rows visited.
    inline size_t editor::rewrite_all_cells( cell_rewriter const & fn )
    {
        size_t n = 0;
        db_.rows_.for_each([&](object_key const &, mork::row & r)
        {
            for (auto & c : r.cells)
                fn(c.column, c.value);
            ++n;
        });
        return n;
    }

} // namespace mork

#endif // MORK_EDITOR_HPP
