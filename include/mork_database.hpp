// mork_database.hpp - Mork database reader - Logical database model
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef MORK_DATABASE_HPP
#define MORK_DATABASE_HPP

#include "mork_core.hpp"
#include "mork_dictionary.hpp"
#include "mork_store.hpp"

#include <span>
#include <set>

namespace mork
{
    class database
    {
    public:
        //------------------------------------------------------------------------
        // Public, read-only views
        //------------------------------------------------------------------------

        struct row_view;
        struct table_view;

        //------------------------------------------------------------------------
        // Construction
        //------------------------------------------------------------------------

        database() = default;
        explicit database(dictionary_seed seed)
            : dicts_(std::move(seed))
        {}

        //------------------------------------------------------------------------
        // Dictionaries
        //------------------------------------------------------------------------

        dictionary_store const & dictionaries() const noexcept
        {
            return dicts_;
        }

        //------------------------------------------------------------------------
        // Row access
        //------------------------------------------------------------------------

        size_t row_count() const noexcept
        {
            return rows_.size();
        }

        std::vector<object_key> row_keys() const
        {
            return rows_.keys();
        }

        std::optional<row_view> row(object_key const & key) const;
        std::optional<row_view> row(std::string_view scope, std::string_view id) const;

        //------------------------------------------------------------------------
        // Table access
        //------------------------------------------------------------------------

        size_t table_count() const noexcept
        {
            return tables_.size();
        }

        std::vector<object_key> table_keys() const
        {
            return tables_.keys();
        }

        std::optional<table_view> table(object_key const & key) const;
        std::optional<table_view> table(std::string_view scope, std::string_view id) const;

    private:

        //------------------------------------------------------------------------
        // Internal storage
        //------------------------------------------------------------------------

        dictionary_store          dicts_;
        object_store<mork::row>   rows_;
        object_store<mork::table> tables_;

        friend struct builder;
        friend class editor;
    };

//========================================================================
// Views
//========================================================================

    struct database::row_view
    {
        const database*   db;
        const object_key* k;
        const mork::row*  node;

        object_key const & key() const noexcept
        {
            return *k;
        }

        std::span<const cell_value> cells() const noexcept
        {
            return node->cells;
        }

        std::optional<std::string_view> value(std::string_view column) const
        {
            return node->get(column);
        }

        std::vector<std::string> column_names() const
        {
            std::vector<std::string> names;
            names.reserve(node->cells.size());
            for (auto const & c : node->cells)
                names.push_back(c.column);
            return names;
        }
    };

    struct database::table_view
    {
        const database*    db;
        const object_key*  k;
        const mork::table* node;

        object_key const & key() const noexcept
        {
            return *k;
        }

        std::span<const object_key> row_keys() const noexcept
        {
            return node->rows;
        }

        size_t row_count() const noexcept
        {
            return node->rows.size();
        }

        // Looked up in the row store on every call, so edits made after the
        // build show through.
        std::optional<row_view> row(size_t index) const
        {
            if (index >= node->rows.size())
                return std::nullopt;
            return db->row(node->rows[index]);
        }

        // Union over every row in the table.
        std::vector<std::string> column_names() const
        {
            std::set<std::string> names;
            for (auto const & rk : node->rows)
            {
                if (auto r = db->row(rk))
                    for (auto const & c : r->cells())
                        names.insert(c.column);
            }
            return { names.begin(), names.end() };
        }
    };

//========================================================================
// database member implementations
//========================================================================

    inline std::optional<database::row_view>
    database::row(object_key const & key) const
    {
        auto it = rows_.locate(key);
        if (it == rows_.end())
            return std::nullopt;

        return row_view{ this, &it->first, &it->second };
    }

    inline std::optional<database::row_view>
    database::row(std::string_view scope, std::string_view id) const
    {
        return row(object_key{ std::string(scope), std::string(id) });
    }

    inline std::optional<database::table_view>
    database::table(object_key const & key) const
    {
        auto it = tables_.locate(key);
        if (it == tables_.end())
            return std::nullopt;

        return table_view{ this, &it->first, &it->second };
    }

    inline std::optional<database::table_view>
    database::table(std::string_view scope, std::string_view id) const
    {
        return table(object_key{ std::string(scope), std::string(id) });
    }

} // namespace mork

#endif // MORK_DATABASE_HPP
