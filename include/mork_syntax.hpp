// mork_syntax.hpp - Mork database reader - Syntax tree
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

// The tree produced by a Mork grammar. Nothing here is resolved: ids,
// namespaces and cell contents are exactly as written in the file.

#ifndef MORK_SYNTAX_HPP
#define MORK_SYNTAX_HPP

#include "mork_core.hpp"

namespace mork::syntax
{
//========================================================================
// References and identifiers
//========================================================================

    // ^alias or ^alias:scope
    struct object_ref
    {
        std::string                alias;
        std::optional<std::string> scope;
    };

    // id, id:scope or id:^alias
    struct object_id
    {
        std::string id;
        std::variant<std::monostate, std::string, object_ref> scope;
    };

    // Literal text or a symbolic reference
    using term = std::variant<std::string, object_ref>;

//========================================================================
// Cells and records
//========================================================================

    struct cell
    {
        term column;
        term value;
        bool cut = false;
    };

    struct meta_dict
    {
        std::vector<cell> cells;
    };

    // < <(a=c)> (80=foo)(81=bar) >
    struct dict
    {
        std::vector<cell>      cells;
        std::vector<meta_dict> meta;    // the grammar admits several
    };

    // [ id (col=val)... [meta] ]
    struct row
    {
        object_id                        id;
        std::vector<cell>                cells;
        bool                             truncated = false;
        bool                             cut       = false;
        std::optional<std::vector<cell>> meta;
    };

    // { id entry... {meta} }
    struct table
    {
        using entry = std::variant<object_id, row>;

        object_id                        id;
        std::vector<entry>               entries;
        bool                             truncated = false;
        std::optional<std::vector<cell>> meta;
    };

    // Groups, transactions and anything else the builder does not interpret.
    struct other
    {
        std::string kind;
    };

    using item = std::variant<dict, row, table, other>;

    struct document
    {
        std::vector<item> items;    // file order
    };

//========================================================================
// Construction helpers
//========================================================================

    inline object_ref ref(std::string alias)
    {
        return object_ref{ std::move(alias), std::nullopt };
    }

    inline object_ref ref(std::string alias, std::string scope)
    {
        return object_ref{ std::move(alias), std::move(scope) };
    }

    inline object_id oid(std::string id)
    {
        return object_id{ std::move(id), std::monostate{} };
    }

    inline object_id oid(std::string id, std::string scope)
    {
        return object_id{ std::move(id), std::move(scope) };
    }

    inline object_id oid(std::string id, object_ref scope)
    {
        return object_id{ std::move(id), std::move(scope) };
    }

} // namespace mork::syntax

#endif // MORK_SYNTAX_HPP
