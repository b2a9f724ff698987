// mork.hpp - Mork database reader
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

//========================================================================
// Reader Principles:
//========================================================================
//
// The File-Order Principle
// ------------------------
// A Mork file means what it says in the order it says it.
// Dictionaries overlay earlier ones; rows and tables replace earlier ones.
// Nothing may refer forward.
//
//
// The Integrity Principle
// -----------------------
// A reference that cannot be resolved is corruption, not a gap.
// Corruption stops the build; a partial database is never handed out.
//
//
// The Read-Only Principle
// -----------------------
// The reader extracts, it does not replay edits.
// Cut and truncation markers are noted and left unapplied.
//
//========================================================================


#ifndef MORK_DATABASE_READER
#define MORK_DATABASE_READER

#include "mork_core.hpp"
#include "mork_syntax.hpp"
#include "mork_escape.hpp"
#include "mork_dictionary.hpp"
#include "mork_store.hpp"
#include "mork_resolver.hpp"
#include "mork_database.hpp"
#include "mork_builder.hpp"
#include "mork_editor.hpp"

namespace mork
{
//========================================================================
// Error reporting
//========================================================================

    inline std::string describe(build_error const & e)
    {
        std::string out = is_fatal(e.kind) ? "error" : "warning";
        if (e.loc.item != npos())
            out += " in item " + std::to_string(e.loc.item);
        out += ": ";
        out += to_string(e.kind);
        if (!e.message.empty())
            out += " (" + e.message + ")";
        return out;
    }

    inline std::optional<build_error> first_fatal_error(build_context const & ctx)
    {
        for (auto const & e : ctx.errors)
            if (is_fatal(e.kind))
                return e;
        return std::nullopt;
    }

}

#endif
