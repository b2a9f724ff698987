// mork_builder.hpp - Mork database reader - Logical database builder
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

// Mandatory memory items:
// * Items are processed strictly in file order. Dictionary overlays are
//   order dependent and tables may only name rows built before them.
// * Cut, truncation and meta markers are reported, never applied.
// * A fatal error leaves nothing behind: the returned database is empty.

#ifndef MORK_BUILDER_HPP
#define MORK_BUILDER_HPP

#include "mork_core.hpp"
#include "mork_syntax.hpp"
#include "mork_resolver.hpp"
#include "mork_database.hpp"

#include <type_traits>

namespace mork
{
    struct builder_options
    {
        dictionary_seed seed;
        bool            emit_diagnostics = true;
    };

    using build_context = context<database, build_error>;

    // Facade
    build_context build(syntax::document const & tree, builder_options opts = {});

    inline bool build_failed(build_context const & ctx)
    {
        return std::any_of(ctx.errors.begin(), ctx.errors.end(),
            [](build_error const & e) { return is_fatal(e.kind); });
    }

//========================================================================
// builder
//========================================================================

    struct builder
    {
        builder(syntax::document const & tree,
                builder_options opts);

        build_context run();

    private:
        // Immutable input
        syntax::document const & tree_;
        builder_options          opts_;

        // Output
        build_context            out_;
        database &               db_;

        // State
        resolver                 resolve_;
        item_location            loc_ {};

        // Helpers
        bool handle_dict(syntax::dict const & d);
        bool handle_table(syntax::table const & t);
        void handle_other(syntax::other const & o);
        std::optional<object_key> handle_row(syntax::row const & r,
                                             std::optional<std::string_view> default_scope);

        void note(build_error_kind kind, std::string message);
        bool fail(build_error_kind kind, std::string message);
    };

//========================================================================
// Implementation
//========================================================================

namespace
{
    template <typename>
    inline constexpr bool always_false = false;
}

    inline builder::builder(syntax::document const & tree,
                            builder_options opts)
        : tree_(tree)
        , opts_(std::move(opts))
        , out_{ database(opts_.seed), {} }
        , db_(out_.result)
        , resolve_(db_.dicts_, out_.errors)
    {
    }

    inline build_context builder::run()
    {
        for (size_t i = 0; i < tree_.items.size(); ++i)
        {
            loc_.item = i;
            resolve_.set_location(loc_);

            bool ok = std::visit([this](auto const & node) -> bool
            {
                using T = std::decay_t<decltype(node)>;

                if constexpr (std::is_same_v<T, syntax::dict>)
                    return handle_dict(node);
                else if constexpr (std::is_same_v<T, syntax::row>)
                    return handle_row(node, std::nullopt).has_value();
                else if constexpr (std::is_same_v<T, syntax::table>)
                    return handle_table(node);
                else if constexpr (std::is_same_v<T, syntax::other>)
                {
                    handle_other(node);
                    return true;
                }
                else
                    static_assert(always_false<T>, "unhandled syntax item");
            }, tree_.items[i]);

            if (!ok)
            {
                // Whatever was built so far may be misattributed.
                db_ = database(opts_.seed);
                break;
            }
        }

        return std::move(out_);
    }

//---------------------------------------------------------------------------

    inline void builder::note(build_error_kind kind, std::string message)
    {
        if (opts_.emit_diagnostics)
            out_.errors.push_back({ kind, loc_, std::move(message) });
    }

    inline bool builder::fail(build_error_kind kind, std::string message)
    {
        out_.errors.push_back({ kind, loc_, std::move(message) });
        return false;
    }

//---------------------------------------------------------------------------

    inline bool builder::handle_dict(syntax::dict const & d)
    {
        dictionary::entry_map entries;

        for (auto const & c : d.cells)
        {
            auto cv = resolve_.resolve_cell(c);
            if (!cv)
                return false;

            if (c.cut)
                note(build_error_kind::ignored_cut, "ignoring cut on dictionary cell " + cv->column);

            entries.insert_or_assign(std::move(cv->column), std::move(cv->value));
        }

        if (d.meta.size() > 1)
            return fail(build_error_kind::multiple_meta_dicts,
                        "dictionary has " + std::to_string(d.meta.size()) + " meta-dicts");

        // Only a literal (a=...) cell redirects the namespace. Every other
        // meta cell is left unresolved, so a bad reference there is harmless.
        std::string scope(detail::DEFAULT_VALUE_SCOPE);
        bool scoped = false;
        if (!d.meta.empty())
        {
            for (auto const & c : d.meta.front().cells)
            {
                bool redirects = !scoped
                    && std::holds_alternative<std::string>(c.column)
                    && unescape(std::get<std::string>(c.column)) == detail::META_SCOPE_COLUMN;

                if (!redirects)
                {
                    note(build_error_kind::ignored_meta, "ignoring meta-dict cell");
                    continue;
                }

                auto v = resolve_.resolve_term(c.value, detail::DEFAULT_VALUE_SCOPE);
                if (!v)
                    return false;

                scope  = std::move(*v);
                scoped = true;
            }
        }

        db_.dicts_.merge(scope, entries);
        return true;
    }

//---------------------------------------------------------------------------

    // Inline rows inherit the enclosing table's namespace when they name none
    // of their own. Top-level rows have nothing to inherit.
    inline std::optional<object_key>
    builder::handle_row(syntax::row const & r, std::optional<std::string_view> default_scope)
    {
        mork::row out;

        for (auto const & c : r.cells)
        {
            auto cv = resolve_.resolve_cell(c);
            if (!cv)
                return std::nullopt;

            if (c.cut)
                note(build_error_kind::ignored_cut, "ignoring cut on cell " + cv->column);

            out.set(std::move(cv->column), std::move(cv->value));
        }

        auto rid = resolve_.resolve_id(r.id);
        if (!rid)
            return std::nullopt;

        if (!rid->scope && default_scope)
            rid->scope = std::string(*default_scope);

        if (!rid->scope)
        {
            fail(build_error_kind::missing_namespace, "no namespace determined for row " + r.id.id);
            return std::nullopt;
        }

        object_key key{ std::move(*rid->scope), std::move(rid->id) };

        if (r.truncated)
            note(build_error_kind::ignored_truncation, "ignoring truncation of row " + to_string(key));
        if (r.cut)
            note(build_error_kind::ignored_cut, "ignoring cut of row " + to_string(key));
        if (r.meta)
            note(build_error_kind::ignored_meta, "ignoring meta-row of row " + to_string(key));

        db_.rows_.put(key, std::move(out));
        return key;
    }

//---------------------------------------------------------------------------

    inline bool builder::handle_table(syntax::table const & t)
    {
        auto tid = resolve_.resolve_id(t.id);
        if (!tid)
            return false;

        if (!tid->scope)
            return fail(build_error_kind::missing_namespace, "no namespace determined for table " + t.id.id);

        object_key key{ std::move(*tid->scope), std::move(tid->id) };
        mork::table out;
        out.rows.reserve(t.entries.size());

        for (auto const & entry : t.entries)
        {
            if (std::holds_alternative<syntax::row>(entry))
            {
                auto rk = handle_row(std::get<syntax::row>(entry), key.scope);
                if (!rk)
                    return false;

                out.rows.push_back(std::move(*rk));
                continue;
            }

            auto rid = resolve_.resolve_id(std::get<syntax::object_id>(entry));
            if (!rid)
                return false;

            object_key rk{ rid->scope.value_or(key.scope), std::move(rid->id) };
            if (!db_.rows_.contains(rk))
                return fail(build_error_kind::row_not_found,
                            "table " + to_string(key) + " references row " + to_string(rk) + " before it is defined");

            out.rows.push_back(std::move(rk));
        }

        if (t.truncated)
            note(build_error_kind::ignored_truncation, "ignoring truncation of table " + to_string(key));
        if (t.meta)
            note(build_error_kind::ignored_meta, "ignoring meta-table of table " + to_string(key));

        db_.tables_.put(std::move(key), std::move(out));
        return true;
    }

//---------------------------------------------------------------------------

    inline void builder::handle_other(syntax::other const & o)
    {
        note(build_error_kind::skipped_item, "skipping item of kind '" + o.kind + "'");
    }

//---------------------------------------------------------------------------

    inline build_context build(syntax::document const & tree, builder_options opts)
    {
        builder b(tree, std::move(opts));
        return b.run();
    }

} // namespace mork

#endif // MORK_BUILDER_HPP
