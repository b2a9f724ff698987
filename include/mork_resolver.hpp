// mork_resolver.hpp - Mork database reader - Reference resolution
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef MORK_RESOLVER_HPP
#define MORK_RESOLVER_HPP

#include "mork_core.hpp"
#include "mork_syntax.hpp"
#include "mork_escape.hpp"
#include "mork_dictionary.hpp"

namespace mork
{
//========================================================================
// Build errors
//========================================================================

    enum class build_error_kind
    {
        undefined_namespace,
        undefined_alias,
        missing_namespace,
        multiple_meta_dicts,
        row_not_found,
    // warnings
        ignored_cut,
        ignored_truncation,
        ignored_meta,
        skipped_item,
    };

    using build_error = error<build_error_kind>;

    inline bool is_fatal(build_error_kind k)
    {
        switch (k)
        {
            case build_error_kind::undefined_namespace:
            case build_error_kind::undefined_alias:
            case build_error_kind::missing_namespace:
            case build_error_kind::multiple_meta_dicts:
            case build_error_kind::row_not_found:
                return true;
            case build_error_kind::ignored_cut:
            case build_error_kind::ignored_truncation:
            case build_error_kind::ignored_meta:
            case build_error_kind::skipped_item:
                return false;
        }
        return true;
    }

    inline std::string_view to_string(build_error_kind k)
    {
        switch (k)
        {
            case build_error_kind::undefined_namespace: return "undefined namespace";
            case build_error_kind::undefined_alias:     return "undefined alias";
            case build_error_kind::missing_namespace:   return "no namespace determined";
            case build_error_kind::multiple_meta_dicts: return "multiple meta-dicts";
            case build_error_kind::row_not_found:       return "row not found";
            case build_error_kind::ignored_cut:         return "cut marker ignored";
            case build_error_kind::ignored_truncation:  return "truncation marker ignored";
            case build_error_kind::ignored_meta:        return "meta record ignored";
            case build_error_kind::skipped_item:        return "item skipped";
        }
        return "unknown";
    }

//========================================================================
// resolver
//========================================================================

    // An identifier with its namespace looked up; scope is empty when the
    // source gave none and the caller has to pick a default.
    struct resolved_id
    {
        std::string                id;
        std::optional<std::string> scope;
    };

    // Turns raw ids, references and cell terms into plain strings using the
    // dictionaries as they stand right now. A failed lookup is recorded as a
    // fatal error and reported back as nullopt.
    class resolver
    {
    public:
        resolver(dictionary_store const & dicts, std::vector<build_error> & errors)
            : dicts_(dicts)
            , errors_(errors)
        {}

        void set_location(item_location loc) noexcept { loc_ = loc; }

        std::optional<std::string> deref(syntax::object_ref const & ref, std::string_view default_scope);
        std::optional<resolved_id> resolve_id(syntax::object_id const & oid);
        std::optional<std::string> resolve_term(syntax::term const & t, std::string_view default_scope);
        std::optional<cell_value>  resolve_cell(syntax::cell const & c);

    private:
        dictionary_store const &   dicts_;
        std::vector<build_error> & errors_;
        item_location              loc_ {};

        void fail(build_error_kind kind, std::string message);
    };

//========================================================================
// Implementation
//========================================================================

    inline void resolver::fail(build_error_kind kind, std::string message)
    {
        errors_.push_back({ kind, loc_, std::move(message) });
    }

//---------------------------------------------------------------------------

    inline std::optional<std::string>
    resolver::deref(syntax::object_ref const & ref, std::string_view default_scope)
    {
        std::string_view scope = ref.scope ? std::string_view(*ref.scope) : default_scope;

        auto dict = dicts_.find_namespace(scope);
        if (!dict)
        {
            fail(build_error_kind::undefined_namespace,
                 "no dictionary for namespace '" + std::string(scope) + "' (^" + ref.alias + ")");
            return std::nullopt;
        }

        auto v = dict->find(ref.alias);
        if (!v)
        {
            fail(build_error_kind::undefined_alias,
                 "alias ^" + ref.alias + " is not defined in namespace '" + std::string(scope) + "'");
            return std::nullopt;
        }

        return std::string(*v);
    }

//---------------------------------------------------------------------------

    // id:^alias means "my namespace is whatever alias currently stands for
    // in dictionary c".
    inline std::optional<resolved_id> resolver::resolve_id(syntax::object_id const & oid)
    {
        resolved_id out;
        out.id = oid.id;

        if (std::holds_alternative<std::string>(oid.scope))
        {
            out.scope = std::get<std::string>(oid.scope);
        }
        else if (std::holds_alternative<syntax::object_ref>(oid.scope))
        {
            auto scope = deref(std::get<syntax::object_ref>(oid.scope), detail::DEFAULT_COLUMN_SCOPE);
            if (!scope)
                return std::nullopt;
            out.scope = std::move(*scope);
        }

        return out;
    }

//---------------------------------------------------------------------------

    inline std::optional<std::string>
    resolver::resolve_term(syntax::term const & t, std::string_view default_scope)
    {
        if (std::holds_alternative<syntax::object_ref>(t))
            return deref(std::get<syntax::object_ref>(t), default_scope);

        return unescape(std::get<std::string>(t));
    }

//---------------------------------------------------------------------------

    inline std::optional<cell_value> resolver::resolve_cell(syntax::cell const & c)
    {
        auto column = resolve_term(c.column, detail::DEFAULT_COLUMN_SCOPE);
        if (!column)
            return std::nullopt;

        auto value = resolve_term(c.value, detail::DEFAULT_VALUE_SCOPE);
        if (!value)
            return std::nullopt;

        return cell_value{ std::move(*column), std::move(*value) };
    }

} // namespace mork

#endif // MORK_RESOLVER_HPP
