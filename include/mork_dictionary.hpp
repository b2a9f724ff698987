// mork_dictionary.hpp - Mork database reader - Alias dictionaries
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef MORK_DICTIONARY_HPP
#define MORK_DICTIONARY_HPP

#include "mork_core.hpp"
#include <map>

namespace mork
{
//========================================================================
// Seed configuration
//========================================================================

    // Every seeded namespace starts out mapping the aliases first..last to
    // the single character with that code point.
    struct dictionary_seed
    {
        std::vector<std::string> namespaces { "a", "c" };
        unsigned                 first      = 0x00;
        unsigned                 last       = 0x7F;
        bool                     zero_pad   = false;   // "0A" rather than "A"
    };

//========================================================================
// dictionary
//========================================================================

    class dictionary
    {
    public:
        using entry_map = std::map<std::string, std::string, std::less<>>;

        dictionary() = default;
        explicit dictionary(dictionary_seed const & seed);

        std::optional<std::string_view> find(std::string_view alias) const noexcept;

        void set(std::string alias, std::string value);
        void overlay(entry_map const & entries);

        size_t size() const noexcept { return entries_.size(); }
        entry_map const & entries() const noexcept { return entries_; }

    private:
        entry_map entries_;
    };

//========================================================================
// dictionary_store
//========================================================================

    class dictionary_store
    {
    public:
        dictionary_store() : dictionary_store(dictionary_seed{}) {}
        explicit dictionary_store(dictionary_seed seed);

        dictionary const * find_namespace(std::string_view scope) const noexcept;
        bool has_namespace(std::string_view scope) const noexcept
        {
            return find_namespace(scope) != nullptr;
        }

        std::optional<std::string_view> get(std::string_view scope, std::string_view alias) const noexcept;

        // Creates the namespace (seeded) when absent, then overlays entries.
        void merge(std::string const & scope, dictionary::entry_map const & entries);

        std::vector<std::string> namespace_names() const;
        size_t namespace_count() const noexcept { return dicts_.size(); }

    private:
        dictionary_seed                               seed_;
        std::map<std::string, dictionary, std::less<>> dicts_;
    };

//========================================================================
// Implementation
//========================================================================

    inline dictionary::dictionary(dictionary_seed const & seed)
    {
        for (unsigned v = seed.first; v <= seed.last && v <= 0xFF; ++v)
            entries_[detail::to_hex(v, seed.zero_pad)] = std::string(1, static_cast<char>(v));
    }

    inline std::optional<std::string_view> dictionary::find(std::string_view alias) const noexcept
    {
        if (auto it = entries_.find(alias); it != entries_.end())
            return std::string_view(it->second);
        return std::nullopt;
    }

    inline void dictionary::set(std::string alias, std::string value)
    {
        entries_.insert_or_assign(std::move(alias), std::move(value));
    }

    inline void dictionary::overlay(entry_map const & entries)
    {
        for (auto const & [alias, value] : entries)
            entries_.insert_or_assign(alias, value);
    }

//---------------------------------------------------------------------------

    inline dictionary_store::dictionary_store(dictionary_seed seed)
        : seed_(std::move(seed))
    {
        for (auto const & ns : seed_.namespaces)
            dicts_.try_emplace(ns, seed_);
    }

    inline dictionary const * dictionary_store::find_namespace(std::string_view scope) const noexcept
    {
        if (auto it = dicts_.find(scope); it != dicts_.end())
            return &it->second;
        return nullptr;
    }

    inline std::optional<std::string_view>
    dictionary_store::get(std::string_view scope, std::string_view alias) const noexcept
    {
        if (auto d = find_namespace(scope))
            return d->find(alias);
        return std::nullopt;
    }

    inline void dictionary_store::merge(std::string const & scope, dictionary::entry_map const & entries)
    {
        auto it = dicts_.try_emplace(scope, seed_).first;
        it->second.overlay(entries);
    }

    inline std::vector<std::string> dictionary_store::namespace_names() const
    {
        std::vector<std::string> names;
        names.reserve(dicts_.size());
        for (auto const & [name, d] : dicts_)
            names.push_back(name);
        return names;
    }

} // namespace mork

#endif // MORK_DICTIONARY_HPP
