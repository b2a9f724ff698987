// mork_store.hpp - Mork database reader - Keyed object stores
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef MORK_STORE_HPP
#define MORK_STORE_HPP

#include "mork_core.hpp"
#include <map>

namespace mork
{
    // Holds at most one entity per (namespace, id). Storing under an
    // occupied key replaces the previous entity outright.
    template <typename T>
    class object_store
    {
    public:
        using map_type       = std::map<object_key, T>;
        using const_iterator = typename map_type::const_iterator;

        void put(object_key key, T value)
        {
            items_.insert_or_assign(std::move(key), std::move(value));
        }

        T const * find(object_key const & key) const noexcept
        {
            if (auto it = items_.find(key); it != items_.end())
                return &it->second;
            return nullptr;
        }

        T * find(object_key const & key) noexcept
        {
            if (auto it = items_.find(key); it != items_.end())
                return &it->second;
            return nullptr;
        }

        const_iterator locate(object_key const & key) const
        {
            return items_.find(key);
        }

        bool contains(object_key const & key) const noexcept
        {
            return items_.find(key) != items_.end();
        }

        size_t size() const noexcept { return items_.size(); }

        std::vector<object_key> keys() const
        {
            std::vector<object_key> out;
            out.reserve(items_.size());
            for (auto const & [k, v] : items_)
                out.push_back(k);
            return out;
        }

        const_iterator begin() const noexcept { return items_.begin(); }
        const_iterator end() const noexcept { return items_.end(); }

        // Mutable traversal, values only; keys stay fixed.
        template <typename F>
        void for_each(F && fn)
        {
            for (auto & [k, v] : items_)
                fn(k, v);
        }

    private:
        map_type items_;
    };

} // namespace mork

#endif // MORK_STORE_HPP
