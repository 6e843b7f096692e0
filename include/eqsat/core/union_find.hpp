/*
 * Copyright (c) 2022-Present Trail of Bits, Inc.
 */

#pragma once

#include <eqsat/core/common.hpp>

#include <cstdint>
#include <utility>
#include <vector>

namespace eqsat {

    struct union_find {

        eclass_id make_set() {
            auto id = eclass_id( static_cast< std::uint32_t >(_parents.size()) );
            _parents.push_back(id);
            _sizes.push_back(1);
            return id;
        }

        std::size_t size() const noexcept { return _parents.size(); }

        bool contains(eclass_id id) const noexcept { return id.ref() < _parents.size(); }

        [[nodiscard]] eclass_id parent(eclass_id id) const { return _parents[id.ref()]; }

        // Obtains a root for given id, but does not
        // update union-find hierarchy.
        [[nodiscard]] eclass_id find(eclass_id id) const {
            while (id != parent(id)) {
                id = parent(id);
            }
            return id;
        }

        // Performs 'find' with a path halving
        eclass_id find_compress(eclass_id id) {
            while (id != parent(id)) {
                auto grandparent = parent(parent(id));
                _parents[id.ref()] = grandparent;
                id = grandparent;
            }
            return id;
        }

        std::size_t set_size(eclass_id root) const { return _sizes[root.ref()]; }

        // Merges two roots, the set with fewer members is attached below
        // the larger one. Returns the new root.
        eclass_id merge(eclass_id a, eclass_id b) {
            if (a != parent(a) || b != parent(b)) {
                fatal("union-find merge of non-root ids {} and {}", a.ref(), b.ref());
            }

            if (a == b) {
                return a;
            }

            if (set_size(a) < set_size(b)) {
                std::swap(a, b);
            }

            _parents[b.ref()] = a;
            _sizes[a.ref()] += _sizes[b.ref()];
            return a;
        }

    private:
        std::vector< eclass_id > _parents;
        std::vector< std::size_t > _sizes;
    };

} // namespace eqsat
