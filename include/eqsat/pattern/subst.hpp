/*
 * Copyright (c) 2022-Present Trail of Bits, Inc.
 */

#pragma once

#include <eqsat/core/common.hpp>
#include <eqsat/pattern/syntax.hpp>

#include <gap/core/hash.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace eqsat
{
    //
    // Binding of pattern places to eclasses, kept in insertion order.
    //
    struct subst {
        using binding = std::pair< place_t, eclass_id >;

        // Binds 'place' to 'id', returns the previous binding if there was one.
        std::optional< eclass_id > insert(place_t place, eclass_id id) {
            for (auto &[p, bound] : _bindings) {
                if (p == place) {
                    return std::exchange(bound, id);
                }
            }

            _bindings.emplace_back(std::move(place), id);
            return std::nullopt;
        }

        std::optional< eclass_id > get(const place_t &place) const {
            for (const auto &[p, bound] : _bindings) {
                if (p == place) {
                    return bound;
                }
            }
            return std::nullopt;
        }

        eclass_id at(const place_t &place) const {
            if (auto id = get(place)) {
                return *id;
            }
            throw std::out_of_range("place " + to_string(place) + " is not bound");
        }

        std::size_t size() const { return _bindings.size(); }
        bool empty() const { return _bindings.empty(); }

        auto begin() const { return _bindings.begin(); }
        auto end() const { return _bindings.end(); }

        bool operator==(const subst &other) const = default;

    private:
        std::vector< binding > _bindings;
    };

    static inline gap::hash_code hash_value(gap::hash_code code, const subst &s) {
        for (const auto &[place, id] : s) {
            code = gap::hash_combine(code, gap::hash_code( std::hash< name_t >{}(place.ref()) ));
            code = gap::hash_combine(code, gap::hash_code( eclass_id_hash{}(id) ));
        }
        return code;
    }

    struct subst_hash {
        std::size_t operator()(const subst &s) const {
            return hash_value(gap::hash_code( 0 ), s).ref();
        }
    };

    static inline std::string to_string(const subst &s) {
        std::string out = "{";
        for (const auto &[place, id] : s) {
            if (out.size() > 1) {
                out += ", ";
            }
            out += to_string(place) + ": " + std::to_string(id.ref());
        }
        return out + "}";
    }

} // namespace eqsat
