/*
 * Copyright (c) 2022-Present Trail of Bits, Inc.
 */

#pragma once

#include <eqsat/core/common.hpp>

#include <gap/core/hash.hpp>

#include <algorithm>
#include <concepts>
#include <functional>
#include <string>
#include <vector>

namespace eqsat
{
    //
    // Operator payload supplied by the embedding application.
    //
    template< typename storage >
    concept storage_like = std::equality_comparable< storage >
        && requires (const storage &s) {
            { std::hash< storage >{}(s) } -> std::convertible_to< std::size_t >;
            { node_name(s) } -> std::convertible_to< std::string >;
        };

} // namespace eqsat

namespace eqsat::graph
{
    using children_t = std::vector< eclass_id >;

    //
    // enode
    //
    template< storage_like storage >
    struct node {
        using storage_type = storage;

        node(storage op, children_t children = {})
            : op(std::move(op)), children(std::move(children))
        {}

        std::size_t num_of_children() const { return children.size(); }

        bool is_leaf() const { return children.empty(); }

        eclass_id child(std::size_t idx) const { return children[idx]; }

        // same operator applied to the same number of children
        bool matches(const node &other) const {
            return num_of_children() == other.num_of_children() && op == other.op;
        }

        template< typename Fn >
        void update_children(Fn &&fn) {
            for (auto &child : children) {
                child = fn(child);
            }
        }

        template< typename Fn >
        node map_children(Fn &&fn) const {
            node result = *this;
            result.update_children(std::forward< Fn >(fn));
            return result;
        }

        bool operator==(const node &other) const = default;

        storage op;
        children_t children;
    };

    template< typename storage >
    std::string node_name(const node< storage > &n) { return node_name(n.op); }

    template< typename storage >
    gap::hash_code hash_value(gap::hash_code code, const node< storage > &n) {
        code = gap::hash_combine(code, gap::hash_code( std::hash< storage >{}(n.op) ));
        for (auto child : n.children) {
            code = gap::hash_combine(code, gap::hash_code( eclass_id_hash{}(child) ));
        }
        return gap::hash_combine(code, gap::hash_code( n.children.size() ));
    }

    template< typename storage >
    struct node_hash {
        std::size_t operator()(const node< storage > &n) const {
            return hash_value(gap::hash_code( 0 ), n).ref();
        }
    };

} // namespace eqsat::graph
