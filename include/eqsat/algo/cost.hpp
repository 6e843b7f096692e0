/*
 * Copyright (c) 2022-Present Trail of Bits, Inc.
 */

#pragma once

#include <eqsat/core/common.hpp>

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <functional>

namespace eqsat
{
    //
    // Cost function computes cost of a node given the best costs of its
    // children classes. Costs have to be totally ordered, lower is better,
    // and a node never costs less than any of its children.
    //
    template< typename function_t, typename node_type >
    concept cost_function = std::totally_ordered< typename function_t::cost_type >
        && requires (
            const function_t &fn,
            const node_type &n,
            std::function< typename function_t::cost_type(eclass_id) > child_cost
        ) {
            { fn(n, child_cost) } -> std::convertible_to< typename function_t::cost_type >;
        };

    // number of nodes of the term
    struct ast_size {
        using cost_type = std::size_t;

        template< typename node_type, typename child_cost_t >
        cost_type operator()(const node_type &n, child_cost_t &&child_cost) const {
            cost_type cost = 1;
            for (auto child : n.children) {
                cost += child_cost(child);
            }
            return cost;
        }
    };

    // height of the term
    struct ast_depth {
        using cost_type = std::size_t;

        template< typename node_type, typename child_cost_t >
        cost_type operator()(const node_type &n, child_cost_t &&child_cost) const {
            cost_type depth = 0;
            for (auto child : n.children) {
                depth = std::max(depth, child_cost(child));
            }
            return depth + 1;
        }
    };

} // namespace eqsat
