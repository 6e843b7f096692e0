/*
 * Copyright (c) 2022-Present Trail of Bits, Inc.
 */

#pragma once

#include <eqsat/core/common.hpp>

#include <concepts>
#include <variant>

namespace eqsat
{
    // Which side of an analysis merge has been changed by it.
    struct did_merge {
        bool lhs = false;
        bool rhs = false;

        bool any() const { return lhs || rhs; }
    };

    //
    // Analysis attaches a semilattice value to every eclass.
    //
    //   make(graph, node)      derives the value of a single node
    //   merge(into, from)      joins 'from' into 'into', may throw merge_conflict
    //   modify(graph, id)      optional hook called once for each rebuilt class,
    //                          allowed to add and merge, must be idempotent
    //
    template< typename analysis_t, typename egraph_t >
    concept analysis_like = requires (
        analysis_t &a,
        const egraph_t &g,
        const typename egraph_t::node_type &n,
        typename analysis_t::data_type &into,
        typename analysis_t::data_type from
    ) {
        { a.make(g, n) } -> std::convertible_to< typename analysis_t::data_type >;
        { a.merge(into, std::move(from)) } -> std::same_as< did_merge >;
    };

    template< typename analysis_t, typename egraph_t >
    concept modifying_analysis = requires (analysis_t &a, egraph_t &g, eclass_id id) {
        a.modify(g, id);
    };

    struct no_analysis {
        using data_type = std::monostate;

        template< typename egraph_t, typename node_t >
        data_type make(const egraph_t &, const node_t &) const { return {}; }

        did_merge merge(data_type &, data_type) const { return {}; }
    };

} // namespace eqsat
