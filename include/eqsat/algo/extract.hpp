/*
 * Copyright (c) 2022-Present Trail of Bits, Inc.
 */

#pragma once

#include <eqsat/algo/cost.hpp>
#include <eqsat/core/egraph.hpp>

#include <spdlog/spdlog.h>

#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace eqsat
{
    //
    // Computes the cheapest node of every class by repeated relaxation
    // passes until no class improves. Classes that never obtain a cost
    // have no finite term.
    //
    // The extractor refers to the graph, which must stay alive and
    // unmodified while it is used.
    //
    template< typename egraph_t, cost_function< typename egraph_t::node_type > cost_function_t >
    struct extractor {
        using node_type   = typename egraph_t::node_type;
        using expr_type   = typename egraph_t::expr_type;
        using eclass_type = typename egraph_t::eclass_type;
        using cost_type   = typename cost_function_t::cost_type;

        explicit extractor(const egraph_t &graph, cost_function_t fn = {})
            : _graph(graph), _cost_fn(std::move(fn))
        {
            if (!graph.is_clean()) {
                throw error("extraction requires a rebuilt egraph");
            }

            find_costs();
        }

        cost_type find_best_cost(eclass_id id) const { return best(id).cost; }

        const node_type &find_best_node(eclass_id id) const { return best(id).node; }

        std::pair< cost_type, expr_type > find_best(eclass_id id) const {
            auto cost = find_best_cost(id);

            expr_type expr;
            std::unordered_map< eclass_id, eclass_id, eclass_id_hash > built;
            std::unordered_set< eclass_id, eclass_id_hash > visiting;
            build(id, expr, built, visiting);

            return { cost, std::move(expr) };
        }

        // cost of node if all its children are extractable
        std::optional< cost_type > node_total_cost(const node_type &n) const {
            for (auto child : n.children) {
                if (!_costs.count(_graph.find(child))) {
                    return std::nullopt;
                }
            }

            return _cost_fn(n, [&] (eclass_id child) -> cost_type {
                return _costs.at(_graph.find(child)).cost;
            });
        }

    private:

        struct best_node {
            cost_type cost;
            node_type node;
        };

        const best_node &best(eclass_id id) const {
            auto it = _costs.find(_graph.find(id));
            if (it == _costs.end()) {
                throw unextractable(fmt::format("eclass {} has no finite term", id.ref()));
            }
            return it->second;
        }

        void find_costs() {
            std::size_t passes = 0;
            for (bool changed = true; changed; ++passes) {
                changed = false;
                for (const auto &cls : _graph.eclasses()) {
                    auto pass = make_pass(cls);
                    if (!pass) {
                        continue;
                    }

                    if (auto it = _costs.find(cls.id); it == _costs.end()) {
                        _costs.emplace(cls.id, std::move(*pass));
                        changed = true;
                    } else if (pass->cost < it->second.cost) {
                        it->second = std::move(*pass);
                        changed = true;
                    }
                }
            }

            spdlog::debug("[eqsat] extraction costs settled after {} passes, {} of {} classes extractable",
                passes, _costs.size(), _graph.num_of_eclasses()
            );
        }

        std::optional< best_node > make_pass(const eclass_type &cls) const {
            std::optional< best_node > result;
            for (const auto &n : cls.nodes) {
                if (auto cost = node_total_cost(n)) {
                    if (!result || *cost < result->cost) {
                        result = best_node{ *cost, n };
                    }
                }
            }
            return result;
        }

        eclass_id build(
            eclass_id id, expr_type &expr,
            std::unordered_map< eclass_id, eclass_id, eclass_id_hash > &built,
            std::unordered_set< eclass_id, eclass_id_hash > &visiting
        ) const {
            auto root = _graph.find(id);
            if (auto it = built.find(root); it != built.end()) {
                return it->second;
            }

            if (!visiting.insert(root).second) {
                throw unextractable(fmt::format("best term of eclass {} is cyclic", root.ref()));
            }

            auto term = best(root).node.map_children([&] (eclass_id child) {
                return build(child, expr, built, visiting);
            });

            visiting.erase(root);
            auto idx = expr.add(std::move(term));
            built.emplace(root, idx);
            return idx;
        }

        const egraph_t &_graph;
        cost_function_t _cost_fn;

        std::unordered_map< eclass_id, best_node, eclass_id_hash > _costs;
    };

} // namespace eqsat
