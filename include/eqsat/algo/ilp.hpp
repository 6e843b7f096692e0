/*
 * Copyright (c) 2022-Present Trail of Bits, Inc.
 */

#pragma once

#include <eqsat/algo/extract.hpp>
#include <eqsat/core/egraph.hpp>

#include <spdlog/spdlog.h>

#include <functional>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace eqsat::ilp
{
    enum class var_kind { binary, integer };

    constexpr double infinity = std::numeric_limits< double >::infinity();

    struct variable {
        std::string name;
        var_kind kind;
        double lower;
        double upper;
    };

    struct term {
        std::size_t var;
        double coeff;
    };

    // lower <= sum of terms <= upper
    struct constraint {
        std::vector< term > terms;
        double lower;
        double upper;
    };

    // values of variables indexed as in the problem
    using solution = std::vector< double >;

    //
    // Minimization of a linear objective over integer variables.
    //
    struct problem {
        std::size_t add_variable(std::string name, var_kind kind, double lower, double upper);

        std::size_t add_binary(std::string name) {
            return add_variable(std::move(name), var_kind::binary, 0, 1);
        }

        void add_constraint(std::vector< term > terms, double lower, double upper);

        void add_objective(std::size_t var, double coeff);

        double objective_value(const solution &values) const;

        // checks bounds, integrality and all constraints
        bool is_feasible(const solution &values, double eps = 1e-6) const;

        std::string to_string() const;

        std::vector< variable > variables;
        std::vector< constraint > constraints;
        std::vector< term > objective;
    };

    //
    // Interface to an external integer programming solver.
    //
    struct solver {
        virtual ~solver() = default;

        // optimal solution or nothing when the problem could not be solved
        virtual std::optional< solution > solve(const problem &p) = 0;
    };

} // namespace eqsat::ilp

namespace eqsat
{
    //
    // Extraction posed as an integer program. Every class has an 'active'
    // binary and an integer 'level', every node a 'selected' binary:
    //
    //   sum(selected nodes of c) = active(c)
    //   selected(n) <= active(d)                    for child class d of n
    //   level(c) - level(d) >= 1 - M(1 - selected(n))   for n in c, child d
    //   active(root) = 1
    //
    // The level constraints rule out cyclic selections. The extractor falls
    // back to the relaxation extractor when the solver gives up.
    //
    template< typename egraph_t >
    struct ilp_extractor {
        using node_type = typename egraph_t::node_type;
        using expr_type = typename egraph_t::expr_type;
        using node_cost_type = std::function< double(const node_type &) >;

        explicit ilp_extractor(
            const egraph_t &graph,
            node_cost_type node_cost = [] (const node_type &) { return 1.0; }
        )
            : _graph(graph), _node_cost(std::move(node_cost))
        {
            if (!graph.is_clean()) {
                throw error("extraction requires a rebuilt egraph");
            }
        }

        ilp::problem make_problem(std::span< const eclass_id > roots) {
            ilp::problem p;
            _vars.clear();

            auto num_of_classes = static_cast< double >(_graph.num_of_eclasses());
            auto big_m = num_of_classes + 1;

            for (const auto &cls : _graph.eclasses()) {
                auto idx = cls.id.ref();
                class_vars vars{
                    cls.id,
                    p.add_binary(fmt::format("active_{}", idx)),
                    p.add_variable(fmt::format("level_{}", idx), ilp::var_kind::integer, 0, num_of_classes),
                    {}
                };

                for (std::size_t i = 0; i < cls.nodes.size(); ++i) {
                    vars.nodes.push_back(p.add_binary(fmt::format("node_{}_{}", idx, i)));
                }

                _vars.emplace(cls.id, std::move(vars));
            }

            for (const auto &cls : _graph.eclasses()) {
                const auto &vars = _vars.at(cls.id);

                std::vector< ilp::term > choose{ { vars.active, -1.0 } };
                for (auto node_var : vars.nodes) {
                    choose.push_back({ node_var, 1.0 });
                }
                p.add_constraint(std::move(choose), 0, 0);

                for (std::size_t i = 0; i < cls.nodes.size(); ++i) {
                    const auto &n = cls.nodes[i];
                    auto selected = vars.nodes[i];
                    p.add_objective(selected, _node_cost(n));

                    for (auto child : n.children) {
                        auto root = _graph.find(child);
                        if (root == cls.id) {
                            // node referring to its own class is never part of a finite term
                            p.variables[selected].upper = 0;
                            continue;
                        }

                        const auto &child_vars = _vars.at(root);
                        p.add_constraint({ { child_vars.active, 1.0 }, { selected, -1.0 } }, 0, ilp::infinity);
                        p.add_constraint(
                            { { vars.level, 1.0 }, { child_vars.level, -1.0 }, { selected, -big_m } },
                            1 - big_m, ilp::infinity
                        );
                    }
                }
            }

            for (auto root : roots) {
                auto active = _vars.at(_graph.find(root)).active;
                p.variables[active].lower = 1;
            }

            return p;
        }

        std::pair< double, expr_type > find_best(ilp::solver &solver, eclass_id root) {
            auto roots = std::vector< eclass_id >{ _graph.find(root) };
            auto p = make_problem(roots);

            spdlog::debug("[eqsat] ilp extraction with {} variables and {} constraints",
                p.variables.size(), p.constraints.size()
            );

            if (auto values = solver.solve(p); values && p.is_feasible(*values)) {
                if (auto expr = reconstruct(*values, roots.front())) {
                    return { p.objective_value(*values), std::move(*expr) };
                }
            }

            spdlog::info("[eqsat] ilp solver gave no usable solution, using greedy extraction");
            extractor< egraph_t, node_cost_sum > fallback(_graph, node_cost_sum{ _node_cost });
            return fallback.find_best(root);
        }

    private:

        struct class_vars {
            eclass_id id;
            std::size_t active;
            std::size_t level;
            std::vector< std::size_t > nodes;
        };

        // relaxation cost matching the ilp objective
        struct node_cost_sum {
            using cost_type = double;

            template< typename child_cost_t >
            cost_type operator()(const node_type &n, child_cost_t &&child_cost) const {
                auto cost = node_cost(n);
                for (auto child : n.children) {
                    cost += child_cost(child);
                }
                return cost;
            }

            node_cost_type node_cost;
        };

        std::optional< expr_type > reconstruct(const ilp::solution &values, eclass_id root) const {
            expr_type expr;
            std::unordered_map< eclass_id, eclass_id, eclass_id_hash > built;
            std::unordered_set< eclass_id, eclass_id_hash > visiting;

            auto selected = [&] (eclass_id id) -> const node_type * {
                const auto &vars = _vars.at(id);
                const auto &cls  = _graph.eclass(id);
                for (std::size_t i = 0; i < vars.nodes.size(); ++i) {
                    if (values[vars.nodes[i]] > 0.5) {
                        return &cls.nodes[i];
                    }
                }
                return nullptr;
            };

            auto build = [&] (const auto &self, eclass_id id) -> std::optional< eclass_id > {
                auto cid = _graph.find(id);
                if (auto it = built.find(cid); it != built.end()) {
                    return it->second;
                }

                auto n = selected(cid);
                if (!n || !visiting.insert(cid).second) {
                    return std::nullopt;
                }

                graph::children_t children;
                for (auto child : n->children) {
                    auto idx = self(self, child);
                    if (!idx) {
                        return std::nullopt;
                    }
                    children.push_back(*idx);
                }

                visiting.erase(cid);
                auto idx = expr.add(node_type(n->op, std::move(children)));
                built.emplace(cid, idx);
                return idx;
            };

            if (!build(build, root)) {
                return std::nullopt;
            }

            return expr;
        }

        const egraph_t &_graph;
        node_cost_type _node_cost;
        std::unordered_map< eclass_id, class_vars, eclass_id_hash > _vars;
    };

} // namespace eqsat
