/*
 * Copyright (c) 2022, Trail of Bits, Inc.
 * All rights reserved.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <doctest/doctest.h>

#include <eqsat/algo/ilp.hpp>

#include <support/egraph.hpp>

#include <algorithm>
#include <cmath>

namespace eqsat::test
{
    //
    // Tries every integral assignment within variable bounds.
    //
    struct brute_force_solver : ilp::solver {
        std::optional< ilp::solution > solve(const ilp::problem &p) override {
            std::optional< ilp::solution > best;
            double best_value = 0;

            ilp::solution values(p.variables.size(), 0);
            auto search = [&] (const auto &self, std::size_t idx) -> void {
                if (idx == values.size()) {
                    if (p.is_feasible(values)) {
                        auto value = p.objective_value(values);
                        if (!best || value < best_value) {
                            best = values;
                            best_value = value;
                        }
                    }
                    return;
                }

                const auto &var = p.variables[idx];
                for (auto v = std::ceil(var.lower); v <= var.upper; v += 1) {
                    values[idx] = v;
                    self(self, idx + 1);
                }
            };

            search(search, 0);
            return best;
        }
    };

    struct failing_solver : ilp::solver {
        std::optional< ilp::solution > solve(const ilp::problem &) override {
            return std::nullopt;
        }
    };

    static std::optional< std::size_t > find_variable(const ilp::problem &p, std::string_view name) {
        auto it = std::find_if(p.variables.begin(), p.variables.end(), [&] (const auto &var) {
            return var.name == name;
        });

        if (it == p.variables.end()) {
            return std::nullopt;
        }

        return std::size_t(std::distance(p.variables.begin(), it));
    }

    // leaves are expensive
    static double leaf_cost(const test_node &n) {
        return n.is_leaf() ? 3.0 : 1.0;
    }

    // R = (p A B), A = { (f S), a }, B = { (g S), b }, S = s
    static eclass_id make_shared_graph(test_graph &egraph) {
        auto root = add_term(egraph, "(p (f s) (g s))");
        egraph.merge(add_term(egraph, "(f s)"), add_term(egraph, "a"));
        egraph.merge(add_term(egraph, "(g s)"), add_term(egraph, "b"));
        egraph.rebuild();
        return root;
    }

    TEST_SUITE("eqsat::ilp") {
    TEST_CASE("problem") {
        ilp::problem p;
        auto x = p.add_binary("x");
        auto y = p.add_variable("y", ilp::var_kind::integer, 0, 3);

        p.add_constraint({ { x, 1.0 }, { y, 1.0 } }, 2, ilp::infinity);
        p.add_objective(x, 5.0);
        p.add_objective(y, 1.0);

        CHECK(p.is_feasible({ 0, 2 }));
        CHECK(p.is_feasible({ 1, 1 }));
        CHECK(!p.is_feasible({ 0, 1 }));
        CHECK(!p.is_feasible({ 0, 4 }));
        CHECK(!p.is_feasible({ 0.5, 2 }));
        CHECK(!p.is_feasible({ 1 }));

        CHECK(p.objective_value({ 1, 1 }) == doctest::Approx(6.0));

        auto best = brute_force_solver().solve(p);
        REQUIRE(best);
        CHECK((*best)[x] == doctest::Approx(0.0));
        CHECK((*best)[y] == doctest::Approx(2.0));

        auto text = p.to_string();
        CHECK(text.find("minimize") != std::string::npos);
        CHECK(text.find("subject to") != std::string::npos);
        CHECK(text.find("0 <= x <= 1 binary") != std::string::npos);
    }

    TEST_CASE("unknown variables are rejected") {
        ilp::problem p;
        p.add_binary("x");
        CHECK_THROWS_AS(p.add_constraint({ { 3, 1.0 } }, 0, 1), error);
        CHECK_THROWS_AS(p.add_objective(1, 1.0), error);
    }

    TEST_CASE("formulation") {
        test_graph egraph;
        auto mul = add_term(egraph, "(* 2 (+ 1 1))");
        auto two = add_term(egraph, "2");
        egraph.merge(mul, two);
        egraph.rebuild();

        auto root = egraph.find(mul);
        ilp_extractor< test_graph > extract(egraph);
        auto p = extract.make_problem(std::vector< eclass_id >{ root });

        // three classes, four nodes
        CHECK(p.variables.size() == 3 * 2 + 4);

        auto active = find_variable(p, fmt::format("active_{}", root.ref()));
        REQUIRE(active);
        CHECK(p.variables[*active].lower == doctest::Approx(1.0));

        // '(* 2 (+ 1 1))' refers to its own class and is never selected
        const auto &cls = egraph.eclass(root);
        for (std::size_t i = 0; i < cls.nodes.size(); ++i) {
            auto var = find_variable(p, fmt::format("node_{}_{}", root.ref(), i));
            REQUIRE(var);
            auto self_loop = cls.nodes[i].op == symbol("*");
            CHECK((p.variables[*var].upper == 0) == self_loop);
        }
    }

    TEST_CASE("optimal extraction") {
        test_graph egraph;
        auto mul = add_term(egraph, "(* 2 (+ 1 1))");
        egraph.merge(mul, add_term(egraph, "2"));
        egraph.rebuild();

        brute_force_solver solver;
        ilp_extractor< test_graph > extract(egraph);
        auto [cost, term] = extract.find_best(solver, mul);

        CHECK(cost == doctest::Approx(1.0));
        CHECK(term.to_string() == "2");
    }

    TEST_CASE("shared subterms are paid once") {
        test_graph egraph;
        auto root = make_shared_graph(egraph);

        brute_force_solver solver;
        ilp_extractor< test_graph > extract(egraph, leaf_cost);
        auto [cost, term] = extract.find_best(solver, root);

        CHECK(cost == doctest::Approx(6.0));
        CHECK(term.to_string() == "(p (f s) (g s))");
        CHECK(term.size() == 4);
    }

    TEST_CASE("fallback to greedy extraction") {
        test_graph egraph;
        auto root = make_shared_graph(egraph);

        failing_solver solver;
        ilp_extractor< test_graph > extract(egraph, leaf_cost);
        auto [cost, term] = extract.find_best(solver, root);

        CHECK(cost == doctest::Approx(7.0));
        CHECK(term.to_string() == "(p a b)");
    }
    } // test suite: eqsat::ilp

} // namespace eqsat::test
