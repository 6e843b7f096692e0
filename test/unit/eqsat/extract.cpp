/*
 * Copyright (c) 2022, Trail of Bits, Inc.
 * All rights reserved.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <doctest/doctest.h>

#include <eqsat/algo/cost.hpp>
#include <eqsat/algo/extract.hpp>
#include <eqsat/algo/saturation.hpp>

#include <support/egraph.hpp>

namespace eqsat::test
{
    // multiplication is expensive, everything else costs one
    struct op_cost {
        using cost_type = std::size_t;

        template< typename child_cost_t >
        cost_type operator()(const test_node &n, child_cost_t &&child_cost) const {
            cost_type cost = n.op.name == "*" ? 10 : 1;
            for (auto child : n.children) {
                cost += child_cost(child);
            }
            return cost;
        }
    };

    static_assert(cost_function< ast_size, test_node >);
    static_assert(cost_function< ast_depth, test_node >);
    static_assert(cost_function< op_cost, test_node >);

    TEST_SUITE("eqsat::extract") {
    TEST_CASE("single term") {
        test_graph egraph;
        auto root = add_term(egraph, "(+ x (f y))");

        extractor< test_graph, ast_size > extract(egraph);
        auto [cost, term] = extract.find_best(root);

        CHECK(cost == 4);
        CHECK(term.to_string() == "(+ x (f y))");
    }

    TEST_CASE("cheaper equivalent term") {
        test_graph egraph;
        auto mul  = add_term(egraph, "(* 2 (+ 1 1))");
        auto two  = add_term(egraph, "2");

        egraph.merge(mul, two);
        egraph.rebuild();

        extractor< test_graph, ast_size > extract(egraph);
        auto [cost, term] = extract.find_best(mul);

        CHECK(cost == 1);
        CHECK(term.to_string() == "2");
        CHECK(term.size() == 1);
    }

    TEST_CASE("shared subterms are extracted once") {
        test_graph egraph;
        auto root = add_term(egraph, "(+ (f x) (f x))");

        extractor< test_graph, ast_size > extract(egraph);
        auto [cost, term] = extract.find_best(root);

        // tree cost counts the shared subterm twice
        CHECK(cost == 5);
        CHECK(term.size() == 3);
        CHECK(term.to_string() == "(+ (f x) (f x))");
    }

    TEST_CASE("self referential class") {
        test_graph egraph;
        auto x  = add_term(egraph, "x");
        auto fx = add_term(egraph, "(f x)");

        egraph.merge(x, fx);
        egraph.rebuild();

        extractor< test_graph, ast_size > extract(egraph);
        CHECK(extract.find_best_cost(fx) == 1);
        CHECK(extract.find_best_node(fx).op == symbol("x"));
        CHECK(extract.find_best(fx).second.to_string() == "x");
    }

    TEST_CASE("custom cost function") {
        test_graph egraph;
        auto mul   = add_term(egraph, "(* a 2)");
        auto shift = add_term(egraph, "(<< a 1)");

        egraph.merge(mul, shift);
        egraph.rebuild();

        extractor< test_graph, op_cost > expensive(egraph);
        CHECK(expensive.find_best(mul).second.to_string() == "(<< a 1)");
        CHECK(expensive.find_best_cost(mul) == 3);

        auto node = egraph.eclass(mul).nodes.front();
        CHECK(expensive.node_total_cost(node) >= 3);
    }

    TEST_CASE("depth cost") {
        test_graph egraph;
        auto deep = add_term(egraph, "(f (f (f x)))");
        auto wide = add_term(egraph, "(g x y z)");

        egraph.merge(deep, wide);
        egraph.rebuild();

        extractor< test_graph, ast_depth > extract(egraph);
        CHECK(extract.find_best_cost(deep) == 2);
        CHECK(extract.find_best(deep).second.to_string() == "(g x y z)");
    }

    TEST_CASE("extraction after constant folding") {
        runner< folding_graph > saturation;
        saturation.with_expr(parse_term< symbol >("(* 2 (+ 1 1))"))
            .run(rewrite_rules< folding_graph >{});

        CHECK(saturation.reason() == stop_reason::saturated);

        extractor< folding_graph, ast_size > extract(saturation.egraph());
        auto [cost, term] = extract.find_best(saturation.roots().front());
        CHECK(cost == 1);
        CHECK(term.to_string() == "4");
    }

    TEST_CASE("dirty graph is rejected") {
        test_graph egraph;
        auto x = add_term(egraph, "x");
        auto y = add_term(egraph, "y");
        egraph.merge(x, y);

        CHECK_THROWS_AS((extractor< test_graph, ast_size >(egraph)), error);
    }

    TEST_CASE("unknown class") {
        test_graph egraph;
        add_term(egraph, "x");

        extractor< test_graph, ast_size > extract(egraph);
        CHECK_THROWS_AS(extract.find_best(eclass_id(5)), invalid_id);
    }
    } // test suite: eqsat::extract

} // namespace eqsat::test
