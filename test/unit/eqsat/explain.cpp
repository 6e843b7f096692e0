/*
 * Copyright (c) 2022, Trail of Bits, Inc.
 * All rights reserved.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <doctest/doctest.h>

#include <eqsat/algo/saturation.hpp>
#include <eqsat/core/explain.hpp>

#include <support/egraph.hpp>

namespace eqsat::test
{
    // steps have to form a path leading from 'a' to 'b'
    static bool connects(const explanation &steps, eclass_id a, eclass_id b) {
        auto current = a;
        for (const auto &step : steps) {
            if (step.from != current) {
                return false;
            }
            current = step.to;
        }
        return current == b;
    }

    TEST_SUITE("eqsat::explain") {
    TEST_CASE("requires an empty graph") {
        test_graph egraph;
        make_node(egraph, "x");
        CHECK_THROWS_AS(egraph.enable_explanations(), error);
        CHECK(!egraph.explanations_enabled());
    }

    TEST_CASE("requires explanations to be enabled") {
        test_graph egraph;
        auto x = make_node(egraph, "x");
        CHECK_THROWS_AS(egraph.explain_equivalence(x, x), error);
    }

    TEST_CASE("user merges") {
        test_graph egraph;
        egraph.enable_explanations();

        auto a = make_node(egraph, "a");
        auto b = make_node(egraph, "b");
        auto c = make_node(egraph, "c");
        auto d = make_node(egraph, "d");

        CHECK(!egraph.explain_equivalence(a, b));

        egraph.merge(a, b);
        egraph.merge(c, d);
        egraph.merge(b, d);
        egraph.rebuild();

        auto same = egraph.explain_equivalence(a, a);
        REQUIRE(same);
        CHECK(same->empty());

        auto steps = egraph.explain_equivalence(a, c);
        REQUIRE(steps);
        CHECK(steps->size() == 3);
        CHECK(connects(*steps, a, c));

        for (const auto &step : *steps) {
            CHECK(to_string(step.why) == "user");
        }

        auto back = egraph.explain_equivalence(c, a);
        REQUIRE(back);
        CHECK(connects(*back, c, a));
    }

    TEST_CASE("congruence") {
        test_graph egraph;
        egraph.enable_explanations();

        auto a  = make_node(egraph, "a");
        auto b  = make_node(egraph, "b");
        auto fa = make_node(egraph, "f", {a});
        auto fb = make_node(egraph, "f", {b});

        egraph.merge(a, b);
        egraph.rebuild();

        auto steps = egraph.explain_equivalence(fa, fb);
        REQUIRE(steps);
        REQUIRE(steps->size() == 1);
        CHECK(std::holds_alternative< by_congruence >(steps->front().why));
        CHECK(connects(*steps, fa, fb));
    }

    TEST_CASE("rewrites") {
        test_graph egraph;
        egraph.enable_explanations();

        auto lhs = add_term(egraph, "(+ 1 2)");
        auto rhs = add_term(egraph, "(+ 2 1)");

        rewrite_rules< test_graph > rules{
            rewrite_rule< test_graph >("commute-add", "(+ ?x ?y)", "(+ ?y ?x)")
        };

        runner< test_graph > saturation(std::move(egraph));
        saturation.with_iter_limit(1).run(rules);

        auto steps = saturation.egraph().explain_equivalence(lhs, rhs);
        REQUIRE(steps);
        REQUIRE(steps->size() == 1);
        CHECK(to_string(steps->front().why) == "rule commute-add");
        CHECK(connects(*steps, lhs, rhs));
    }
    } // test suite: eqsat::explain

} // namespace eqsat::test
