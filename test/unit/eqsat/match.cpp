/*
 * Copyright (c) 2022, Trail of Bits, Inc.
 * All rights reserved.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <doctest/doctest.h>

#include <eqsat/algo/machine.hpp>
#include <eqsat/pattern/pattern.hpp>
#include <eqsat/pattern/subst.hpp>

#include <support/egraph.hpp>

#include <unordered_set>

namespace eqsat::test
{
    static std::size_t count_matches(const std::vector< search_matches > &matches) {
        return total_substs(matches);
    }

    static place_t var(std::string name) { return place_t(std::move(name)); }

    TEST_SUITE("eqsat::match") {
    TEST_CASE("substitution") {
        subst s;
        CHECK(s.empty());
        CHECK(!s.insert(var("x"), eclass_id(1)));
        CHECK(!s.insert(var("y"), eclass_id(2)));

        auto old = s.insert(var("x"), eclass_id(3));
        REQUIRE(old);
        CHECK(*old == eclass_id(1));
        CHECK(s.at(var("x")) == eclass_id(3));
        CHECK(s.size() == 2);
        CHECK(!s.get(var("z")));
        CHECK_THROWS_AS(s.at(var("z")), std::out_of_range);
        CHECK(to_string(s) == "{?x: 3, ?y: 2}");
    }

    TEST_CASE("single node") {
        test_graph egraph;
        auto x   = make_node(egraph, "x");
        auto y   = make_node(egraph, "y");
        auto add = make_node(egraph, "+", {x, y});

        pattern< test_graph > pat("(+ ?a ?b)");
        auto matches = pat.search(egraph);

        REQUIRE(matches.size() == 1);
        CHECK(matches.front().eclass == add);
        REQUIRE(matches.front().substs.size() == 1);

        const auto &s = matches.front().substs.front();
        CHECK(s.at(var("a")) == x);
        CHECK(s.at(var("b")) == y);
    }

    TEST_CASE("operator and arity have to agree") {
        test_graph egraph;
        auto x = make_node(egraph, "x");
        make_node(egraph, "+", {x});
        make_node(egraph, "-", {x, x});

        pattern< test_graph > pat("(+ ?a ?b)");
        CHECK(pat.search(egraph).empty());
    }

    TEST_CASE("variable matches every class") {
        test_graph egraph;
        add_term(egraph, "(f (g a) b)");

        pattern< test_graph > pat("?x");
        CHECK(count_matches(pat.search(egraph)) == egraph.num_of_eclasses());
    }

    TEST_CASE("non-linear pattern") {
        test_graph egraph;
        auto a = add_term(egraph, "(+ x x)");
        add_term(egraph, "(+ x y)");

        pattern< test_graph > pat("(+ ?a ?a)");
        auto matches = pat.search(egraph);

        REQUIRE(matches.size() == 1);
        CHECK(matches.front().eclass == a);
    }

    TEST_CASE("non-linear pattern after merge") {
        test_graph egraph;
        add_term(egraph, "(+ x x)");
        auto b = add_term(egraph, "(+ x y)");

        egraph.merge(add_term(egraph, "x"), add_term(egraph, "y"));
        egraph.rebuild();

        pattern< test_graph > pat("(+ ?a ?a)");
        auto matches = pat.search(egraph);

        REQUIRE(matches.size() == 1);
        CHECK(matches.front().eclass == egraph.find(b));
        CHECK(matches.front().substs.size() == 1);
    }

    TEST_CASE("nested pattern enumerates all choices") {
        test_graph egraph;
        auto x = add_term(egraph, "x");
        auto y = add_term(egraph, "y");
        auto fx = add_term(egraph, "(f x)");
        auto fy = add_term(egraph, "(f y)");
        auto root = add_term(egraph, "(g (f x))");

        // class of 'f x' also holds 'f y' after the merge
        egraph.merge(fx, fy);
        egraph.rebuild();

        pattern< test_graph > pat("(g (f ?v))");
        auto matches = pat.search(egraph);

        REQUIRE(matches.size() == 1);
        CHECK(matches.front().eclass == egraph.find(root));
        REQUIRE(matches.front().substs.size() == 2);
        CHECK(matches.front().substs[0].at(var("v")) == x);
        CHECK(matches.front().substs[1].at(var("v")) == y);
    }

    TEST_CASE("ground subterm lookup") {
        test_graph egraph;
        auto a = add_term(egraph, "(+ z (* 2 3))");
        add_term(egraph, "(+ z (* 3 2))");

        pattern< test_graph > pat("(+ ?x (* 2 3))");
        auto matches = pat.search(egraph);
        REQUIRE(matches.size() == 1);
        CHECK(matches.front().eclass == a);

        pattern< test_graph > missing("(+ ?x (* 4 4))");
        CHECK(missing.search(egraph).empty());
    }

    TEST_CASE("substitution hashing") {
        subst s, t, u;
        s.insert(var("x"), eclass_id(1));
        s.insert(var("y"), eclass_id(2));
        t.insert(var("x"), eclass_id(1));
        t.insert(var("y"), eclass_id(2));
        u.insert(var("x"), eclass_id(2));
        u.insert(var("y"), eclass_id(1));

        CHECK(subst_hash{}(s) == subst_hash{}(t));

        std::unordered_set< subst, subst_hash > seen{ s };
        CHECK(!seen.insert(t).second);
        CHECK(seen.insert(u).second);
        CHECK(seen.size() == 2);
    }

    TEST_CASE("every match in a class is reported once") {
        test_graph egraph;
        auto root = add_term(egraph, "(+ a b)");
        for (auto term : { "(+ b a)", "(+ a c)", "(+ c a)", "(+ b c)" }) {
            egraph.merge(root, add_term(egraph, term));
        }
        egraph.rebuild();

        pattern< test_graph > pat("(+ ?x ?y)");
        auto matches = pat.search(egraph);

        REQUIRE(matches.size() == 1);
        const auto &substs = matches.front().substs;
        CHECK(substs.size() == 5);

        std::unordered_set< subst, subst_hash > distinct(substs.begin(), substs.end());
        CHECK(distinct.size() == substs.size());
    }

    TEST_CASE("search limit") {
        test_graph egraph;
        for (auto name : { "a", "b", "c", "d" }) {
            add_term(egraph, fmt::format("(f {})", name));
        }

        pattern< test_graph > pat("(f ?x)");
        CHECK(count_matches(pat.search(egraph)) == 4);
        CHECK(count_matches(pat.search_with_limit(egraph, 2)) == 2);
        CHECK(pat.search_with_limit(egraph, 0).empty());
    }

    TEST_CASE("instantiate pattern") {
        test_graph egraph;
        auto x = make_node(egraph, "x");
        auto y = make_node(egraph, "y");

        subst s;
        s.insert(var("a"), x);
        s.insert(var("b"), y);

        pattern< test_graph > pat("(* ?b (+ ?a 1))");
        auto ids = pat.apply_one(egraph, x, s);

        REQUIRE(ids.size() == 1);
        CHECK(egraph.lookup_expr(parse_term< symbol >("(* y (+ x 1))")) == ids.front());
    }
    } // test suite: eqsat::match

} // namespace eqsat::test
