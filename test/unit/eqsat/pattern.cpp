/*
 * Copyright (c) 2022, Trail of Bits, Inc.
 * All rights reserved.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <doctest/doctest.h>

#include <eqsat/pattern/expr.hpp>
#include <eqsat/pattern/rewrite_rule.hpp>
#include <eqsat/pattern/syntax.hpp>

#include <support/egraph.hpp>

namespace eqsat::test
{
    static_assert(buildable_storage< symbol >);

    TEST_SUITE("eqsat::syntax") {
    TEST_CASE("atoms") {
        auto op = parse_atom("add");
        REQUIRE(op);
        CHECK(std::get< operation_t >(*op).ref() == "add");

        auto place = parse_atom("?x");
        REQUIRE(place);
        CHECK(std::get< place_t >(*place).ref() == "x");
        CHECK(to_string(*place) == "?x");

        CHECK(!parse_atom("?"));
        CHECK(!parse_atom("(x)"));
    }

    TEST_CASE("lists") {
        auto expr = make_simple_expr("(+ ?x (* 2 ?y))");
        CHECK(!is_atom(expr));
        CHECK(to_string(expr) == "(+ ?x (* 2 ?y))");
        CHECK(std::get< operation_t >(root(expr)).ref() == "+");
        CHECK(children(expr).size() == 2);
        CHECK(is_place(children(expr).front()));
    }

    TEST_CASE("whitespace is insignificant") {
        auto a = make_simple_expr("  ( +   ?x\n\t( * 2 ?y ) )  ");
        CHECK(to_string(a) == "(+ ?x (* 2 ?y))");
    }

    TEST_CASE("singleton list is its element") {
        CHECK(to_string(make_simple_expr("(?x)")) == "?x");
        CHECK(to_string(make_simple_expr("((a))")) == "a");
        CHECK(is_place(make_simple_expr("(?x)")));
    }

    TEST_CASE("malformed input") {
        CHECK(!parse_simple_expr(""));
        CHECK(!parse_simple_expr("(+ x"));
        CHECK(!parse_simple_expr("+ x)"));
        CHECK(!parse_simple_expr("(+ x) y"));
        CHECK_THROWS_AS(make_simple_expr("(a (b)"), syntax_error);
    }

    TEST_CASE("places in order of first occurrence") {
        auto expr = make_simple_expr("(f ?y (g ?x ?y) ?z ?x)");
        auto places = gather_places(expr);
        REQUIRE(places.size() == 3);
        CHECK(places[0].ref() == "y");
        CHECK(places[1].ref() == "x");
        CHECK(places[2].ref() == "z");
    }

    TEST_CASE("ground terms") {
        auto term = parse_term< symbol >("(+ 1 (* 2 x))");
        CHECK(term.size() == 5);
        CHECK(term.root().op == symbol("+"));
        CHECK(term.to_string() == "(+ 1 (* 2 x))");

        CHECK_THROWS_AS(parse_term< symbol >("(+ ?x 1)"), syntax_error);
        CHECK_THROWS_AS(parse_term< symbol >("(+ 1"), syntax_error);
    }
    } // test suite: eqsat::syntax

    TEST_SUITE("eqsat::pattern-compile") {
    TEST_CASE("pattern expression") {
        pattern_expr< symbol > pat(make_simple_expr("(+ ?x (* ?x 2))"));

        CHECK(pat.size() == 5);
        CHECK(pat.places().size() == 1);
        CHECK(pat.to_string() == "(+ ?x (* ?x 2))");
        CHECK(!pat.is_ground(pat.root_index()));
    }

    TEST_CASE("place in operator position") {
        CHECK_THROWS_AS(pattern_expr< symbol >(make_simple_expr("(?f a)")), pattern_compile_error);
    }

    TEST_CASE("list in operator position") {
        CHECK_THROWS_AS(pattern_expr< symbol >(make_simple_expr("((f a) b)")), pattern_compile_error);
    }

    TEST_CASE("empty pattern") {
        CHECK_THROWS_AS(pattern< test_graph >("()"), pattern_compile_error);
    }

    TEST_CASE("unbound right hand side place") {
        CHECK_THROWS_AS(
            rewrite_rule< test_graph >("bad", "(+ ?x 0)", "(+ ?x ?y)"),
            pattern_compile_error
        );

        CHECK_NOTHROW(rewrite_rule< test_graph >("drop", "(* ?x 0)", "0"));
    }

    TEST_CASE("compiled program") {
        pattern< test_graph > pat("(+ ?x ?x)");
        const auto &prog = pat.program();

        // bind, compare, yield
        CHECK(prog.instructions.size() == 3);
        CHECK(prog.num_of_registers == 3);
        CHECK(std::holds_alternative< machine::compare >(prog.instructions[1]));
        CHECK(std::holds_alternative< machine::yield >(prog.instructions.back()));
    }

    TEST_CASE("ground subterm compiles to lookup") {
        pattern< test_graph > pat("(+ ?x (* 2 3))");
        const auto &prog = pat.program();

        CHECK(std::holds_alternative< machine::lookup< symbol > >(prog.instructions[1]));
        CHECK(pat.vars().size() == 1);
    }

    TEST_CASE("rule description") {
        rewrite_rule< test_graph > rule("commute", "(+ ?a ?b)", "(+ ?b ?a)");
        CHECK(rule.name() == "commute");
        CHECK(rule.to_string() == "commute: (+ ?a ?b) => (+ ?b ?a)");
    }
    } // test suite: eqsat::pattern-compile

} // namespace eqsat::test
