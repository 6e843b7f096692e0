/*
 * Copyright (c) 2022-Present Trail of Bits, Inc.
 */

#pragma once

#include <eqsat/pattern/pattern.hpp>
#include <eqsat/pattern/rule_set.hpp>
#include <eqsat/pattern/searcher.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace eqsat {

    //
    // Applies the inner applier only to substitutions accepted by the condition.
    //
    template< typename egraph_t >
    struct conditional_applier : applier< egraph_t > {
        using condition_type = std::function< bool(egraph_t &, eclass_id, const subst &) >;
        using applier_pointer = std::shared_ptr< const applier< egraph_t > >;

        conditional_applier(condition_type condition, applier_pointer inner)
            : _condition(std::move(condition)), _inner(std::move(inner))
        {}

        std::vector< eclass_id > apply_one(
            egraph_t &graph, eclass_id eclass, const subst &s
        ) const override {
            if (_condition(graph, eclass, s)) {
                return _inner->apply_one(graph, eclass, s);
            }
            return {};
        }

        places_t vars() const override { return _inner->vars(); }

        std::string to_string() const override { return "if ... then " + _inner->to_string(); }

    private:
        condition_type _condition;
        applier_pointer _inner;
    };

    template< typename egraph_t >
    struct rewrite_rule {
        using searcher_pointer = std::shared_ptr< const searcher< egraph_t > >;
        using applier_pointer  = std::shared_ptr< const applier< egraph_t > >;
        using condition_type   = typename conditional_applier< egraph_t >::condition_type;

        rewrite_rule(std::string name, searcher_pointer lhs, applier_pointer rhs)
            : _name(std::move(name)), _lhs(std::move(lhs)), _rhs(std::move(rhs))
        {
            // Every place that occurs on the right hand side has to be
            // bound by the left hand side.
            auto bound = _lhs->vars();
            for (const auto &place : _rhs->vars()) {
                if (std::find(bound.begin(), bound.end(), place) == bound.end()) {
                    throw pattern_compile_error(fmt::format(
                        "rule {}: place {} is not bound by the left hand side",
                        _name, eqsat::to_string(place)
                    ));
                }
            }
        }

        rewrite_rule(std::string name, const simple_expr &lhs, const simple_expr &rhs)
            : rewrite_rule(
                std::move(name),
                std::make_shared< pattern< egraph_t > >(lhs),
                std::make_shared< pattern< egraph_t > >(rhs)
            )
        {}

        rewrite_rule(std::string name, std::string_view lhs, std::string_view rhs)
            : rewrite_rule(std::move(name), make_simple_expr(lhs), make_simple_expr(rhs))
        {}

        explicit rewrite_rule(const rule_definition &def)
            : rewrite_rule(def.name, def.lhs, def.rhs)
        {}

        // rule applied only when 'condition' holds for the match
        static rewrite_rule conditional(
            std::string name, std::string_view lhs, std::string_view rhs, condition_type condition
        ) {
            return rewrite_rule(
                std::move(name),
                std::make_shared< pattern< egraph_t > >(lhs),
                std::make_shared< conditional_applier< egraph_t > >(
                    std::move(condition), std::make_shared< pattern< egraph_t > >(rhs)
                )
            );
        }

        const std::string &name() const { return _name; }

        const searcher< egraph_t > &lhs() const { return *_lhs; }
        const applier< egraph_t > &rhs() const { return *_rhs; }

        std::vector< search_matches > search(const egraph_t &graph) const {
            return _lhs->search(graph);
        }

        std::vector< search_matches > search_with_limit(
            const egraph_t &graph, std::size_t limit
        ) const {
            return _lhs->search_with_limit(graph, limit);
        }

        std::vector< eclass_id > apply(
            egraph_t &graph, const std::vector< search_matches > &matches
        ) const {
            return _rhs->apply_matches(graph, matches, _name);
        }

        std::string to_string() const {
            return fmt::format("{}: {} => {}", _name, _lhs->to_string(), _rhs->to_string());
        }

    private:
        std::string _name;
        searcher_pointer _lhs;
        applier_pointer _rhs;
    };

    template< typename egraph_t >
    using rewrite_rules = std::vector< rewrite_rule< egraph_t > >;

    template< typename egraph_t >
    rewrite_rules< egraph_t > make_rules(const rule_set &set) {
        spdlog::debug("[eqsat] instantiating rule set {}", set.name);
        rewrite_rules< egraph_t > rules;
        for (const auto &def : set.rules) {
            rules.emplace_back(def);
        }
        return rules;
    }

    template< typename egraph_t >
    rewrite_rules< egraph_t > make_rules(const std::vector< rule_set > &sets) {
        rewrite_rules< egraph_t > rules;
        for (const auto &set : sets) {
            auto part = make_rules< egraph_t >(set);
            std::move(part.begin(), part.end(), std::back_inserter(rules));
        }
        return rules;
    }

} // namespace eqsat
