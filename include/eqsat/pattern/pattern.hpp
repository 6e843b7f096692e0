/*
 * Copyright (c) 2022-Present Trail of Bits, Inc.
 */

#pragma once

#include <eqsat/algo/machine.hpp>
#include <eqsat/pattern/expr.hpp>
#include <eqsat/pattern/searcher.hpp>
#include <eqsat/pattern/syntax.hpp>

#include <gap/core/overloads.hpp>

#include <string_view>
#include <unordered_set>

namespace eqsat
{
    //
    // Pattern serves both as a searcher, compiled to a matching program,
    // and as an applier that instantiates itself under a substitution.
    //
    template< typename egraph_t >
    struct pattern : searcher< egraph_t >, applier< egraph_t > {
        using storage_type = typename egraph_t::storage_type;
        using node_type    = typename egraph_t::node_type;
        using expr_type    = pattern_expr< storage_type >;

        explicit pattern(const simple_expr &expr)
            : _expr(expr), _program(machine::compile(_expr))
        {}

        explicit pattern(std::string_view text) : pattern(make_simple_expr(text)) {}

        const expr_type &expr() const { return _expr; }

        const machine::program< storage_type > &program() const { return _program; }

        std::optional< search_matches > search_eclass(
            const egraph_t &graph, eclass_id eclass, std::size_t limit
        ) const override {
            std::vector< subst > substs;
            std::unordered_set< subst, subst_hash > seen;
            for (auto s : _program.run(graph, eclass)) {
                if (substs.size() >= limit) {
                    break;
                }

                if (seen.insert(s).second) {
                    substs.push_back(std::move(s));
                }
            }

            if (substs.empty()) {
                return std::nullopt;
            }

            return search_matches{ graph.find(eclass), std::move(substs) };
        }

        std::vector< eclass_id > apply_one(
            egraph_t &graph, eclass_id, const subst &s
        ) const override {
            std::vector< eclass_id > ids;
            ids.reserve(_expr.size());

            for (const auto &entry : _expr) {
                ids.push_back(std::visit( gap::overloaded {
                    [&] (const place_t &place) { return s.at(place); },
                    [&] (const node_type &n) {
                        return graph.add(n.map_children([&] (eclass_id idx) {
                            return ids[idx.ref()];
                        }));
                    }
                }, entry));
            }

            return { ids.back() };
        }

        places_t vars() const override { return _expr.places(); }

        std::string to_string() const override { return _expr.to_string(); }

    private:
        expr_type _expr;
        machine::program< storage_type > _program;
    };

} // namespace eqsat
