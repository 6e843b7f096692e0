/*
 * Copyright (c) 2022-Present Trail of Bits, Inc.
 */

#pragma once

#include <eqsat/core/common.hpp>
#include <eqsat/core/explain.hpp>
#include <eqsat/pattern/subst.hpp>

#include <algorithm>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace eqsat
{
    // all substitutions found in a single eclass
    struct search_matches {
        eclass_id eclass;
        std::vector< subst > substs;
    };

    static inline std::size_t total_substs(const std::vector< search_matches > &matches) {
        std::size_t total = 0;
        for (const auto &m : matches) {
            total += m.substs.size();
        }
        return total;
    }

    //
    // Left-hand side of a rewrite rule.
    //
    template< typename egraph_t >
    struct searcher {
        virtual ~searcher() = default;

        virtual std::optional< search_matches > search_eclass(
            const egraph_t &graph, eclass_id eclass, std::size_t limit
        ) const = 0;

        // Searches all classes, stops as soon as 'limit' substitutions
        // were collected.
        virtual std::vector< search_matches > search_with_limit(
            const egraph_t &graph, std::size_t limit
        ) const {
            std::vector< search_matches > matches;
            for (const auto &cls : graph.eclasses()) {
                if (limit == 0) {
                    break;
                }

                if (auto m = search_eclass(graph, cls.id, limit)) {
                    limit -= std::min(limit, m->substs.size());
                    matches.push_back(std::move(*m));
                }
            }
            return matches;
        }

        std::vector< search_matches > search(const egraph_t &graph) const {
            return search_with_limit(graph, std::numeric_limits< std::size_t >::max());
        }

        // places bound by every produced substitution
        virtual places_t vars() const = 0;

        virtual std::string to_string() const = 0;
    };

    //
    // Right-hand side of a rewrite rule.
    //
    template< typename egraph_t >
    struct applier {
        virtual ~applier() = default;

        // Instantiates the right-hand side for a single substitution and
        // returns classes that are to be merged with 'eclass'.
        virtual std::vector< eclass_id > apply_one(
            egraph_t &graph, eclass_id eclass, const subst &s
        ) const = 0;

        // Applies all matches, returns classes changed by the application.
        virtual std::vector< eclass_id > apply_matches(
            egraph_t &graph, const std::vector< search_matches > &matches, const std::string &rule
        ) const {
            std::vector< eclass_id > changed;
            for (const auto &m : matches) {
                for (const auto &s : m.substs) {
                    for (auto id : apply_one(graph, m.eclass, s)) {
                        auto unions = graph.num_of_unions();
                        auto root = graph.merge(id, m.eclass, by_rule{ rule });
                        if (graph.num_of_unions() != unions) {
                            changed.push_back(root);
                        }
                    }
                }
            }
            return changed;
        }

        // places the applier reads from substitutions
        virtual places_t vars() const { return {}; }

        virtual std::string to_string() const = 0;
    };

} // namespace eqsat
