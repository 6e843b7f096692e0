/*
 * Copyright (c) 2022-Present Trail of Bits, Inc.
 */

#pragma once

#include <eqsat/core/common.hpp>

#include <gap/core/overloads.hpp>

#include <algorithm>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace eqsat
{
    //
    // justification ::= user | rule | congruence
    //
    struct by_user {};

    struct by_rule {
        std::string name;
    };

    struct by_congruence {};

    using justification = std::variant< by_user, by_rule, by_congruence >;

    static inline std::string to_string(const justification &why) {
        return std::visit( gap::overloaded {
            [] (const by_user &)       -> std::string { return "user"; },
            [] (const by_rule &r)      -> std::string { return "rule " + r.name; },
            [] (const by_congruence &) -> std::string { return "congruence"; },
        }, why);
    }

    struct explanation_step {
        eclass_id from;
        eclass_id to;
        justification why;
    };

    using explanation = std::vector< explanation_step >;

    //
    // Uncompressed forest of merges. Every successful merge connects two
    // previously separate trees with an edge labelled by its justification.
    //
    struct proof_forest {

        void make_set() { _edges.emplace_back(std::nullopt); }

        std::size_t size() const { return _edges.size(); }

        void merge(eclass_id a, eclass_id b, justification why) {
            reroot(a);
            _edges[a.ref()] = edge{ b, std::move(why) };
        }

        // Path of justified steps leading from 'a' to 'b'.
        std::optional< explanation > explain(eclass_id a, eclass_id b) const {
            std::unordered_map< std::uint32_t, std::size_t > depth_of_a;
            auto from_a = ancestors(a);
            for (std::size_t i = 0; i < from_a.size(); ++i) {
                depth_of_a.emplace(from_a[i].ref(), i);
            }

            auto from_b = ancestors(b);
            auto meet = std::find_if(from_b.begin(), from_b.end(), [&] (eclass_id id) {
                return depth_of_a.count(id.ref());
            });

            if (meet == from_b.end()) {
                return std::nullopt;
            }

            explanation steps;
            for (std::size_t i = 0; i < depth_of_a.at(meet->ref()); ++i) {
                const auto &e = _edges[from_a[i].ref()].value();
                steps.push_back({ from_a[i], e.next, e.why });
            }

            explanation tail;
            for (auto it = from_b.begin(); it != meet; ++it) {
                const auto &e = _edges[it->ref()].value();
                tail.push_back({ e.next, *it, e.why });
            }

            steps.insert(steps.end(), tail.rbegin(), tail.rend());
            return steps;
        }

    private:

        struct edge {
            eclass_id next;
            justification why;
        };

        std::vector< eclass_id > ancestors(eclass_id id) const {
            std::vector< eclass_id > path{ id };
            while (const auto &e = _edges[id.ref()]) {
                id = e->next;
                path.push_back(id);
            }
            return path;
        }

        // makes 'id' the root of its tree by reversing edges on the path
        void reroot(eclass_id id) {
            std::optional< edge > carried = std::nullopt;
            auto current = id;
            while (true) {
                auto next = std::move(_edges[current.ref()]);
                _edges[current.ref()] = std::move(carried);
                if (!next) {
                    break;
                }

                carried = edge{ current, next->why };
                current = next->next;
            }
        }

        std::vector< std::optional< edge > > _edges;
    };

} // namespace eqsat
