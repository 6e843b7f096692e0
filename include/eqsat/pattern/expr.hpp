/*
 * Copyright (c) 2022-Present Trail of Bits, Inc.
 */

#pragma once

#include <eqsat/core/node.hpp>
#include <eqsat/core/term.hpp>
#include <eqsat/pattern/syntax.hpp>

#include <gap/core/overloads.hpp>

#include <algorithm>
#include <concepts>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace eqsat
{
    //
    // Maps textual operations to the operator payload of a language,
    // specialized by the embedding application.
    //
    template< typename storage >
    struct storage_builder;

    template< typename storage >
    concept buildable_storage = storage_like< storage >
        && requires (const operation_t &op) {
            { storage_builder< storage >::make(op) } -> std::convertible_to< storage >;
        };

    //
    // Pattern stored bottom-up like a term, leaves may be places.
    // Children of a node are indices of earlier entries.
    //
    template< typename storage >
    struct pattern_expr {
        using node_type  = graph::node< storage >;
        using entry_type = std::variant< place_t, node_type >;

        pattern_expr() = default;

        explicit pattern_expr(const simple_expr &expr) {
            build(expr);
            _places = gather_places(expr);
        }

        const entry_type &operator[](eclass_id idx) const { return _entries.at(idx.ref()); }

        std::size_t size() const { return _entries.size(); }
        bool empty() const { return _entries.empty(); }

        eclass_id root_index() const {
            return eclass_id( static_cast< std::uint32_t >(_entries.size() - 1) );
        }

        const places_t &places() const { return _places; }

        auto begin() const { return _entries.begin(); }
        auto end() const { return _entries.end(); }

        // no places below 'idx'
        bool is_ground(eclass_id idx) const {
            return std::visit( gap::overloaded {
                [] (const place_t &) { return false; },
                [&] (const node_type &n) {
                    return std::all_of(n.children.begin(), n.children.end(), [&] (eclass_id ch) {
                        return is_ground(ch);
                    });
                }
            }, (*this)[idx]);
        }

        // term rooted in a ground entry
        rec_expr< storage > ground_term(eclass_id idx) const {
            rec_expr< storage > term;
            append_ground(idx, term);
            return term;
        }

        std::string to_string() const {
            if (empty()) {
                return "()";
            }
            return to_string(root_index());
        }

        std::string to_string(eclass_id idx) const {
            return std::visit( gap::overloaded {
                [] (const place_t &p) { return eqsat::to_string(p); },
                [&] (const node_type &n) {
                    if (n.is_leaf()) {
                        return node_name(n.op);
                    }

                    std::string out = "(" + node_name(n.op);
                    for (auto child : n.children) {
                        out += " " + to_string(child);
                    }
                    return out + ")";
                }
            }, (*this)[idx]);
        }

    private:

        eclass_id push(entry_type entry) {
            _entries.push_back(std::move(entry));
            return root_index();
        }

        eclass_id build(const simple_expr &expr) {
            const auto &head = root(expr);

            if (auto place = std::get_if< place_t >(&head)) {
                if (!is_atom(expr)) {
                    throw pattern_compile_error(
                        "place " + eqsat::to_string(*place) + " used in operator position"
                    );
                }
                return push(*place);
            }

            graph::children_t children;
            for (const auto &child : eqsat::children(expr)) {
                children.push_back(build(child));
            }

            const auto &op = std::get< operation_t >(head);
            return push(node_type(storage_builder< storage >::make(op), std::move(children)));
        }

        eclass_id append_ground(eclass_id idx, rec_expr< storage > &term) const {
            const auto &n = std::get< node_type >((*this)[idx]);
            return term.add(n.map_children([&] (eclass_id child) {
                return append_ground(child, term);
            }));
        }

        std::vector< entry_type > _entries;
        places_t _places;
    };

    //
    // Parses a ground term such as '(+ 1 (* 2 x))'.
    //
    template< buildable_storage storage >
    rec_expr< storage > make_term(const simple_expr &expr) {
        rec_expr< storage > term;

        auto append = [&] (const auto &self, const simple_expr &e) -> eclass_id {
            if (auto list = std::get_if< expr_list >(&e)) {
                if (list->empty() || !is_atom(list->front())) {
                    throw syntax_error("malformed term " + to_string(e));
                }
            }

            const auto &head = root(e);
            if (auto place = std::get_if< place_t >(&head)) {
                throw syntax_error("unexpected place " + to_string(*place) + " in a term");
            }

            graph::children_t children;
            for (const auto &child : eqsat::children(e)) {
                children.push_back(self(self, child));
            }

            auto op = storage_builder< storage >::make(std::get< operation_t >(head));
            return term.add(graph::node< storage >(std::move(op), std::move(children)));
        };

        append(append, expr);
        return term;
    }

    template< buildable_storage storage >
    rec_expr< storage > parse_term(std::string_view str) {
        return make_term< storage >(make_simple_expr(str));
    }

} // namespace eqsat
