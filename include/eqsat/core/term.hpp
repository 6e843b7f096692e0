/*
 * Copyright (c) 2022-Present Trail of Bits, Inc.
 */

#pragma once

#include <eqsat/core/node.hpp>

#include <fmt/format.h>

#include <string>
#include <vector>

namespace eqsat
{
    //
    // Finite term stored bottom-up, children of a node refer to indices of
    // nodes that precede it. The last node is the root.
    //
    template< typename storage >
    struct rec_expr {
        using node_type = graph::node< storage >;

        eclass_id add(node_type n) {
            for (auto child : n.children) {
                if (child.ref() >= _nodes.size()) {
                    throw invalid_id(fmt::format(
                        "term node refers to forward index {}", child.ref()
                    ));
                }
            }

            _nodes.push_back(std::move(n));
            return eclass_id( static_cast< std::uint32_t >(_nodes.size() - 1) );
        }

        const node_type &operator[](eclass_id idx) const { return _nodes.at(idx.ref()); }

        const node_type &root() const { return _nodes.back(); }
        eclass_id root_index() const {
            return eclass_id( static_cast< std::uint32_t >(_nodes.size() - 1) );
        }

        std::size_t size() const { return _nodes.size(); }
        bool empty() const { return _nodes.empty(); }

        auto begin() const { return _nodes.begin(); }
        auto end() const { return _nodes.end(); }

        bool operator==(const rec_expr &other) const = default;

        std::string to_string() const {
            if (empty()) {
                return "()";
            }
            return to_string(root_index());
        }

        std::string to_string(eclass_id idx) const {
            const auto &n = (*this)[idx];
            if (n.is_leaf()) {
                return node_name(n.op);
            }

            std::string out = "(" + node_name(n.op);
            for (auto child : n.children) {
                out += " " + to_string(child);
            }
            return out + ")";
        }

    private:
        std::vector< node_type > _nodes;
    };

} // namespace eqsat
