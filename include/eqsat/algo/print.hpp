/*
 * Copyright (c) 2022-Present Trail of Bits, Inc.
 */

#pragma once

#include <eqsat/core/egraph.hpp>

#include <spdlog/spdlog.h>

#include <fmt/format.h>
#include <fmt/os.h>

#include <string>

namespace eqsat
{
    namespace detail {

        //
        // graph formatter
        //
        struct graph_printer {
            explicit graph_printer(const std::string &path)
                : out(fmt::output_file(path))
            {
                out.print(R"(digraph egraph {{
    compound=true
    clusterrank=local
)");
            }

            ~graph_printer() { out.print("}}\n"); }

            template< typename... args_t >
            void print(fmt::format_string< args_t... > fmt, args_t &&... args) {
                out.print(fmt, std::forward< args_t >(args)...);
            }

            fmt::ostream out;
        };

        //
        // eclass formatter
        //
        template< typename eclass_type >
        struct print_eclass {
            print_eclass(graph_printer &out, const eclass_type &cls)
                : out(out)
            {
                out.print(R"(    subgraph cluster_{} {{
        style=dotted
)", cls.id.ref());

                for (std::size_t i = 0; i < cls.nodes.size(); ++i) {
                    out.print("        \"{}.{}\" [label = \"{}\"]\n"
                        , cls.id.ref(), i, escape(node_name(cls.nodes[i]))
                    );
                }
            }

            ~print_eclass() { out.print("    }}\n"); }

            static std::string escape(const std::string &label) {
                std::string result;
                for (char c : label) {
                    if (c == '"' || c == '\\') {
                        result.push_back('\\');
                    }
                    result.push_back(c);
                }
                return result;
            }

            graph_printer &out;
        };

    } // namespace detail

    //
    // Writes the egraph in graphviz format, one cluster per eclass.
    // Edges lead from a node to the first node of the child eclass.
    //
    template< typename egraph_t >
    void to_dot(const egraph_t &egraph, const std::string &path) {
        spdlog::info("[eqsat] printing to dot {}", path);

        detail::graph_printer out(path);

        for (const auto &cls : egraph.eclasses()) {
            detail::print_eclass< typename egraph_t::eclass_type > print(out, cls);
        }

        for (const auto &cls : egraph.eclasses()) {
            for (std::size_t i = 0; i < cls.nodes.size(); ++i) {
                for (auto child : cls.nodes[i].children) {
                    auto target = egraph.find(child).ref();
                    out.print("    \"{}.{}\" -> \"{}.0\" [lhead = cluster_{}]\n"
                        , cls.id.ref(), i, target, target
                    );
                }
            }
        }
    }

} // namespace eqsat
