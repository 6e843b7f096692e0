/*
 * Copyright (c) 2022-Present Trail of Bits, Inc.
 */

#pragma once

#include <eqsat/core/egraph.hpp>
#include <eqsat/pattern/expr.hpp>
#include <eqsat/pattern/subst.hpp>

#include <gap/core/generator.hpp>
#include <gap/core/overloads.hpp>

#include <spdlog/spdlog.h>
#include <fmt/ranges.h>

#include <deque>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace eqsat::machine
{
    using reg_t = std::uint32_t;

    //
    // instruction ::= bind | compare | lookup | yield
    //

    // enumerates nodes of class in 'in' that match 'op' with 'arity'
    // children, the children are loaded into registers [out, out + arity)
    template< typename storage >
    struct bind {
        reg_t in;
        storage op;
        std::size_t arity;
        reg_t out;
    };

    struct compare {
        reg_t lhs;
        reg_t rhs;
    };

    // checks that a variable-free subterm is present in class of 'in'
    template< typename storage >
    struct lookup {
        rec_expr< storage > term;
        reg_t in;
    };

    struct yield {
        std::vector< reg_t > regs;
    };

    template< typename storage >
    using instruction = std::variant< bind< storage >, compare, lookup< storage >, yield >;

    template< typename storage >
    std::string to_string(const instruction< storage > &instr) {
        return std::visit( gap::overloaded {
            [] (const bind< storage > &b) {
                return fmt::format("bind r{} {}/{} -> r{}", b.in, node_name(b.op), b.arity, b.out);
            },
            [] (const compare &c) { return fmt::format("compare r{} r{}", c.lhs, c.rhs); },
            [] (const lookup< storage > &l) {
                return fmt::format("lookup {} in r{}", l.term.to_string(), l.in);
            },
            [] (const yield &y) { return fmt::format("yield {}", fmt::join(y.regs, " ")); }
        }, instr);
    }

    template< typename storage >
    struct program {
        using instruction_type = instruction< storage >;

        std::vector< instruction_type > instructions;
        places_t places;
        std::size_t num_of_registers = 1;

        // Lazily enumerates all substitutions under which the pattern
        // matches some node of class 'root'. Requires a rebuilt graph.
        template< typename egraph_t >
        gap::generator< subst > run(const egraph_t &graph, eclass_id root) const {
            struct choice {
                std::size_t pc;
                std::size_t next;
            };

            std::vector< eclass_id > regs(num_of_registers, eclass_id(0));
            std::vector< choice > stack;

            regs[0] = graph.find(root);

            std::size_t pc = 0;
            std::size_t resume = 0;

            while (true) {
                bool advance = false;
                const auto &instr = instructions[pc];

                if (auto b = std::get_if< bind< storage > >(&instr)) {
                    const auto &nodes = graph.eclass(regs[b->in]).nodes;
                    for (auto idx = resume; idx < nodes.size(); ++idx) {
                        const auto &n = nodes[idx];
                        if (n.num_of_children() == b->arity && n.op == b->op) {
                            stack.push_back({ pc, idx + 1 });
                            for (std::size_t i = 0; i < b->arity; ++i) {
                                regs[b->out + i] = n.child(i);
                            }
                            advance = true;
                            break;
                        }
                    }
                } else if (auto c = std::get_if< compare >(&instr)) {
                    advance = graph.find(regs[c->lhs]) == graph.find(regs[c->rhs]);
                } else if (auto l = std::get_if< lookup< storage > >(&instr)) {
                    auto id = graph.lookup_expr(l->term);
                    advance = id && *id == graph.find(regs[l->in]);
                } else if (auto y = std::get_if< yield >(&instr)) {
                    subst s;
                    for (std::size_t i = 0; i < y->regs.size(); ++i) {
                        s.insert(places[i], graph.find(regs[y->regs[i]]));
                    }
                    co_yield s;
                }

                resume = 0;
                if (advance) {
                    ++pc;
                    continue;
                }

                if (stack.empty()) {
                    co_return;
                }

                pc = stack.back().pc;
                resume = stack.back().next;
                stack.pop_back();
            }
        }

        std::string to_string() const {
            std::string out;
            for (const auto &instr : instructions) {
                out += machine::to_string< storage >(instr) + "\n";
            }
            return out;
        }
    };

    //
    // Compiles pattern breadth first starting from register 0.
    //
    template< typename storage >
    program< storage > compile(const pattern_expr< storage > &pat) {
        using node_type = typename pattern_expr< storage >::node_type;

        if (pat.empty()) {
            throw pattern_compile_error("empty pattern");
        }

        program< storage > prog;
        prog.places = pat.places();

        std::unordered_map< std::string, reg_t > bound;
        std::deque< std::pair< eclass_id, reg_t > > todo;
        todo.emplace_back(pat.root_index(), 0);

        while (!todo.empty()) {
            auto [idx, reg] = todo.front();
            todo.pop_front();

            std::visit( gap::overloaded {
                [&, reg = reg] (const place_t &place) {
                    if (auto it = bound.find(place.ref()); it != bound.end()) {
                        prog.instructions.push_back(compare{ it->second, reg });
                    } else {
                        bound.emplace(place.ref(), reg);
                    }
                },
                [&, idx = idx, reg = reg] (const node_type &n) {
                    if (idx != pat.root_index() && pat.is_ground(idx)) {
                        prog.instructions.push_back(lookup< storage >{ pat.ground_term(idx), reg });
                        return;
                    }

                    auto out = static_cast< reg_t >(prog.num_of_registers);
                    prog.num_of_registers += n.num_of_children();
                    prog.instructions.push_back(bind< storage >{ reg, n.op, n.num_of_children(), out });

                    for (std::size_t i = 0; i < n.num_of_children(); ++i) {
                        todo.emplace_back(n.child(i), static_cast< reg_t >(out + i));
                    }
                }
            }, pat[idx]);
        }

        yield y;
        for (const auto &place : prog.places) {
            y.regs.push_back(bound.at(place.ref()));
        }
        prog.instructions.push_back(std::move(y));

        spdlog::debug("[eqsat] compiled pattern {}:\n{}", pat.to_string(), prog.to_string());
        return prog;
    }

} // namespace eqsat::machine
