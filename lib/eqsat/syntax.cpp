/*
 * Copyright (c) 2022-Present Trail of Bits, Inc.
 */

#include <eqsat/pattern/syntax.hpp>

#include <gap/core/parser.hpp>

#include <spdlog/spdlog.h>

#include <cctype>
#include <unordered_set>

namespace eqsat
{
    template< typename P, typename T >
    concept parser = gap::parser::parser< P, T >;

    using parse_input_t = gap::parser::parse_input_t;

    template< typename T >
    using parse_result_t = gap::parser::parse_result_t< T >;

    using gap::parser::parser_function;
    using gap::parser::parse_type;

    using gap::parser::rest;
    using gap::parser::result;

    using gap::parser::construct;

    using gap::parser::char_parser;
    using gap::parser::length_parser;

    using gap::parser::parenthesized;
    using gap::parser::separated;
    using gap::parser::skip;

    static bool is_space(char c) { return std::isspace(static_cast< unsigned char >(c)); }

    static bool is_symbol_char(char c) { return !is_space(c) && c != '(' && c != ')'; }

    constexpr parser< name_t > auto name_parser() {
        return [](parse_input_t in) -> parse_result_t< name_t > {
            if (auto len = length_parser(is_symbol_char)(in); len && result(len) > 0) {
                auto length = result(len);
                return {{ std::string(in.substr(0, length)), in.substr(length) }};
            }

            return std::nullopt;
        };
    }

    constexpr parser< place_t > auto place_parser() {
        return construct< place_t >(char_parser('?') < name_parser());
    }

    // any symbol that is not a place names an operation
    constexpr parser< operation_t > auto operation_parser() {
        return [](parse_input_t in) -> parse_result_t< operation_t > {
            if (in.starts_with('?')) {
                return std::nullopt;
            }

            if (auto name = name_parser()(in)) {
                return {{ operation_t(result(name)), rest(name) }};
            }

            return std::nullopt;
        };
    }

    parser< atom_t > auto atom_parser() {
        auto plc = construct< atom_t >(place_parser());
        auto op  = construct< atom_t >(operation_parser());
        return plc | op;
    }

    struct expr_parser_impl {
        using expr_parser_result = parse_result_t< simple_expr >;
        using expr_parser_t      = auto (*)(parse_input_t) -> expr_parser_result;

        static auto expr_list_parser() {
            auto push = [](simple_expr a, simple_expr b) -> simple_expr {
                auto vec = std::get< expr_list >(std::move(a));
                vec.push_back(std::move(b));
                return { std::move(vec) };
            };

            return parenthesized(
                separated(element_parser(), skip(is_space), simple_expr{ expr_list() }, push));
        }

        static expr_parser_result empty_list_parser(parse_input_t in) {
            if (in.starts_with("()")) {
                return {{ simple_expr{ expr_list() }, in.substr(2) }};
            }
            return std::nullopt;
        }

        static auto element_parser() -> expr_parser_t {
            return [](parse_input_t in) -> expr_parser_result {
                auto atom  = construct< simple_expr >(atom_parser());
                auto list  = construct< simple_expr >(expr_list_parser());
                auto empty = &expr_parser_impl::empty_list_parser;
                return (atom | empty | list)(in);
            };
        }
    };

    parser< simple_expr > auto expr_parser() { return expr_parser_impl::element_parser(); }

    template< parser_function parser_t >
    auto make_parse(parser_t parser, std::string_view str)
        -> std::optional< parse_type< parser_t > >
    {
        if (auto value = parser(str); value && rest(value).empty()) {
            return result(value);
        }

        spdlog::debug("[eqsat] can't parse {}", str);
        return std::nullopt;
    }

    // Collapses whitespace so that list elements are separated by exactly
    // one space and parentheses carry no inner padding.
    static std::string normalize(std::string_view str) {
        std::string out;
        auto separate = [&] {
            if (!out.empty() && out.back() != ' ' && out.back() != '(') {
                out.push_back(' ');
            }
        };

        char prev = '\0';
        for (char c : str) {
            if (is_space(c)) {
                separate();
            } else if (c == ')') {
                if (!out.empty() && out.back() == ' ') {
                    out.pop_back();
                }
                out.push_back(c);
            } else {
                if (c == '(' || prev == ')') {
                    separate();
                }
                out.push_back(c);
            }
            prev = c;
        }

        if (!out.empty() && out.back() == ' ') {
            out.pop_back();
        }

        return out;
    }

    static simple_expr simplify(simple_expr expr) {
        if (auto list = std::get_if< expr_list >(&expr)) {
            if (list->size() == 1) {
                return simplify(std::move(list->front()));
            }

            for (auto &elem : *list) {
                elem = simplify(std::move(elem));
            }
        }

        return expr;
    }

    std::optional< atom_t > parse_atom(std::string_view str) {
        return make_parse(atom_parser(), normalize(str));
    }

    std::optional< simple_expr > parse_simple_expr(std::string_view str) {
        if (auto expr = make_parse(expr_parser(), normalize(str))) {
            return simplify(std::move(*expr));
        }
        return std::nullopt;
    }

    simple_expr make_simple_expr(std::string_view str) {
        if (auto expr = parse_simple_expr(str)) {
            return std::move(*expr);
        }
        throw syntax_error("syntax error in expression: " + std::string(str));
    }

    std::string to_string(const simple_expr &expr) {
        return std::visit( gap::overloaded {
            [] (const atom_t &atom) { return to_string(atom); },
            [] (const expr_list &list) {
                std::string out = "(";
                for (const auto &elem : list) {
                    if (out.size() > 1) {
                        out += ' ';
                    }
                    out += to_string(elem);
                }
                return out + ")";
            }
        }, expr);
    }

    const atom_t &root(const simple_expr &expr) {
        return std::visit( gap::overloaded {
            [] (const atom_t &atom) -> const atom_t& { return atom; },
            [] (const expr_list &list) -> const atom_t& {
                if (list.empty()) {
                    throw pattern_compile_error("empty pattern");
                }

                if (auto head = std::get_if< atom_t >(&list.front())) {
                    return *head;
                }

                throw pattern_compile_error(
                    "list in operator position: " + to_string(simple_expr{ list })
                );
            }
        }, expr);
    }

    expr_list children(const simple_expr &expr) {
        return std::visit( gap::overloaded {
            [] (const atom_t &) -> expr_list { return {}; },
            [] (const expr_list &vec) -> expr_list {
                if (vec.empty()) {
                    return {};
                }
                return { std::next(vec.begin()), vec.end() };
            }
        }, expr);
    }

    places_generator places(const simple_expr &expr) {
        const simple_expr_base &base = expr;
        co_yield std::visit( gap::overloaded {
            [&] (const atom_t &a) -> places_generator {
                if (auto p = std::get_if< place_t >(&a)) {
                    co_yield place_t(*p);
                }
            },
            [&] (const expr_list &list) -> places_generator {
                for (const auto &elem : list) {
                    co_yield places(elem);
                }
            }
        }, base);
    }

    places_t gather_places(const simple_expr &expr) {
        places_t result;
        std::unordered_set< std::string > seen;
        for (auto place : places(expr)) {
            if (seen.insert(place.ref()).second) {
                result.push_back(std::move(place));
            }
        }
        return result;
    }

} // namespace eqsat
