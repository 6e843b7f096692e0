/*
 * Copyright (c) 2022-Present Trail of Bits, Inc.
 */

#pragma once

#include <eqsat/core/common.hpp>

#include <gap/core/overloads.hpp>
#include <gap/core/recursive_generator.hpp>
#include <gap/core/strong_type.hpp>

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace eqsat
{
    using name_t = std::string;

    //
    // atom ::= operation | place
    //
    struct operation_tag;
    using operation_t = gap::strong_type< name_t, operation_tag >;

    // place has to be named with prefix '?', the stored name omits it
    struct placeholder_tag;
    using place_t = gap::strong_type< name_t, placeholder_tag >;

    using atom_t = std::variant< operation_t, place_t >;

    static inline std::string to_string(const place_t &place) { return "?" + place.ref(); }

    static inline std::string to_string(const atom_t &atom) {
        return std::visit( gap::overloaded {
            [] (const operation_t &o) { return o.ref(); },
            [] (const place_t &p)     { return to_string(p); },
        }, atom);
    }

    //
    // expr ::= atom | list< expr >
    //
    struct simple_expr;
    using expr_list = std::vector< simple_expr >;
    using simple_expr_base = std::variant< atom_t, expr_list >;

    struct simple_expr : simple_expr_base {
        using variant::variant;
    };

    static inline bool is_atom(const simple_expr &expr) {
        return std::holds_alternative< atom_t >(expr);
    }

    static inline bool is_place(const simple_expr &expr) {
        if (auto atom = std::get_if< atom_t >(&expr)) {
            return std::holds_alternative< place_t >(*atom);
        }
        return false;
    }

    std::string to_string(const simple_expr &expr);

    std::optional< atom_t > parse_atom(std::string_view str);

    // Parses an atom or a parenthesized list, surrounding whitespace is
    // ignored and a singleton list '(a)' is the same as 'a'.
    std::optional< simple_expr > parse_simple_expr(std::string_view str);

    // Throwing variant of 'parse_simple_expr', raises syntax_error.
    simple_expr make_simple_expr(std::string_view str);

    // head of a list or the atom itself, throws pattern_compile_error
    // for an empty list or a list headed by another list
    const atom_t &root(const simple_expr &expr);

    expr_list children(const simple_expr &expr);

    using places_t = std::vector< place_t >;

    static inline auto place_index(const place_t &place, const places_t &places) {
        return std::distance(places.begin(), std::find(places.begin(), places.end(), place));
    }

    using places_generator = gap::recursive_generator< place_t >;

    places_generator places(const simple_expr &expr);

    // places in order of first occurrence, each listed once
    places_t gather_places(const simple_expr &expr);

} // namespace eqsat
