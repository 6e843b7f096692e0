/*
 * Copyright (c) 2022-Present Trail of Bits, Inc.
 */

#pragma once

#include <eqsat/core/egraph.hpp>
#include <eqsat/pattern/expr.hpp>

#include <charconv>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace eqsat
{
    //
    // Uninterpreted operator named by a string, integer literals are
    // symbols as well, e.g. '+', 'x' or '42'.
    //
    struct symbol {
        explicit symbol(std::string_view str) : name(str) {}

        bool operator==(const symbol &) const = default;

        std::string name;
    };

    static inline std::string node_name(const symbol &sym) { return sym.name; }

    static inline std::optional< std::int64_t > extract_constant(std::string_view str) {
        std::int64_t value = 0;
        auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
        if (ec == std::errc{} && ptr == str.data() + str.size()) {
            return value;
        }
        return std::nullopt;
    }

    static inline std::optional< std::int64_t > extract_constant(const symbol &sym) {
        return extract_constant(sym.name);
    }

    template<>
    struct storage_builder< symbol > {
        static symbol make(const operation_t &op) { return symbol(op.ref()); }
    };

} // namespace eqsat

template<>
struct std::hash< eqsat::symbol > {
    std::size_t operator()(const eqsat::symbol &sym) const noexcept {
        return std::hash< std::string >{}(sym.name);
    }
};

namespace eqsat
{
    using symbol_node  = graph::node< symbol >;
    using symbol_expr  = rec_expr< symbol >;

    template< typename analysis_t = no_analysis >
    using symbol_egraph = graph::egraph< symbol, analysis_t >;

} // namespace eqsat
