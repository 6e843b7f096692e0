/*
 * Copyright (c) 2022-Present Trail of Bits, Inc.
 */

#pragma once

#include <gap/core/strong_type.hpp>

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <cstdint>
#include <cstdlib>
#include <functional>
#include <stdexcept>
#include <string>

namespace eqsat
{
    struct eclass_id_tag;
    using eclass_id = gap::strong_type< std::uint32_t, eclass_id_tag >;

    struct eclass_id_hash {
        std::size_t operator()(eclass_id id) const noexcept {
            return std::hash< std::uint32_t >{}(id.ref());
        }
    };

    static inline std::string to_string(eclass_id id) { return std::to_string(id.ref()); }

    //
    // errors
    //
    struct error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // operation referenced a class id that was never returned by the egraph
    struct invalid_id : error {
        using error::error;
    };

    // analysis merge found two irreconcilable facts about one class
    struct merge_conflict : error {
        using error::error;
    };

    // no finite term exists for a requested class
    struct unextractable : error {
        using error::error;
    };

    struct pattern_compile_error : error {
        using error::error;
    };

    struct syntax_error : error {
        using error::error;
    };

    // Broken bookkeeping inside the egraph is not recoverable.
    template< typename... args_t >
    [[noreturn]] void fatal(fmt::format_string< args_t... > fmt, args_t &&...args) {
        spdlog::critical("[eqsat] {}", fmt::format(fmt, std::forward< args_t >(args)...));
        std::abort();
    }

} // namespace eqsat
