/*
 * Copyright (c) 2022-Present Trail of Bits, Inc.
 */

#include <eqsat/algo/saturation.hpp>

namespace eqsat {

    std::string to_string(stop_reason reason) {
        switch (reason) {
            case stop_reason::saturated: return "saturated";
            case stop_reason::iteration_limit: return "iteration limit";
            case stop_reason::node_limit: return "node limit";
            case stop_reason::time_limit: return "time limit";
            case stop_reason::stopped: return "stopped";
        }

        fatal("unknown stop reason {}", static_cast< int >(reason));
    }

} // namespace eqsat
