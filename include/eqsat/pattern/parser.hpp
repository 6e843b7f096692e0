/*
 * Copyright (c) 2022-Present Trail of Bits, Inc.
 */

#pragma once

#include <eqsat/pattern/rule_set.hpp>

#include <istream>
#include <string>
#include <vector>

namespace eqsat
{
    //
    // Rule file format:
    //
    //   # comment
    //   [set-name]
    //   rule-name:
    //     - lhs-pattern
    //     - rhs-pattern
    //
    // Malformed entries are reported and skipped.
    //
    std::vector< rule_set > parse_rules(std::istream &is);

    // throws error when the file cannot be opened
    std::vector< rule_set > parse_rules(const std::string &filename);

} // namespace eqsat
