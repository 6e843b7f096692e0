/*
 * Copyright (c) 2022-Present Trail of Bits, Inc.
 */

#pragma once

#include <eqsat/pattern/syntax.hpp>

#include <string>
#include <vector>

namespace eqsat {

    // Textual rule 'lhs => rhs' as read from a rule file, independent of
    // the language it is later instantiated for.
    struct rule_definition {
        std::string name;
        simple_expr lhs;
        simple_expr rhs;
    };

    using rule_definitions = std::vector< rule_definition >;

    struct rule_set {
        std::string name;
        rule_definitions rules;
    };

} // namespace eqsat
