/*
 * Copyright (c) 2022-Present Trail of Bits, Inc.
 */

#include <eqsat/pattern/parser.hpp>

#include <eqsat/core/common.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <optional>

namespace eqsat
{
    using maybe_rule_set      = std::optional< rule_set >;
    using maybe_rule_set_name = std::optional< std::string_view >;

    using maybe_rule_definition = std::optional< rule_definition >;

    static std::string_view trim(std::string_view line) {
        line.remove_prefix(std::min(line.find_first_not_of(" \n\r\t"), line.size()));
        if (auto last = line.find_last_not_of(" \n\r\t"); last != std::string_view::npos) {
            line.remove_suffix(line.size() - last - 1);
        }
        return line;
    }

    static bool is_commented(std::string_view line) { return trim(line).starts_with('#'); }

    static std::optional< std::string > get_nonempty_line(std::istream &is) {
        std::string line;
        while (std::getline(is, line)) {
            if (trim(line).empty()) {
                /* noop */
            } else if (is_commented(line)) {
                /* noop */
            } else {
                return std::string(trim(line));
            }
        }

        return std::nullopt;
    }

    static maybe_rule_set_name parse_ruleset_name(std::string_view line) {
        if (!line.starts_with('[')) {
            return std::nullopt;
        }
        if (!line.ends_with(']')) {
            spdlog::error("[eqsat] missing closing bracket: {}", line);
            return std::nullopt;
        }
        return trim(line.substr(1, line.size() - 2));
    }

    static maybe_rule_set maybe_new_ruleset(std::string_view line) {
        if (auto name = parse_ruleset_name(line))
            return rule_set{ std::string{ name.value() }, rule_definitions{} };
        return std::nullopt;
    }

    static std::optional< std::string > parse_rule_name(std::string_view line) {
        if (line.ends_with(':') && line.size() > 1)
            return std::string(trim(line.substr(0, line.size() - 1)));
        return std::nullopt;
    }

    static std::optional< std::string > parse_pattern(std::string_view line) {
        line = trim(line);
        if (line.starts_with('-'))
            return std::string(trim(line.substr(1)));
        return std::nullopt;
    }

    static maybe_rule_definition parse_rule(std::string_view name_line, std::istream &is) {
        auto pattern = [&]() -> std::optional< simple_expr > {
            if (auto line = get_nonempty_line(is)) {
                if (auto pat = parse_pattern(*line)) {
                    if (auto expr = parse_simple_expr(*pat)) {
                        return expr;
                    }
                    spdlog::error("[eqsat] malformed pattern: {}", *pat);
                    return std::nullopt;
                } else {
                    spdlog::error("[eqsat] expected a pattern: {}", *line);
                    return std::nullopt;
                }
            }

            spdlog::error("[eqsat] missing pattern");
            return std::nullopt;
        };

        if (auto name = parse_rule_name(name_line)) {
            spdlog::debug("[eqsat] rule: {}", *name);
            auto lhs = pattern();
            auto rhs = pattern();
            if (lhs && rhs) {
                spdlog::debug("[eqsat] lhs: {}", to_string(*lhs));
                spdlog::debug("[eqsat] rhs: {}", to_string(*rhs));
                return rule_definition{ *name, std::move(*lhs), std::move(*rhs) };
            }
        } else {
            spdlog::error("[eqsat] expected rule name: {}", name_line);
            return std::nullopt;
        }

        return std::nullopt;
    }

    std::vector< rule_set > parse_rules(const std::string &filename) {
        spdlog::debug("[eqsat] parse rules from: {}", filename);
        std::ifstream file(filename, std::ios::in);
        if (!file) {
            throw error("cannot open rule file " + filename);
        }
        return parse_rules(file);
    }

    std::vector< rule_set > parse_rules(std::istream &is) {
        std::vector< rule_set > rulesets;

        auto add_to_current_ruleset = [&](auto &&rule) {
            if (rulesets.empty()) {
                rulesets.push_back(rule_set{ "default", {} });
            }
            rulesets.back().rules.push_back(std::move(rule));
        };

        while (auto line = get_nonempty_line(is)) {
            if (auto ruleset = maybe_new_ruleset(*line)) {
                spdlog::debug("[eqsat] new set of rules: {}", ruleset->name);
                rulesets.push_back(std::move(*ruleset));
            } else if (auto rule = parse_rule(*line, is)) {
                add_to_current_ruleset(std::move(*rule));
            } else {
                spdlog::error("[eqsat] syntax error: {}", *line);
            }
        }

        return rulesets;
    }

} // namespace eqsat
