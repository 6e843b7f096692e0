/*
 * Copyright (c) 2022-Present Trail of Bits, Inc.
 */

#pragma once

#include <eqsat/pattern/rewrite_rule.hpp>
#include <eqsat/pattern/searcher.hpp>

#include <spdlog/spdlog.h>

#include <limits>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace eqsat
{
    //
    // Decides which rules are searched and applied in each iteration.
    //
    template< typename egraph_t >
    struct scheduler {
        using rule_type = rewrite_rule< egraph_t >;

        virtual ~scheduler() = default;

        // Consulted before the runner declares saturation.
        virtual bool can_stop(std::size_t /* iteration */) { return true; }

        virtual std::vector< search_matches > search_rewrite(
            std::size_t /* iteration */, const egraph_t &graph, const rule_type &rule
        ) {
            return rule.search(graph);
        }

        // Returns the number of classes changed by the application.
        virtual std::size_t apply_rewrite(
            std::size_t /* iteration */, egraph_t &graph, const rule_type &rule,
            const std::vector< search_matches > &matches
        ) {
            return rule.apply(graph, matches).size();
        }
    };

    // runs every rule in every iteration
    template< typename egraph_t >
    struct simple_scheduler : scheduler< egraph_t > {};

    //
    // Temporarily bans rules that produce too many matches. A rule is
    // banned when its matches exceed 'match_limit << times_banned', the
    // ban lasts for 'ban_length << times_banned' iterations.
    //
    template< typename egraph_t >
    struct backoff_scheduler : scheduler< egraph_t > {
        using rule_type = typename scheduler< egraph_t >::rule_type;

        static constexpr std::size_t default_match_limit = 1000;
        static constexpr std::size_t default_ban_length  = 5;

        backoff_scheduler &with_initial_match_limit(std::size_t limit) {
            _default_match_limit = limit;
            return *this;
        }

        backoff_scheduler &with_ban_length(std::size_t length) {
            _default_ban_length = length;
            return *this;
        }

        backoff_scheduler &rule_match_limit(const std::string &rule, std::size_t limit) {
            stats(rule).match_limit = limit;
            return *this;
        }

        backoff_scheduler &rule_ban_length(const std::string &rule, std::size_t length) {
            stats(rule).ban_length = length;
            return *this;
        }

        backoff_scheduler &do_not_ban(const std::string &rule) {
            return rule_match_limit(rule, std::numeric_limits< std::size_t >::max());
        }

        bool is_banned(const std::string &rule, std::size_t iteration) const {
            auto it = _stats.find(rule);
            return it != _stats.end() && it->second.banned_until > iteration;
        }

        std::size_t times_banned(const std::string &rule) const {
            auto it = _stats.find(rule);
            return it == _stats.end() ? 0 : it->second.times_banned;
        }

        // number of iterations in which the rule was searched and not banned
        std::size_t times_applied(const std::string &rule) const {
            auto it = _stats.find(rule);
            return it == _stats.end() ? 0 : it->second.times_applied;
        }

        bool can_stop(std::size_t iteration) override {
            bool banned = false;
            for (auto &[name, s] : _stats) {
                if (s.banned_until > iteration) {
                    spdlog::debug("[eqsat] lifting ban of rule {}", name);
                    s.banned_until = iteration;
                    banned = true;
                }
            }

            return !banned;
        }

        std::vector< search_matches > search_rewrite(
            std::size_t iteration, const egraph_t &graph, const rule_type &rule
        ) override {
            auto &s = stats(rule.name());

            if (iteration < s.banned_until) {
                spdlog::debug("[eqsat] skipping rule {}, banned until {}", rule.name(), s.banned_until);
                return {};
            }

            auto threshold = shifted(s.match_limit.value_or(_default_match_limit), s.times_banned);
            auto limit = threshold == std::numeric_limits< std::size_t >::max()
                ? threshold : threshold + 1;

            auto matches = rule.search_with_limit(graph, limit);
            auto total = total_substs(matches);

            if (total > threshold) {
                auto length = shifted(s.ban_length.value_or(_default_ban_length), s.times_banned);
                s.times_banned += 1;
                s.banned_until = length > std::numeric_limits< std::size_t >::max() - iteration
                    ? std::numeric_limits< std::size_t >::max()
                    : iteration + length;
                spdlog::info("[eqsat] banning rule {} for {} iterations, {} matches exceed {}",
                    rule.name(), length, total, threshold
                );
                return {};
            }

            s.times_applied += 1;
            return matches;
        }

    private:

        struct rule_stats {
            std::size_t times_applied = 0;
            std::size_t banned_until  = 0;
            std::size_t times_banned  = 0;
            std::optional< std::size_t > match_limit;
            std::optional< std::size_t > ban_length;
        };

        // saturating 'value << shift'
        static std::size_t shifted(std::size_t value, std::size_t shift) {
            constexpr auto max = std::numeric_limits< std::size_t >::max();
            if (shift >= std::numeric_limits< std::size_t >::digits || value > (max >> shift)) {
                return max;
            }
            return value << shift;
        }

        rule_stats &stats(const std::string &rule) { return _stats[rule]; }

        std::size_t _default_match_limit = default_match_limit;
        std::size_t _default_ban_length  = default_ban_length;

        std::unordered_map< std::string, rule_stats > _stats;
    };

} // namespace eqsat
