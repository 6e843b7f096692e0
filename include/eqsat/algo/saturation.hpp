/*
 * Copyright (c) 2022-Present Trail of Bits, Inc.
 */

#pragma once

#include <eqsat/algo/scheduler.hpp>

#include <eqsat/core/egraph.hpp>

#include <eqsat/pattern/rewrite_rule.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace eqsat
{
    // return value of equality saturation
    enum class stop_reason
    {
        saturated, iteration_limit, node_limit, time_limit, stopped
    };

    std::string to_string(stop_reason reason);

    using seconds = std::chrono::duration< double >;

    struct runner_config {
        std::size_t iter_limit = 30;
        // maximal number of enodes
        std::size_t node_limit = 10'000;
        seconds time_limit = std::chrono::seconds(5);
    };

    //
    // statistics of a single saturation step
    //
    struct iteration_report {
        std::size_t egraph_nodes   = 0;
        std::size_t egraph_classes = 0;
        // changed classes per rule
        std::unordered_map< std::string, std::size_t > applied;
        // classes repaired by the rebuild
        std::size_t repairs = 0;

        seconds search_time{};
        seconds apply_time{};
        seconds rebuild_time{};
        seconds total_time{};

        std::optional< stop_reason > reason;
    };

    //
    // Drives equality saturation, every iteration searches all rules on
    // the rebuilt graph first, then applies the collected matches and
    // rebuilds once.
    //
    template< typename egraph_t >
    struct runner {
        using rule_type      = rewrite_rule< egraph_t >;
        using scheduler_type = scheduler< egraph_t >;
        using expr_type      = typename egraph_t::expr_type;
        using clock          = std::chrono::steady_clock;

        // Hook is called at every iteration boundary, returning a message
        // stops the runner.
        using hook_type = std::function< std::optional< std::string >(runner &) >;

        explicit runner(egraph_t graph = egraph_t(), runner_config config = {})
            : _egraph(std::move(graph))
            , _config(config)
            , _scheduler(std::make_unique< backoff_scheduler< egraph_t > >())
        {}

        runner &with_expr(const expr_type &expr) {
            _roots.push_back(_egraph.add_expr(expr));
            return *this;
        }

        runner &with_iter_limit(std::size_t limit) {
            _config.iter_limit = limit;
            return *this;
        }

        runner &with_node_limit(std::size_t limit) {
            _config.node_limit = limit;
            return *this;
        }

        runner &with_time_limit(seconds limit) {
            _config.time_limit = limit;
            return *this;
        }

        runner &with_scheduler(std::unique_ptr< scheduler_type > sched) {
            _scheduler = std::move(sched);
            return *this;
        }

        runner &with_hook(hook_type hook) {
            _hooks.push_back(std::move(hook));
            return *this;
        }

        runner &run(std::span< const rule_type > rules) {
            spdlog::debug("[eqsat] saturation start with {} rules", rules.size());
            auto start = clock::now();

            try {
                _egraph.rebuild();
            } catch (const merge_conflict &err) {
                stop(stop_reason::stopped, err.what());
            }
            canonicalize_roots();

            while (!_reason) {
                if (auto message = run_hooks()) {
                    stop(stop_reason::stopped, *message);
                } else if (auto limit = check_limits(start)) {
                    stop(*limit);
                } else {
                    run_one(rules);
                }
            }

            spdlog::info("[eqsat] saturation stopped: {} after {} iterations",
                to_string(*_reason), _iterations.size()
            );

            return *this;
        }

        egraph_t &egraph() { return _egraph; }
        const egraph_t &egraph() const { return _egraph; }

        const std::vector< eclass_id > &roots() const { return _roots; }

        const std::vector< iteration_report > &iterations() const { return _iterations; }

        const runner_config &config() const { return _config; }

        std::optional< stop_reason > reason() const { return _reason; }

        const std::string &stop_message() const { return _message; }

        void print_report() const {
            std::size_t applied = 0;
            seconds search{}, apply{}, rebuild{};
            for (const auto &it : _iterations) {
                for (const auto &[rule, count] : it.applied) {
                    applied += count;
                }
                search  += it.search_time;
                apply   += it.apply_time;
                rebuild += it.rebuild_time;
            }

            spdlog::info("[eqsat] stop reason: {}{}",
                _reason ? to_string(*_reason) : "running",
                _message.empty() ? "" : " (" + _message + ")"
            );
            spdlog::info("[eqsat] iterations: {}", _iterations.size());
            spdlog::info("[eqsat] egraph nodes: {}, classes: {}, unions: {}",
                _egraph.num_of_nodes(), _egraph.num_of_eclasses(), _egraph.num_of_unions()
            );
            spdlog::info("[eqsat] total applied rules: {}", applied);
            spdlog::info("[eqsat] search time: {:.4f}s, apply time: {:.4f}s, rebuild time: {:.4f}s",
                search.count(), apply.count(), rebuild.count()
            );
        }

    private:

        void stop(stop_reason reason, std::string message = {}) {
            _reason  = reason;
            _message = std::move(message);
        }

        std::optional< std::string > run_hooks() {
            for (auto &hook : _hooks) {
                if (auto message = hook(*this)) {
                    return message;
                }
            }
            return std::nullopt;
        }

        std::optional< stop_reason > check_limits(clock::time_point start) const {
            if (_iterations.size() >= _config.iter_limit) {
                return stop_reason::iteration_limit;
            }

            if (_egraph.num_of_nodes() > _config.node_limit) {
                return stop_reason::node_limit;
            }

            if (clock::now() - start > _config.time_limit) {
                return stop_reason::time_limit;
            }

            return std::nullopt;
        }

        void canonicalize_roots() {
            for (auto &root : _roots) {
                root = _egraph.find(root);
            }
        }

        void run_one(std::span< const rule_type > rules) {
            auto iteration = _iterations.size();
            spdlog::debug("[eqsat] iteration {}", iteration);

            iteration_report report;
            auto iteration_start = clock::now();
            auto unions = _egraph.num_of_unions();

            const egraph_t &snapshot = _egraph;
            std::vector< std::vector< search_matches > > matches;
            matches.reserve(rules.size());
            for (const auto &rule : rules) {
                matches.push_back(_scheduler->search_rewrite(iteration, snapshot, rule));
                if (auto total = total_substs(matches.back())) {
                    spdlog::debug("[eqsat] rule {} matched {} times", rule.name(), total);
                }
            }

            auto search_end = clock::now();
            report.search_time = search_end - iteration_start;

            try {
                for (std::size_t i = 0; i < rules.size(); ++i) {
                    const auto &rule = rules[i];
                    report.applied[rule.name()] +=
                        _scheduler->apply_rewrite(iteration, _egraph, rule, matches[i]);
                }

                auto apply_end = clock::now();
                report.apply_time = apply_end - search_end;

                report.repairs = _egraph.rebuild();
                report.rebuild_time = clock::now() - apply_end;
            } catch (const merge_conflict &err) {
                spdlog::info("[eqsat] analysis conflict: {}", err.what());
                report.reason = stop_reason::stopped;
                stop(stop_reason::stopped, err.what());
            }

            canonicalize_roots();

            report.egraph_nodes   = _egraph.num_of_nodes();
            report.egraph_classes = _egraph.num_of_eclasses();

            if (!report.reason && unions == _egraph.num_of_unions() && _scheduler->can_stop(iteration)) {
                report.reason = stop_reason::saturated;
                stop(stop_reason::saturated);
            }

            report.total_time = clock::now() - iteration_start;
            _iterations.push_back(std::move(report));
        }

        egraph_t _egraph;
        runner_config _config;
        std::unique_ptr< scheduler_type > _scheduler;
        std::vector< hook_type > _hooks;

        std::vector< eclass_id > _roots;
        std::vector< iteration_report > _iterations;

        std::optional< stop_reason > _reason;
        std::string _message;
    };

} // namespace eqsat
