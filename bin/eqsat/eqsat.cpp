/*
 * Copyright (c) 2022-Present Trail of Bits, Inc.
 */

#include <eqsat/algo/extract.hpp>
#include <eqsat/algo/print.hpp>
#include <eqsat/algo/saturation.hpp>
#include <eqsat/algo/scheduler.hpp>
#include <eqsat/lang/symbol.hpp>
#include <eqsat/pattern/parser.hpp>
#include <eqsat/pattern/rewrite_rule.hpp>

#include <gflags/gflags.h>

#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include <fmt/format.h>

#include <cstdint>
#include <iostream>
#include <memory>

DEFINE_string(rules, "", "Path to the rule file");
DEFINE_string(expr, "", "Term to saturate, e.g. '(+ a b)'");
DEFINE_uint64(iter_limit, 30, "Maximal number of saturation iterations");
DEFINE_uint64(node_limit, 10000, "Maximal number of enodes");
DEFINE_double(time_limit, 5.0, "Saturation time limit in seconds");
DEFINE_string(scheduler, "backoff", "Rule scheduler: simple or backoff");
DEFINE_string(dot, "", "Store the saturated egraph in graphviz format");

namespace eqsat::cli
{
    using egraph_t = symbol_egraph<>;

    std::unique_ptr< scheduler< egraph_t > > make_scheduler(const std::string &name) {
        if (name == "simple") {
            return std::make_unique< simple_scheduler< egraph_t > >();
        }

        if (name == "backoff") {
            return std::make_unique< backoff_scheduler< egraph_t > >();
        }

        throw error(fmt::format("unknown scheduler '{}'", name));
    }

    int exec() {
        if (FLAGS_rules.empty()) {
            throw error("missing --rules");
        }

        if (FLAGS_expr.empty()) {
            throw error("missing --expr");
        }

        auto rules = make_rules< egraph_t >(parse_rules(FLAGS_rules));
        spdlog::info("[eqsat] loaded {} rules from {}", rules.size(), FLAGS_rules);

        auto term = parse_term< symbol >(FLAGS_expr);

        runner< egraph_t > saturation;
        saturation.with_expr(term)
            .with_iter_limit(FLAGS_iter_limit)
            .with_node_limit(FLAGS_node_limit)
            .with_time_limit(seconds(FLAGS_time_limit))
            .with_scheduler(make_scheduler(FLAGS_scheduler))
            .run(rules);

        saturation.print_report();

        const auto &graph = saturation.egraph();
        if (!FLAGS_dot.empty()) {
            to_dot(graph, FLAGS_dot);
        }

        extractor< egraph_t, ast_size > extract(graph);
        auto [cost, best] = extract.find_best(saturation.roots().front());

        std::cout << best.to_string() << std::endl;
        spdlog::info("[eqsat] best term cost: {}", cost);
        return 0;
    }

} // namespace eqsat::cli

int main(int argc, char *argv[]) {
    google::SetUsageMessage("eqsat-run --rules FILE --expr TERM [options]");
    google::ParseCommandLineFlags(&argc, &argv, true);
    spdlog::cfg::load_env_levels();

    try {
        return eqsat::cli::exec();
    } catch (const eqsat::error &err) {
        spdlog::error("[eqsat] {}", err.what());
        return 1;
    }
}
