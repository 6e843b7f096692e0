/*
 * Copyright (c) 2022-Present Trail of Bits, Inc.
 */

#include <eqsat/algo/ilp.hpp>

#include <fmt/format.h>

#include <cmath>

namespace eqsat::ilp
{
    std::size_t problem::add_variable(std::string name, var_kind kind, double lower, double upper) {
        variables.push_back({ std::move(name), kind, lower, upper });
        return variables.size() - 1;
    }

    void problem::add_constraint(std::vector< term > terms, double lower, double upper) {
        for (const auto &t : terms) {
            if (t.var >= variables.size()) {
                throw error(fmt::format("constraint refers to unknown variable {}", t.var));
            }
        }
        constraints.push_back({ std::move(terms), lower, upper });
    }

    void problem::add_objective(std::size_t var, double coeff) {
        if (var >= variables.size()) {
            throw error(fmt::format("objective refers to unknown variable {}", var));
        }
        objective.push_back({ var, coeff });
    }

    double problem::objective_value(const solution &values) const {
        double value = 0;
        for (const auto &t : objective) {
            value += t.coeff * values.at(t.var);
        }
        return value;
    }

    bool problem::is_feasible(const solution &values, double eps) const {
        if (values.size() != variables.size()) {
            return false;
        }

        for (std::size_t i = 0; i < variables.size(); ++i) {
            const auto &var = variables[i];
            auto value = values[i];
            if (value < var.lower - eps || value > var.upper + eps) {
                return false;
            }

            if (std::abs(value - std::round(value)) > eps) {
                return false;
            }
        }

        for (const auto &c : constraints) {
            double sum = 0;
            for (const auto &t : c.terms) {
                sum += t.coeff * values[t.var];
            }

            if (sum < c.lower - eps || sum > c.upper + eps) {
                return false;
            }
        }

        return true;
    }

    static std::string to_string(double bound) {
        if (std::isinf(bound)) {
            return bound < 0 ? "-inf" : "inf";
        }
        return fmt::format("{}", bound);
    }

    std::string problem::to_string() const {
        std::string out = "minimize";
        for (const auto &t : objective) {
            out += fmt::format(" {:+} {}", t.coeff, variables[t.var].name);
        }

        out += "\nsubject to\n";
        for (const auto &c : constraints) {
            out += "  " + ilp::to_string(c.lower) + " <=";
            for (const auto &t : c.terms) {
                out += fmt::format(" {:+} {}", t.coeff, variables[t.var].name);
            }
            out += " <= " + ilp::to_string(c.upper) + "\n";
        }

        out += "bounds\n";
        for (const auto &var : variables) {
            out += fmt::format("  {} <= {} <= {}{}\n",
                ilp::to_string(var.lower), var.name, ilp::to_string(var.upper),
                var.kind == var_kind::binary ? " binary" : " integer"
            );
        }

        return out;
    }

} // namespace eqsat::ilp
