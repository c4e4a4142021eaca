#pragma once
#include <gtest/gtest.h>
#include <lsystem/char_lsystem.hpp>
#include <lsystem/rewriter.hpp>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace test_utils {

/**
 * Performance measurement utility
 */
class PerfTimer {
    std::chrono::high_resolution_clock::time_point start_;
public:
    PerfTimer() : start_(std::chrono::high_resolution_clock::now()) {}

    double elapsed_ms() const {
        auto end = std::chrono::high_resolution_clock::now();
        return std::chrono::duration<double, std::milli>(end - start_).count();
    }

    void reset() {
        start_ = std::chrono::high_resolution_clock::now();
    }
};

/**
 * Algae grammar: A -> AB, B -> A. Lengths follow the Fibonacci sequence.
 */
inline lsystem::RulesHandle<char> algae_rules() {
    lsystem::CharRuleTable rules;
    lsystem::set_str(rules, 'A', "AB");
    lsystem::set_str(rules, 'B', "A");
    return lsystem::freeze(std::move(rules));
}

/**
 * Sierpinski arrowhead grammar with turtle tags.
 */
inline lsystem::RulesHandle<char> sierpinski_rules() {
    lsystem::CharRuleTable rules;
    lsystem::set_str(rules, 'A', "+B-A-B+", lsystem::TurtleCommand::advance(10.0f));
    lsystem::set_str(rules, 'B', "-A+B+A-", lsystem::TurtleCommand::advance(15.0f));
    lsystem::set_str(rules, '+', "+", lsystem::TurtleCommand::rotate(60.0f));
    lsystem::set_str(rules, '-', "-", lsystem::TurtleCommand::rotate(-60.0f));
    return lsystem::freeze(std::move(rules));
}

/**
 * Bracketed plant grammar: F -> F[+F]F[-F]F, with push/pop tags and an
 * untagged, unmapped 'X' that must pass through unchanged.
 */
inline lsystem::RulesHandle<char> plant_rules() {
    lsystem::CharRuleTable rules;
    lsystem::set_str(rules, 'F', "F[+F]FX[-F]F", lsystem::TurtleCommand::advance(1.0f));
    lsystem::set_str(rules, '+', "+", lsystem::TurtleCommand::rotate(25.7f));
    lsystem::set_str(rules, '-', "-", lsystem::TurtleCommand::rotate(-25.7f));
    lsystem::set_str(rules, '[', "[", lsystem::TurtleCommand::push_state());
    lsystem::set_str(rules, ']', "]", lsystem::TurtleCommand::pop_state());
    return lsystem::freeze(std::move(rules));
}

/**
 * Run `steps` iterations of a rewriter and return every generation's state as text.
 */
inline std::vector<std::string> evolve_states(lsystem::Rewriter<char>& rewriter,
                                              lsystem::CharGeneration generation,
                                              std::size_t steps) {
    std::vector<std::string> states;
    states.push_back(lsystem::to_string(generation));
    for (std::size_t i = 0; i < steps; ++i) {
        generation = rewriter.iterate(generation);
        states.push_back(lsystem::to_string(generation));
    }
    return states;
}

} // namespace test_utils
