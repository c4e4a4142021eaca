/**
 * Algae Growth Example
 *
 * Demonstrates the rewriting engine on Lindenmayer's algae grammar:
 * - Building and freezing a rule table
 * - Sequential rewriting
 * - Chunked parallel rewriting of the same generations
 */

#include <lsystem/lsystem.hpp>
#include <algorithm>
#include <chrono>
#include <iostream>
#include <thread>

using namespace lsystem;

int main() {
    std::cout << "=== Algae Growth Example ===\n\n";

    // A -> AB, B -> A
    CharRuleTable rules;
    set_str(rules, 'A', "AB");
    set_str(rules, 'B', "A");
    std::cout << "Rules: " << rules.rule_count() << ", biggest expansion: "
              << rules.biggest_expansion() << "\n\n";
    auto handle = freeze(std::move(rules));

    // Example 1: the first generations, one rewrite at a time
    std::cout << "=== Example 1: Sequential Rewriting ===\n";
    SequentialRewriter<char> sequential;
    auto generation = make_char_generation("A", handle);
    for (int i = 0; i < 7; ++i) {
        std::cout << "n=" << generation.iteration() << ": " << to_string(generation) << "\n";
        generation = sequential.iterate(generation);
    }
    std::cout << "\n";

    // Example 2: long generations split across worker threads
    std::cout << "=== Example 2: Chunked Rewriting ===\n";
    const std::size_t num_tasks = std::max(1u, std::min(4u, std::thread::hardware_concurrency()));
    ChunkedRewriter<char> chunked(num_tasks, 4096);
    std::cout << "Using " << chunked.max_tasks() << " tasks, chunk size " << chunked.chunk_size() << "\n";

    auto a = make_char_generation("A", handle);
    auto b = a;
    for (int i = 0; i < 25; ++i) {
        auto start = std::chrono::high_resolution_clock::now();
        a = sequential.iterate(a);
        auto mid = std::chrono::high_resolution_clock::now();
        b = chunked.iterate(b);
        auto end = std::chrono::high_resolution_clock::now();

        if (a.iteration() % 5 == 0) {
            std::cout << "n=" << a.iteration() << ": " << a.size() << " symbols"
                      << ", sequential " << std::chrono::duration<double, std::milli>(mid - start).count() << " ms"
                      << ", chunked " << std::chrono::duration<double, std::milli>(end - mid).count() << " ms"
                      << (a.state() == b.state() ? "" : "  MISMATCH") << "\n";
        }
    }

    std::cout << "\nFinal generations " << (a.state() == b.state() ? "match" : "differ") << "\n";
    return a.state() == b.state() ? 0 : 1;
}
