/**
 * Sierpinski Worker Example
 *
 * Drives a background worker with the Sierpinski arrowhead grammar:
 * - Loading a generation into the worker
 * - Pipelining iterate commands
 * - Reading turtle instructions back
 * - Error replies and termination
 */

#include <lsystem/lsystem.hpp>
#include <iostream>
#include <map>
#include <memory>

using namespace lsystem;

int main() {
    std::cout << "=== Sierpinski Worker Example ===\n\n";

    CharRuleTable rules;
    set_str(rules, 'A', "+B-A-B+", TurtleCommand::advance(10.0f));
    set_str(rules, 'B', "-A+B+A-", TurtleCommand::advance(10.0f));
    set_str(rules, '+', "+", TurtleCommand::rotate(60.0f));
    set_str(rules, '-', "-", TurtleCommand::rotate(-60.0f));

    Worker<char> worker(std::make_unique<ChunkedRewriter<char>>(4, 1024),
                        std::make_unique<SimpleInterpreter<char>>());

    // Example 1: commands before loading are refused
    std::cout << "=== Example 1: Protocol Errors ===\n";
    if (auto reply = worker.request(WorkerCommand<char>::iterate())) {
        std::cout << "IterateOnce before load -> " << *reply << "\n\n";
    }

    // Example 2: pipelined commands, replies in order
    std::cout << "=== Example 2: Pipelined Iterations ===\n";
    worker.send(WorkerCommand<char>::load(symbols_from_string("A"), freeze(std::move(rules))));
    for (int i = 0; i < 6; ++i) {
        worker.send(WorkerCommand<char>::iterate());
    }
    worker.send(WorkerCommand<char>::interpret());
    worker.send(WorkerCommand<char>::terminate());

    while (auto event = worker.next_event()) {
        std::cout << "  " << *event << "\n";
        if (event->type == EventType::Interpreted) {
            std::map<TurtleCommand::Kind, std::size_t> counts;
            for (const auto& instruction : event->instructions) {
                ++counts[instruction.kind];
            }
            for (const auto& [kind, count] : counts) {
                std::cout << "    " << to_string(kind) << ": " << count << "\n";
            }
        }
    }

    std::cout << "\nWorker accepting commands: " << (worker.accepting_commands() ? "yes" : "no") << "\n";
    return 0;
}
