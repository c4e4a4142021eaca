#ifndef LSYSTEM_INTERPRETER_HPP
#define LSYSTEM_INTERPRETER_HPP

#include <lsystem/generation.hpp>
#include <lsystem/turtle.hpp>
#include <vector>

namespace lsystem {

/**
 * Translates a generation into drawing instructions (turtle graphics).
 */
template<typename Symbol>
class Interpreter {
public:
    virtual ~Interpreter() = default;

    virtual std::vector<TurtleCommand> interpret(const Generation<Symbol, TurtleCommand>& generation) = 0;
};

/**
 * Emits the tag of every symbol in state order. Symbols without a tag and
 * symbols tagged None produce nothing.
 */
template<typename Symbol>
class SimpleInterpreter : public Interpreter<Symbol> {
public:
    std::vector<TurtleCommand> interpret(const Generation<Symbol, TurtleCommand>& generation) override {
        const auto& rules = generation.rules();
        std::vector<TurtleCommand> commands;
        commands.reserve(generation.size());

        for (const Symbol& s : generation.state()) {
            const TurtleCommand* command = rules.tag(s);
            if (command && !command->is_none()) {
                commands.push_back(*command);
            }
        }
        commands.shrink_to_fit();

        return commands;
    }
};

} // namespace lsystem

#endif // LSYSTEM_INTERPRETER_HPP
