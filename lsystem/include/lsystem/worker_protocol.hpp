#ifndef LSYSTEM_WORKER_PROTOCOL_HPP
#define LSYSTEM_WORKER_PROTOCOL_HPP

#include <lsystem/rule_table.hpp>
#include <lsystem/turtle.hpp>
#include <cstdint>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace lsystem {

enum class CommandType {
    LoadGeneration,
    Reset,
    IterateOnce,
    Interpret,
    Terminate
};

enum class EventType {
    Loaded,
    Reset,
    Iterated,
    Interpreted,
    Terminated,
    Error
};

enum class WorkerErrorCode {
    None,
    Protocol,   // command not valid in the worker's current state
    Rewrite,    // the rewriter failed; the current generation is unchanged
    Interpret   // the interpreter failed
};

// Message from a caller to a worker. Only LoadGeneration carries a payload.
template<typename Symbol>
struct WorkerCommand {
    CommandType type = CommandType::Terminate;
    std::vector<Symbol> axiom;
    RulesHandle<Symbol> rules;

    static WorkerCommand load(std::vector<Symbol> axiom, RulesHandle<Symbol> rules) {
        WorkerCommand command;
        command.type = CommandType::LoadGeneration;
        command.axiom = std::move(axiom);
        command.rules = std::move(rules);
        return command;
    }

    static WorkerCommand reset() { return of(CommandType::Reset); }
    static WorkerCommand iterate() { return of(CommandType::IterateOnce); }
    static WorkerCommand interpret() { return of(CommandType::Interpret); }
    static WorkerCommand terminate() { return of(CommandType::Terminate); }

private:
    static WorkerCommand of(CommandType type) {
        WorkerCommand command;
        command.type = type;
        return command;
    }
};

/**
 * Message from a worker back to its caller. Replies come in command order;
 * an Error event takes the place of the success reply of the command that
 * failed.
 */
struct WorkerEvent {
    EventType type = EventType::Error;
    std::uint64_t iteration = 0;               // Loaded, Reset, Iterated
    std::vector<TurtleCommand> instructions;   // Interpreted
    WorkerErrorCode error_code = WorkerErrorCode::None;
    std::string message;                       // Error

    static WorkerEvent loaded();
    static WorkerEvent reset();
    static WorkerEvent iterated(std::uint64_t iteration);
    static WorkerEvent interpreted(std::vector<TurtleCommand> instructions);
    static WorkerEvent terminated();
    static WorkerEvent error(WorkerErrorCode code, std::string message);

    bool is_error() const { return type == EventType::Error; }

    // True if this event is a possible reply to a command of the given type
    bool answers(CommandType command) const;
};

// Success reply expected for a command
EventType expected_event_for(CommandType command);

const char* to_string(CommandType type);
const char* to_string(EventType type);
const char* to_string(WorkerErrorCode code);
std::ostream& operator<<(std::ostream& os, const WorkerEvent& event);

} // namespace lsystem

#endif // LSYSTEM_WORKER_PROTOCOL_HPP
