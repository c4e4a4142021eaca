#include <lsystem/worker_protocol.hpp>

namespace lsystem {

WorkerEvent WorkerEvent::loaded() {
    WorkerEvent event;
    event.type = EventType::Loaded;
    return event;
}

WorkerEvent WorkerEvent::reset() {
    WorkerEvent event;
    event.type = EventType::Reset;
    return event;
}

WorkerEvent WorkerEvent::iterated(std::uint64_t iteration) {
    WorkerEvent event;
    event.type = EventType::Iterated;
    event.iteration = iteration;
    return event;
}

WorkerEvent WorkerEvent::interpreted(std::vector<TurtleCommand> instructions) {
    WorkerEvent event;
    event.type = EventType::Interpreted;
    event.instructions = std::move(instructions);
    return event;
}

WorkerEvent WorkerEvent::terminated() {
    WorkerEvent event;
    event.type = EventType::Terminated;
    return event;
}

WorkerEvent WorkerEvent::error(WorkerErrorCode code, std::string message) {
    WorkerEvent event;
    event.type = EventType::Error;
    event.error_code = code;
    event.message = std::move(message);
    return event;
}

bool WorkerEvent::answers(CommandType command) const {
    if (type == expected_event_for(command)) {
        return true;
    }
    // Terminate cannot fail
    return is_error() && command != CommandType::Terminate;
}

EventType expected_event_for(CommandType command) {
    switch (command) {
        case CommandType::LoadGeneration: return EventType::Loaded;
        case CommandType::Reset: return EventType::Reset;
        case CommandType::IterateOnce: return EventType::Iterated;
        case CommandType::Interpret: return EventType::Interpreted;
        case CommandType::Terminate: return EventType::Terminated;
    }
    return EventType::Error;
}

const char* to_string(CommandType type) {
    switch (type) {
        case CommandType::LoadGeneration: return "LoadGeneration";
        case CommandType::Reset: return "Reset";
        case CommandType::IterateOnce: return "IterateOnce";
        case CommandType::Interpret: return "Interpret";
        case CommandType::Terminate: return "Terminate";
    }
    return "Unknown";
}

const char* to_string(EventType type) {
    switch (type) {
        case EventType::Loaded: return "Loaded";
        case EventType::Reset: return "Reset";
        case EventType::Iterated: return "Iterated";
        case EventType::Interpreted: return "Interpreted";
        case EventType::Terminated: return "Terminated";
        case EventType::Error: return "Error";
    }
    return "Unknown";
}

const char* to_string(WorkerErrorCode code) {
    switch (code) {
        case WorkerErrorCode::None: return "None";
        case WorkerErrorCode::Protocol: return "Protocol";
        case WorkerErrorCode::Rewrite: return "Rewrite";
        case WorkerErrorCode::Interpret: return "Interpret";
    }
    return "Unknown";
}

std::ostream& operator<<(std::ostream& os, const WorkerEvent& event) {
    os << to_string(event.type);
    switch (event.type) {
        case EventType::Iterated:
            os << "(" << event.iteration << ")";
            break;
        case EventType::Interpreted:
            os << "(" << event.instructions.size() << " instructions)";
            break;
        case EventType::Error:
            os << "(" << to_string(event.error_code) << ": " << event.message << ")";
            break;
        default:
            break;
    }
    return os;
}

} // namespace lsystem
