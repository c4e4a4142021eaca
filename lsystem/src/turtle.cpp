#include <lsystem/turtle.hpp>
#include <sstream>

namespace lsystem {

const char* to_string(TurtleCommand::Kind kind) {
    switch (kind) {
        case TurtleCommand::Kind::Advance: return "Advance";
        case TurtleCommand::Kind::Rotate: return "Rotate";
        case TurtleCommand::Kind::PushState: return "PushState";
        case TurtleCommand::Kind::PopState: return "PopState";
        case TurtleCommand::Kind::None: return "None";
    }
    return "Unknown";
}

std::string to_string(const TurtleCommand& command) {
    std::ostringstream oss;
    oss << command;
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const TurtleCommand& command) {
    os << to_string(command.kind);
    if (command.kind == TurtleCommand::Kind::Advance || command.kind == TurtleCommand::Kind::Rotate) {
        os << "(" << command.value << ")";
    }
    return os;
}

} // namespace lsystem
