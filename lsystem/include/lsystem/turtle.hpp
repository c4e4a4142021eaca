#ifndef LSYSTEM_TURTLE_HPP
#define LSYSTEM_TURTLE_HPP

#include <ostream>
#include <string>

namespace lsystem {

/**
 * A single drawing instruction for a 2D turtle (as in Logo).
 * Advance and Rotate carry a value; PushState, PopState and None do not.
 * None is a placeholder tag that interpreters drop from their output.
 */
struct TurtleCommand {
    enum class Kind {
        Advance,    // move forward (or backward if negative), in pixels
        Rotate,     // turn by an angle, in degrees
        PushState,  // save position and heading
        PopState,   // restore the last saved position and heading
        None
    };

    Kind kind = Kind::None;
    float value = 0.0f;

    static TurtleCommand advance(float distance) { return {Kind::Advance, distance}; }
    static TurtleCommand rotate(float angle) { return {Kind::Rotate, angle}; }
    static TurtleCommand push_state() { return {Kind::PushState, 0.0f}; }
    static TurtleCommand pop_state() { return {Kind::PopState, 0.0f}; }
    static TurtleCommand none() { return {Kind::None, 0.0f}; }

    bool is_none() const { return kind == Kind::None; }

    // Value only participates for kinds that carry one
    bool operator==(const TurtleCommand& other) const {
        if (kind != other.kind) return false;
        if (kind == Kind::Advance || kind == Kind::Rotate) return value == other.value;
        return true;
    }

    bool operator!=(const TurtleCommand& other) const { return !(*this == other); }
};

const char* to_string(TurtleCommand::Kind kind);
std::string to_string(const TurtleCommand& command);
std::ostream& operator<<(std::ostream& os, const TurtleCommand& command);

} // namespace lsystem

#endif // LSYSTEM_TURTLE_HPP
