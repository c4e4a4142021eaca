#ifndef LSYSTEM_ERRORS_HPP
#define LSYSTEM_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace lsystem {

// Base of every error raised by the rewriting engine
class LSystemException : public std::runtime_error {
public:
    explicit LSystemException(const std::string& message)
        : std::runtime_error(message) {}
};

// Invalid construction parameters (zero tasks, zero chunk size)
class ConfigError : public LSystemException {
public:
    explicit ConfigError(const std::string& message)
        : LSystemException("Config error: " + message) {}
};

class EmptyStateError : public LSystemException {
public:
    explicit EmptyStateError(const std::string& message)
        : LSystemException("Empty state: " + message) {}
};

// A size estimate or accumulated length left the representable range
class OverflowError : public LSystemException {
public:
    explicit OverflowError(const std::string& message)
        : LSystemException("Overflow: " + message) {}
};

// A command was issued to a worker in a state that cannot accept it
class ProtocolError : public LSystemException {
public:
    explicit ProtocolError(const std::string& message)
        : LSystemException("Protocol error: " + message) {}
};

/**
 * One or more chunk tasks of a parallel rewrite failed.
 * messages() keeps the individual failures in chunk order; what() is their
 * concatenation.
 */
class AggregatedChunkError : public LSystemException {
public:
    explicit AggregatedChunkError(std::vector<std::string> messages);

    const std::vector<std::string>& messages() const noexcept { return messages_; }

private:
    std::vector<std::string> messages_;
};

} // namespace lsystem

#endif // LSYSTEM_ERRORS_HPP
