#include <lsystem/errors.hpp>
#include <utility>

namespace lsystem {

namespace {

std::string join_chunk_messages(const std::vector<std::string>& messages) {
    std::string joined = "parallel rewrite failed in " + std::to_string(messages.size()) + " chunk(s):";
    for (const auto& message : messages) {
        joined += "\n";
        joined += message;
    }
    return joined;
}

} // namespace

AggregatedChunkError::AggregatedChunkError(std::vector<std::string> messages)
    : LSystemException(join_chunk_messages(messages))
    , messages_(std::move(messages)) {}

} // namespace lsystem
