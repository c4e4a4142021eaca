#include <gtest/gtest.h>
#include <lsystem/debug_log.hpp>
#include <lsystem/errors.hpp>
#include <lsystem/worker_protocol.hpp>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

using namespace lsystem;

// === ERRORS ===

TEST(ErrorsTest, EveryErrorIsAnLSystemException) {
    EXPECT_THROW(throw ConfigError("x"), LSystemException);
    EXPECT_THROW(throw EmptyStateError("x"), LSystemException);
    EXPECT_THROW(throw OverflowError("x"), LSystemException);
    EXPECT_THROW(throw ProtocolError("x"), LSystemException);
    EXPECT_THROW(throw AggregatedChunkError({"x"}), LSystemException);
    EXPECT_THROW(throw LSystemException("x"), std::runtime_error);
}

TEST(ErrorsTest, MessagesArePrefixed) {
    EXPECT_STREQ(ConfigError("max_tasks must be positive").what(), "Config error: max_tasks must be positive");
    EXPECT_STREQ(EmptyStateError("nothing to split").what(), "Empty state: nothing to split");
    EXPECT_STREQ(OverflowError("too long").what(), "Overflow: too long");
    EXPECT_STREQ(ProtocolError("nothing loaded").what(), "Protocol error: nothing loaded");
}

TEST(ErrorsTest, AggregatedChunkErrorJoinsMessages) {
    AggregatedChunkError error({"chunk 0: a", "chunk 2: b"});
    EXPECT_EQ(error.messages().size(), 2u);
    EXPECT_STREQ(error.what(), "parallel rewrite failed in 2 chunk(s):\nchunk 0: a\nchunk 2: b");
}

// === DEBUG LOG ===

namespace {

std::mutex captured_mutex;
std::vector<std::string> captured;

void capture(const char* message) {
    std::lock_guard<std::mutex> lock(captured_mutex);
    captured.emplace_back(message);
}

} // namespace

TEST(DebugLogTest, SinkReceivesPrefixedLine) {
    captured.clear();
    debug::set_debug_sink(capture);
    debug::log_line("lsystem/include/lsystem/chunked_rewriter.hpp", "rewrote %d chunks of %s", 3, "state");
    debug::clear_debug_sink();

    ASSERT_EQ(captured.size(), 1u);
    EXPECT_EQ(captured[0].rfind("[lsystem:chunked_rewriter][T", 0), 0u) << captured[0];
    EXPECT_NE(captured[0].find("] rewrote 3 chunks of state"), std::string::npos);
}

TEST(DebugLogTest, LongMessagesAreNotTruncated) {
    captured.clear();
    const std::string long_text(5000, 'x');
    debug::set_debug_sink(capture);
    debug::log_line("worker.hpp", "%s|", long_text.c_str());
    debug::clear_debug_sink();

    ASSERT_EQ(captured.size(), 1u);
    EXPECT_NE(captured[0].find(long_text + "|"), std::string::npos);
}

TEST(DebugLogTest, ComponentNameFromPath) {
    EXPECT_EQ(debug::component_name("/src/lsystem/src/rewriter.cpp"), "rewriter");
    EXPECT_EQ(debug::component_name("C:\\build\\worker.hpp"), "worker");
    EXPECT_EQ(debug::component_name("channel"), "channel");
    EXPECT_EQ(debug::component_name(nullptr), "");
}

TEST(DebugLogTest, ClearedSinkStopsRouting) {
    debug::set_debug_sink(capture);
    debug::clear_debug_sink();
    EXPECT_EQ(debug::g_debug_sink.load(), nullptr);
}

// === PROTOCOL NAMES ===

TEST(ProtocolNamesTest, EnumNames) {
    EXPECT_STREQ(to_string(CommandType::LoadGeneration), "LoadGeneration");
    EXPECT_STREQ(to_string(CommandType::IterateOnce), "IterateOnce");
    EXPECT_STREQ(to_string(EventType::Interpreted), "Interpreted");
    EXPECT_STREQ(to_string(EventType::Error), "Error");
    EXPECT_STREQ(to_string(WorkerErrorCode::Rewrite), "Rewrite");
}

TEST(ProtocolNamesTest, InterpretedEventPrintsInstructionCount) {
    std::ostringstream oss;
    oss << WorkerEvent::interpreted({TurtleCommand::advance(1.0f), TurtleCommand::push_state()});
    EXPECT_EQ(oss.str(), "Interpreted(2 instructions)");
}

TEST(ProtocolNamesTest, DefaultCommandIsTerminate) {
    WorkerCommand<char> command;
    EXPECT_EQ(command.type, CommandType::Terminate);
    EXPECT_TRUE(command.axiom.empty());
    EXPECT_EQ(command.rules, nullptr);
}
