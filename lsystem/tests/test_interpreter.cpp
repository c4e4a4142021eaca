#include <gtest/gtest.h>
#include <lsystem/char_lsystem.hpp>
#include <lsystem/chunked_rewriter.hpp>
#include <lsystem/interpreter.hpp>
#include <lsystem/sequential_rewriter.hpp>
#include <vector>
#include "test_helpers.hpp"

using namespace lsystem;

TEST(SimpleInterpreterTest, SierpinskiFirstIteration) {
    const std::vector<TurtleCommand> expected_commands = {
        TurtleCommand::rotate(60.0f),
        TurtleCommand::advance(15.0f),
        TurtleCommand::rotate(-60.0f),
        TurtleCommand::advance(10.0f),
        TurtleCommand::rotate(-60.0f),
        TurtleCommand::advance(15.0f),
        TurtleCommand::rotate(60.0f)
    };

    SequentialRewriter<char> rewriter;
    SimpleInterpreter<char> interpreter;

    auto generation = make_char_generation("A", test_utils::sierpinski_rules());
    generation = rewriter.iterate(generation);
    ASSERT_EQ(generation.iteration(), 1u);

    auto commands = interpreter.interpret(generation);
    ASSERT_EQ(commands.size(), expected_commands.size());
    for (std::size_t i = 0; i < commands.size(); ++i) {
        EXPECT_EQ(commands[i], expected_commands[i]) << "instruction " << i << ": " << commands[i];
    }
}

TEST(SimpleInterpreterTest, AxiomIsInterpretedDirectly) {
    SimpleInterpreter<char> interpreter;
    auto commands = interpreter.interpret(make_char_generation("A", test_utils::sierpinski_rules()));
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0], TurtleCommand::advance(10.0f));
}

TEST(SimpleInterpreterTest, NoneTagsAndUntaggedSymbolsAreSuppressed) {
    CharRuleTable rules;
    set_str(rules, 'A', "AB");                                  // tagged None
    set_str(rules, 'F', "F", TurtleCommand::advance(2.0f));
    rules.set_production('G', symbols_from_string("G"));        // no tag at all

    SimpleInterpreter<char> interpreter;
    auto commands = interpreter.interpret(make_char_generation("AFGxF", freeze(std::move(rules))));

    ASSERT_EQ(commands.size(), 2u);
    EXPECT_EQ(commands[0], TurtleCommand::advance(2.0f));
    EXPECT_EQ(commands[1], TurtleCommand::advance(2.0f));
    EXPECT_EQ(commands.capacity(), commands.size());
}

TEST(SimpleInterpreterTest, BracketsBecomeStackOperations) {
    SimpleInterpreter<char> interpreter;
    auto commands = interpreter.interpret(make_char_generation("F[+F]X", test_utils::plant_rules()));

    const std::vector<TurtleCommand> expected = {
        TurtleCommand::advance(1.0f),
        TurtleCommand::push_state(),
        TurtleCommand::rotate(25.7f),
        TurtleCommand::advance(1.0f),
        TurtleCommand::pop_state()
    };
    EXPECT_EQ(commands, expected);
}

TEST(SimpleInterpreterTest, SameOutputForEitherRewriter) {
    SequentialRewriter<char> sequential;
    ChunkedRewriter<char> chunked(3, 5);
    SimpleInterpreter<char> interpreter;

    auto a = make_char_generation("A", test_utils::sierpinski_rules());
    auto b = a;
    for (int i = 0; i < 4; ++i) {
        a = sequential.iterate(a);
        b = chunked.iterate(b);
    }
    EXPECT_EQ(interpreter.interpret(a), interpreter.interpret(b));
}

TEST(TurtleCommandTest, EqualityIgnoresValueOfStackOperations) {
    TurtleCommand push = TurtleCommand::push_state();
    TurtleCommand odd_push{TurtleCommand::Kind::PushState, 3.0f};
    EXPECT_EQ(push, odd_push);
    EXPECT_NE(TurtleCommand::advance(1.0f), TurtleCommand::advance(2.0f));
    EXPECT_NE(TurtleCommand::advance(1.0f), TurtleCommand::rotate(1.0f));
    EXPECT_TRUE(TurtleCommand::none().is_none());
}

TEST(TurtleCommandTest, Formatting) {
    EXPECT_EQ(to_string(TurtleCommand::advance(15.0f)), "Advance(15)");
    EXPECT_EQ(to_string(TurtleCommand::rotate(-60.0f)), "Rotate(-60)");
    EXPECT_EQ(to_string(TurtleCommand::push_state()), "PushState");
    EXPECT_EQ(to_string(TurtleCommand::pop_state()), "PopState");
    EXPECT_EQ(to_string(TurtleCommand::none()), "None");
}
