#ifndef LSYSTEM_CHAR_LSYSTEM_HPP
#define LSYSTEM_CHAR_LSYSTEM_HPP

#include <lsystem/generation.hpp>
#include <lsystem/rule_table.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace lsystem {

// Text-based instantiations: one char (or one byte) per symbol
using CharRuleTable = RuleTable<char>;
using ByteRuleTable = RuleTable<std::uint8_t>;
using CharGeneration = Generation<char>;
using ByteGeneration = Generation<std::uint8_t>;

std::vector<char> symbols_from_string(std::string_view text);
std::vector<std::uint8_t> bytes_from_string(std::string_view text);

// Set a production from a string; returns true if an existing production was replaced
bool set_str(CharRuleTable& rules, char symbol, std::string_view production,
             TurtleCommand tag = TurtleCommand::none());
bool set_ascii(ByteRuleTable& rules, std::uint8_t symbol, std::string_view production,
               TurtleCommand tag = TurtleCommand::none());

CharGeneration make_char_generation(std::string_view axiom, RulesHandle<char> rules);

std::string to_string(const CharGeneration& generation);

} // namespace lsystem

#endif // LSYSTEM_CHAR_LSYSTEM_HPP
