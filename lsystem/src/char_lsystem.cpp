#include <lsystem/char_lsystem.hpp>
#include <utility>

namespace lsystem {

std::vector<char> symbols_from_string(std::string_view text) {
    return std::vector<char>(text.begin(), text.end());
}

std::vector<std::uint8_t> bytes_from_string(std::string_view text) {
    std::vector<std::uint8_t> bytes;
    bytes.reserve(text.size());
    for (char c : text) {
        bytes.push_back(static_cast<std::uint8_t>(c));
    }
    return bytes;
}

bool set_str(CharRuleTable& rules, char symbol, std::string_view production, TurtleCommand tag) {
    return rules.set(symbol, symbols_from_string(production), tag);
}

bool set_ascii(ByteRuleTable& rules, std::uint8_t symbol, std::string_view production, TurtleCommand tag) {
    return rules.set(symbol, bytes_from_string(production), tag);
}

CharGeneration make_char_generation(std::string_view axiom, RulesHandle<char> rules) {
    return CharGeneration(symbols_from_string(axiom), std::move(rules));
}

std::string to_string(const CharGeneration& generation) {
    return std::string(generation.state().begin(), generation.state().end());
}

} // namespace lsystem
