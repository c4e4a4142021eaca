#ifndef LSYSTEM_GENERATION_HPP
#define LSYSTEM_GENERATION_HPP

#include <lsystem/rule_table.hpp>
#include <cstdint>
#include <stdexcept>
#include <utility>
#include <vector>

namespace lsystem {

/**
 * One generation of an L-system: the symbol sequence after `iteration`
 * rewrite steps, together with the rules that produced it.
 *
 * A Generation is never modified after construction. Rewriters return a new
 * Generation that shares the same rules handle.
 */
template<typename Symbol, typename Tag = TurtleCommand>
class Generation {
public:
    using symbol_type = Symbol;
    using Rules = RuleTable<Symbol, Tag>;
    using Handle = RulesHandle<Symbol, Tag>;

private:
    std::uint64_t iteration_;
    std::vector<Symbol> state_;
    Handle rules_;

public:
    Generation(std::vector<Symbol> state, Handle rules, std::uint64_t iteration = 0)
        : iteration_(iteration)
        , state_(std::move(state))
        , rules_(std::move(rules)) {
        if (!rules_) {
            throw std::invalid_argument("Generation requires a rule table");
        }
    }

    std::uint64_t iteration() const { return iteration_; }

    const std::vector<Symbol>& state() const { return state_; }

    std::size_t size() const { return state_.size(); }

    bool empty() const { return state_.empty(); }

    const Rules& rules() const { return *rules_; }

    const Handle& rules_handle() const { return rules_; }

    // The generation one step after this one, with the given state and the same rules
    Generation successor(std::vector<Symbol> next_state) const {
        return Generation(std::move(next_state), rules_, iteration_ + 1);
    }
};

} // namespace lsystem

#endif // LSYSTEM_GENERATION_HPP
