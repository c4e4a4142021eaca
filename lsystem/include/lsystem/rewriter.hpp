#ifndef LSYSTEM_REWRITER_HPP
#define LSYSTEM_REWRITER_HPP

#include <lsystem/errors.hpp>
#include <lsystem/generation.hpp>
#include <algorithm>
#include <cstddef>
#include <limits>
#include <string>
#include <vector>

namespace lsystem {

/**
 * Upper bound on the number of symbols a rewriter may allocate for one state.
 * The default is the largest length a std::vector can hold.
 */
struct RewriteLimits {
    std::size_t max_state_length = std::numeric_limits<std::size_t>::max();
};

// Overflow-checked size arithmetic. Both throw OverflowError instead of wrapping.
std::size_t checked_multiply(std::size_t a, std::size_t b, const char* context);
std::size_t checked_add(std::size_t a, std::size_t b, const char* context);

// Throws OverflowError if `length` exceeds the limit
void check_state_length(std::size_t length, std::size_t limit, const char* context);

/**
 * Rewrite `count` symbols starting at `symbols` into their successors.
 *
 * The output is reserved for the worst case (count * biggest_expansion) and
 * shrunk to its real length before returning. Symbols without a production
 * follow the table's UnmappedSymbolPolicy.
 */
template<typename Symbol, typename Tag>
std::vector<Symbol> rewrite_slice(const Symbol* symbols, std::size_t count,
                                  const RuleTable<Symbol, Tag>& rules,
                                  const RewriteLimits& limits = RewriteLimits{}) {
    const std::size_t worst_case = checked_multiply(count, rules.biggest_expansion(),
                                                    "rewrite_slice: worst-case state size");
    std::vector<Symbol> result;
    check_state_length(worst_case, std::min(limits.max_state_length, result.max_size()),
                       "rewrite_slice: worst-case state size");
    result.reserve(worst_case);

    const bool keep_unmapped = rules.unmapped_policy() == UnmappedSymbolPolicy::Identity;
    for (std::size_t i = 0; i < count; ++i) {
        const Symbol& s = symbols[i];
        if (const auto* production = rules.production(s)) {
            result.insert(result.end(), production->begin(), production->end());
        } else if (keep_unmapped) {
            result.push_back(s);
        }
    }
    result.shrink_to_fit();

    return result;
}

/**
 * Evolves a generation into its successor according to the generation's rules.
 * Implementations report failures by throwing an LSystemException subclass
 * and never modify the input.
 */
template<typename Symbol, typename Tag = TurtleCommand>
class Rewriter {
public:
    virtual ~Rewriter() = default;

    virtual Generation<Symbol, Tag> iterate(const Generation<Symbol, Tag>& generation) = 0;

    virtual const char* name() const = 0;
};

} // namespace lsystem

#endif // LSYSTEM_REWRITER_HPP
