#ifndef LSYSTEM_SEQUENTIAL_REWRITER_HPP
#define LSYSTEM_SEQUENTIAL_REWRITER_HPP

#include <lsystem/rewriter.hpp>
#include <lsystem/debug_log.hpp>

namespace lsystem {

/**
 * Single-threaded rewriter. Blocks the calling thread for the whole rewrite,
 * which grows exponentially with most grammars.
 */
template<typename Symbol, typename Tag = TurtleCommand>
class SequentialRewriter : public Rewriter<Symbol, Tag> {
private:
    RewriteLimits limits_;

public:
    explicit SequentialRewriter(RewriteLimits limits = RewriteLimits{}) : limits_(limits) {}

    Generation<Symbol, Tag> iterate(const Generation<Symbol, Tag>& generation) override {
        DEBUG_LOG("SequentialRewriter: iteration %llu, %zu symbols",
                  static_cast<unsigned long long>(generation.iteration()), generation.size());

        auto next_state = rewrite_slice(generation.state().data(), generation.size(),
                                        generation.rules(), limits_);
        return generation.successor(std::move(next_state));
    }

    const char* name() const override { return "SequentialRewriter"; }

    const RewriteLimits& limits() const { return limits_; }
};

} // namespace lsystem

#endif // LSYSTEM_SEQUENTIAL_REWRITER_HPP
