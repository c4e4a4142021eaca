#ifndef LSYSTEM_CHUNKED_REWRITER_HPP
#define LSYSTEM_CHUNKED_REWRITER_HPP

#include <lsystem/rewriter.hpp>
#include <lsystem/debug_log.hpp>
#include <job_system/job_system.hpp>
#include <algorithm>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace lsystem {

enum class ChunkTaskType {
    REWRITE_CHUNK
};

inline const char* to_string(ChunkTaskType type) {
    switch (type) {
        case ChunkTaskType::REWRITE_CHUNK: return "rewrite-chunk";
    }
    return "unknown";
}

/**
 * Parallel rewriter. Splits a state into contiguous chunks of `chunk_size`
 * symbols, rewrites each chunk as a job on a pool of `max_tasks` threads and
 * reassembles the results in chunk order.
 *
 * Every chunk writes to its own pre-allocated result slot, so the fan-out
 * phase shares no mutable state. iterate() blocks until all chunks are done;
 * the output is identical to SequentialRewriter's for any chunking.
 *
 * Typical values: max_tasks = logical core count, chunk_size between
 * 100'000 and 1'000'000 symbols.
 */
template<typename Symbol, typename Tag = TurtleCommand>
class ChunkedRewriter : public Rewriter<Symbol, Tag> {
public:
    // Runs on a pool thread at the start of every chunk job
    using ChunkHook = std::function<void(std::size_t chunk_index)>;

private:
    struct ChunkSlot {
        std::vector<Symbol> symbols;
        std::string error;
        bool failed = false;
    };

    std::size_t max_tasks_;
    std::size_t chunk_size_;
    RewriteLimits limits_;
    ChunkHook chunk_hook_;
    std::unique_ptr<job_system::JobSystem<ChunkTaskType>> job_system_;

    // The pool's completion barrier covers every submitted job, so rewrites
    // through one instance are serialized
    std::mutex iterate_mutex_;

    static std::size_t validated(std::size_t value, const char* what) {
        if (value == 0) {
            throw ConfigError(std::string("ChunkedRewriter: ") + what + " must be greater than zero");
        }
        return value;
    }

    void dispatch(std::vector<ChunkSlot>& slots, const std::vector<Symbol>& state,
                  const RuleTable<Symbol, Tag>& rules) {
        const std::size_t length = state.size();
        for (std::size_t index = 0; index < slots.size(); ++index) {
            const std::size_t begin = index * chunk_size_;
            const std::size_t count = std::min(chunk_size_, length - begin);
            const Symbol* chunk = state.data() + begin;
            ChunkSlot* slot = &slots[index];

            job_system_->submit_function([this, slot, chunk, count, index, &rules]() {
                try {
                    if (chunk_hook_) {
                        chunk_hook_(index);
                    }
                    slot->symbols = rewrite_slice(chunk, count, rules, limits_);
                } catch (const std::exception& e) {
                    slot->error = "chunk " + std::to_string(index) + ": " + e.what();
                    slot->failed = true;
                }
            }, ChunkTaskType::REWRITE_CHUNK, job_system::ScheduleMode::FIFO);
        }
    }

public:
    ChunkedRewriter(std::size_t max_tasks, std::size_t chunk_size,
                    RewriteLimits limits = RewriteLimits{})
        : max_tasks_(validated(max_tasks, "max_tasks"))
        , chunk_size_(validated(chunk_size, "chunk_size"))
        , limits_(limits)
        , job_system_(std::make_unique<job_system::JobSystem<ChunkTaskType>>(max_tasks_)) {
        job_system_->start();
        DEBUG_LOG("ChunkedRewriter created: %zu tasks, %zu symbols per chunk", max_tasks_, chunk_size_);
    }

    ~ChunkedRewriter() override {
        if (job_system_) {
            job_system_->wait_for_completion();
            job_system_->shutdown();
        }
    }

    ChunkedRewriter(const ChunkedRewriter&) = delete;
    ChunkedRewriter& operator=(const ChunkedRewriter&) = delete;

    Generation<Symbol, Tag> iterate(const Generation<Symbol, Tag>& generation) override {
        std::lock_guard<std::mutex> guard(iterate_mutex_);

        const auto& state = generation.state();
        if (state.empty()) {
            throw EmptyStateError("ChunkedRewriter cannot rewrite an empty state");
        }

        const std::size_t num_chunks = state.size() / chunk_size_ + (state.size() % chunk_size_ != 0 ? 1 : 0);
        DEBUG_LOG("ChunkedRewriter: iteration %llu, %zu symbols in %zu chunks",
                  static_cast<unsigned long long>(generation.iteration()), state.size(), num_chunks);

        std::vector<ChunkSlot> slots(num_chunks);
        try {
            dispatch(slots, state, generation.rules());
        } catch (const std::exception& e) {
            // Jobs already queued still point into slots
            DEBUG_LOG("ChunkedRewriter: dispatch failed: %s", e.what());
            job_system_->wait_for_completion();
            throw;
        }
        job_system_->wait_for_completion();

        std::vector<std::string> errors;
        // Only exceptions not derived from std::exception get past a chunk job
        if (job_system_->has_error()) {
            const auto kind = job_system_->get_failed_job_type();
            errors.push_back(std::string(kind ? to_string(*kind) : "unknown") + " job: " +
                             job_system_->get_error_message());
            job_system_->clear_error();
        }
        for (const auto& slot : slots) {
            if (slot.failed) {
                errors.push_back(slot.error);
            }
        }
        if (!errors.empty()) {
            DEBUG_LOG("ChunkedRewriter: %zu chunk(s) failed", errors.size());
            throw AggregatedChunkError(std::move(errors));
        }

        std::size_t total = 0;
        for (const auto& slot : slots) {
            total = checked_add(total, slot.symbols.size(), "ChunkedRewriter: assembled state size");
        }
        check_state_length(total, limits_.max_state_length, "ChunkedRewriter: assembled state size");

        std::vector<Symbol> next_state;
        next_state.reserve(total);
        for (auto& slot : slots) {
            next_state.insert(next_state.end(), slot.symbols.begin(), slot.symbols.end());
            std::vector<Symbol>().swap(slot.symbols);
        }

        return generation.successor(std::move(next_state));
    }

    const char* name() const override { return "ChunkedRewriter"; }

    // Must not be changed while a rewrite is running
    void set_chunk_hook(ChunkHook hook) {
        std::lock_guard<std::mutex> guard(iterate_mutex_);
        chunk_hook_ = std::move(hook);
    }

    std::size_t max_tasks() const { return max_tasks_; }
    std::size_t chunk_size() const { return chunk_size_; }
    const RewriteLimits& limits() const { return limits_; }
};

} // namespace lsystem

#endif // LSYSTEM_CHUNKED_REWRITER_HPP
