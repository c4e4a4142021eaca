#ifndef LSYSTEM_WORKER_HPP
#define LSYSTEM_WORKER_HPP

#include <lsystem/channel.hpp>
#include <lsystem/debug_log.hpp>
#include <lsystem/errors.hpp>
#include <lsystem/generation.hpp>
#include <lsystem/interpreter.hpp>
#include <lsystem/rewriter.hpp>
#include <lsystem/worker_protocol.hpp>
#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace lsystem {

/**
 * Background worker owning a rewriter, an interpreter and the current
 * generation of one L-system.
 *
 * Callers send WorkerCommands and read WorkerEvents. The worker thread blocks
 * on its command channel and handles commands one at a time in arrival order,
 * replying to each before reading the next. Failures become Error events; the
 * thread only exits on Terminate or when the Worker is destroyed.
 *
 * Usage:
 *   Worker<char> worker(std::make_unique<SequentialRewriter<char>>(),
 *                       std::make_unique<SimpleInterpreter<char>>());
 *   worker.send(WorkerCommand<char>::load(axiom, rules));
 *   worker.send(WorkerCommand<char>::iterate());
 *   auto loaded = worker.next_event();
 *   auto iterated = worker.next_event();
 */
template<typename Symbol>
class Worker {
public:
    using Command = WorkerCommand<Symbol>;

private:
    std::unique_ptr<Rewriter<Symbol>> rewriter_;
    std::unique_ptr<Interpreter<Symbol>> interpreter_;
    Channel<Command> commands_;
    Channel<WorkerEvent> events_;

    // Owned by the worker thread
    std::optional<Generation<Symbol>> current_;
    std::vector<Symbol> axiom_;
    RulesHandle<Symbol> rules_;

    std::thread thread_;

    void reply(WorkerEvent event) {
        DEBUG_LOG("Worker reply: %s", to_string(event.type));
        if (!events_.send(std::move(event))) {
            DEBUG_LOG("Worker: event channel closed, reply dropped");
        }
    }

    void load(Command& command) {
        if (!command.rules) {
            reply(WorkerEvent::error(WorkerErrorCode::Protocol,
                                     "LoadGeneration requires a rule table"));
            return;
        }
        // Nothing is replaced until the new generation exists
        Generation<Symbol> fresh(command.axiom, command.rules, 0);
        axiom_ = std::move(command.axiom);
        rules_ = std::move(command.rules);
        current_ = std::move(fresh);
        reply(WorkerEvent::loaded());
    }

    void iterate_once() {
        try {
            auto next = rewriter_->iterate(*current_);
            current_ = std::move(next);
            reply(WorkerEvent::iterated(current_->iteration()));
        } catch (const std::exception& e) {
            DEBUG_LOG("Worker: %s failed at iteration %llu: %s", rewriter_->name(),
                      static_cast<unsigned long long>(current_->iteration()), e.what());
            reply(WorkerEvent::error(WorkerErrorCode::Rewrite, e.what()));
        }
    }

    void interpret() {
        try {
            reply(WorkerEvent::interpreted(interpreter_->interpret(*current_)));
        } catch (const std::exception& e) {
            DEBUG_LOG("Worker: interpretation failed: %s", e.what());
            reply(WorkerEvent::error(WorkerErrorCode::Interpret, e.what()));
        }
    }

    // Returns false once the worker must stop
    bool handle(Command& command) {
        DEBUG_LOG("Worker command: %s", to_string(command.type));

        switch (command.type) {
            case CommandType::LoadGeneration:
                load(command);
                return true;
            case CommandType::Terminate:
                reply(WorkerEvent::terminated());
                return false;
            default:
                break;
        }

        if (!current_) {
            ProtocolError error(std::string("nothing loaded, ") + to_string(command.type) +
                                " requires a loaded generation");
            reply(WorkerEvent::error(WorkerErrorCode::Protocol, error.what()));
            return true;
        }

        switch (command.type) {
            case CommandType::Reset: {
                Generation<Symbol> fresh(axiom_, rules_, 0);
                current_ = std::move(fresh);
                reply(WorkerEvent::reset());
                break;
            }
            case CommandType::IterateOnce:
                iterate_once();
                break;
            case CommandType::Interpret:
                interpret();
                break;
            default:
                break;
        }
        return true;
    }

    void run() {
        DEBUG_LOG("Worker started with %s", rewriter_->name());
        while (auto command = commands_.receive()) {
            bool keep_running = true;
            try {
                keep_running = handle(*command);
            } catch (const std::exception& e) {
                // A generation or reply could not be built (e.g. out of memory); current_ is untouched
                DEBUG_LOG("Worker: command %s aborted: %s", to_string(command->type), e.what());
                reply(WorkerEvent::error(WorkerErrorCode::Protocol, e.what()));
            }
            if (!keep_running) {
                break;
            }
        }
        // Refuse further commands and let readers see the end of the stream
        commands_.close();
        events_.close();
        DEBUG_LOG("Worker stopped");
    }

public:
    Worker(std::unique_ptr<Rewriter<Symbol>> rewriter, std::unique_ptr<Interpreter<Symbol>> interpreter)
        : rewriter_(std::move(rewriter))
        , interpreter_(std::move(interpreter)) {
        if (!rewriter_ || !interpreter_) {
            throw std::invalid_argument("Worker requires a rewriter and an interpreter");
        }
        thread_ = std::thread([this] { run(); });
    }

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    // Queued commands are still processed before the thread exits
    ~Worker() {
        commands_.close();
        join();
    }

    // Returns false once the worker no longer accepts commands
    bool send(Command command) {
        return commands_.send(std::move(command));
    }

    // Blocks for the next event; empty once the worker has stopped and every event was read
    std::optional<WorkerEvent> next_event() {
        return events_.receive();
    }

    template<typename Rep, typename Period>
    std::optional<WorkerEvent> next_event_for(const std::chrono::duration<Rep, Period>& timeout) {
        return events_.receive_for(timeout);
    }

    /**
     * Send a command and wait for its reply (the expected event or an Error).
     * Pending events that cannot answer the command are skipped.
     * Returns an empty optional if the command was refused or the worker stopped.
     */
    std::optional<WorkerEvent> request(Command command) {
        const CommandType type = command.type;
        if (!send(std::move(command))) {
            return std::nullopt;
        }
        while (auto event = next_event()) {
            if (event->answers(type)) {
                return event;
            }
            DEBUG_LOG("Worker::request(%s): skipping %s", to_string(type), to_string(event->type));
        }
        return std::nullopt;
    }

    void join() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    bool accepting_commands() const {
        return !commands_.is_closed();
    }
};

} // namespace lsystem

#endif // LSYSTEM_WORKER_HPP
