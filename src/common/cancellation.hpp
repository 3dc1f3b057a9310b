#pragma once

#include <atomic>
#include <memory>

namespace odal {

// Read side of a cancellation flag. A default token is never cancelled.
class CancellationToken {
public:
    CancellationToken() = default;

    bool isCancellationRequested() const {
        return state && state->requested.load(std::memory_order_acquire);
    }

    bool canBeCancelled() const {
        return state != nullptr;
    }

private:
    struct State {
        std::atomic<bool> requested{false};
    };

    explicit CancellationToken(std::shared_ptr<State> state) : state(std::move(state)) {}

    std::shared_ptr<State> state;

    friend class CancellationSource;
};

// Owner side, held by whoever may abort the work.
class CancellationSource {
public:
    CancellationSource() : state(std::make_shared<CancellationToken::State>()) {}

    void cancel() {
        state->requested.store(true, std::memory_order_release);
    }

    bool isCancellationRequested() const {
        return state->requested.load(std::memory_order_acquire);
    }

    CancellationToken getToken() const {
        return CancellationToken(state);
    }

    // Fresh state; tokens handed out earlier keep the old flag.
    void reset() {
        state = std::make_shared<CancellationToken::State>();
    }

private:
    std::shared_ptr<CancellationToken::State> state;
};

} // namespace odal
