#pragma once
#include <atomic>
#include <memory>

namespace common {

    // The Token (View) - Passed to workers
    class CancellationToken {
        struct State {
            std::atomic<bool> requested{false};
        };
        std::shared_ptr<State> state;

    public:
        CancellationToken() : state(std::make_shared<State>()) {}

        // Check with ACQUIRE memory order (sees writes from owner)
        bool is_cancellation_requested() const {
            return state && state->requested.load(std::memory_order_acquire);
        }

        friend class CancellationSource;
    };

    // The Source (Owner) - Held by controller
    //
    // Doubles as the recorder stop flag: false -> true only, never reset.
    class CancellationSource {
        CancellationToken token;

    public:
        CancellationSource() = default;

        // Set with RELEASE memory order (flushes prior writes).
        // Returns true only for the call that performed the transition.
        bool cancel() {
            if (!token.state) return false;
            return !token.state->requested.exchange(true, std::memory_order_acq_rel);
        }

        bool is_cancelled() const { return token.is_cancellation_requested(); }

        CancellationToken get_token() const { return token; }
    };

} // namespace common
