#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>
#include "types.hpp"

// Shared cancellation flag. Copies refer to the same flag, so a token can be
// handed to worker threads and cancelled from a signal-watcher thread.
class CancelToken {
public:
    CancelToken();

    void cancel() const;
    bool cancelled() const;

    // Sleep up to `d`, waking early on cancel. Returns false if cancelled.
    bool sleep_for(Millis d) const;

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        bool cancelled = false;
    };
    std::shared_ptr<State> state_;
};
