// Counting semaphore with FIFO hand-off. Admits at most `limit` holders at a
// time; waiters are served strictly in arrival order.
#pragma once
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>

namespace owlxfer {

class ConcurrencyGate {
public:
    explicit ConcurrencyGate(int limit);

    ConcurrencyGate(const ConcurrencyGate &) = delete;
    ConcurrencyGate &operator=(const ConcurrencyGate &) = delete;

    // Blocks until a permit is available and every earlier waiter was served.
    void acquire();
    // Takes a permit only if one is free and nobody is queued. Never blocks.
    bool tryAcquire();
    // Returns a permit. Each successful acquire must be paired with one release.
    void release();

    // Changes capacity at run time. Lowering it below the permits currently
    // held is absorbed by later releases.
    void setLimit(int limit);

    int limit() const;
    int available() const;
    int waiting() const;

private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    int limit_ = 1;
    int available_ = 1;
    std::deque<std::uint64_t> waiters_;
    std::uint64_t nextTicket_ = 0;
};

} // namespace owlxfer
