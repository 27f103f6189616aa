#include "owlxfer/ConcurrencyGate.hpp"

#include <algorithm>

namespace owlxfer {

ConcurrencyGate::ConcurrencyGate(int limit)
    : limit_(std::max(1, limit)), available_(std::max(1, limit)) {}

void ConcurrencyGate::acquire() {
    std::unique_lock<std::mutex> lk(mtx_);
    const std::uint64_t ticket = nextTicket_++;
    waiters_.push_back(ticket);
    cv_.wait(lk, [this, ticket] {
        return available_ > 0 && waiters_.front() == ticket;
    });
    waiters_.pop_front();
    --available_;
    // The next waiter may also be admissible now.
    if (!waiters_.empty() && available_ > 0)
        cv_.notify_all();
}

bool ConcurrencyGate::tryAcquire() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (available_ <= 0 || !waiters_.empty())
        return false;
    --available_;
    return true;
}

void ConcurrencyGate::release() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        ++available_;
    }
    cv_.notify_all();
}

void ConcurrencyGate::setLimit(int limit) {
    limit = std::max(1, limit);
    {
        std::lock_guard<std::mutex> lk(mtx_);
        available_ += limit - limit_;
        limit_ = limit;
    }
    cv_.notify_all();
}

int ConcurrencyGate::limit() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return limit_;
}

int ConcurrencyGate::available() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return std::max(0, available_);
}

int ConcurrencyGate::waiting() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return static_cast<int>(waiters_.size());
}

} // namespace owlxfer
