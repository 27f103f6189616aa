// Callback signatures shared by the executors.
#pragma once
#include <cstdint>
#include <functional>

namespace owlxfer {

// bytesDone so far, and the fraction in [0, 1] to display.
using ProgressFn = std::function<void(std::uint64_t bytesDone, double fraction)>;
// Polled between chunks; returning true stops the transfer.
using CancelFn = std::function<bool()>;
// Size of the object once it is known (after a HEAD).
using SizeFn = std::function<void(std::uint64_t size)>;

constexpr const char *kCancelledMessage = "Transfer cancelled";

} // namespace owlxfer
