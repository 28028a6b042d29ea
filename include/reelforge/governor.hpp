/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

#include "reelforge/context.hpp"
#include "reelforge/types.hpp"

namespace reelforge {

class ResourceGovernor;

// Scoped grant of governor capacity. Returns its capacity exactly once, on
// release() or destruction, whichever comes first. Must not outlive the governor.
class Lease {
public:
    Lease() noexcept = default;
    ~Lease();

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;
    Lease(Lease&& other) noexcept;
    Lease& operator=(Lease&& other) noexcept;

    void release() noexcept;
    [[nodiscard]] bool valid() const noexcept { return governor_ != nullptr; }
    [[nodiscard]] std::uint64_t id() const noexcept { return id_; }
    [[nodiscard]] unsigned cost() const noexcept { return cost_; }

private:
    friend class ResourceGovernor;
    Lease(ResourceGovernor* governor, std::uint64_t id, unsigned cost) noexcept
        : governor_(governor), id_(id), cost_(cost) {}

    ResourceGovernor* governor_ = nullptr;
    std::uint64_t id_ = 0;
    unsigned cost_ = 0;
};

enum class LeaseError : uint8_t {
    None = 0,
    InvalidCost,
    ResourceTimeout,
    Cancelled,
    ShuttingDown,
    Busy
};

struct LeaseResult {
    bool ok = false;
    Lease lease;
    LeaseError error = LeaseError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Grants render capacity in strict request order (FIFO). The sum of the cost
// of outstanding leases never exceeds capacity.
class ResourceGovernor {
public:
    explicit ResourceGovernor(unsigned capacity) noexcept;
    ~ResourceGovernor();

    ResourceGovernor(const ResourceGovernor&) = delete;
    ResourceGovernor& operator=(const ResourceGovernor&) = delete;
    ResourceGovernor(ResourceGovernor&&) = delete;
    ResourceGovernor& operator=(ResourceGovernor&&) = delete;

    // Blocks until granted, timed out (timeout <= 0 waits indefinitely) or cancelled.
    [[nodiscard]] LeaseResult acquire(unsigned costHint, Millis timeout, const CancelFlag& cancel = nullptr);
    // Grants only if no earlier request is waiting and the cost fits now.
    [[nodiscard]] LeaseResult tryAcquire(unsigned costHint);
    // Returns false for unknown or already released leases.
    bool release(std::uint64_t leaseId) noexcept;

    // Re-check waiters, e.g. after a cancel flag was raised.
    void wake() noexcept;
    // Fail current and future waiters. Outstanding leases stay valid.
    void shutdown() noexcept;

    [[nodiscard]] unsigned capacity() const noexcept { return capacity_; }
    [[nodiscard]] unsigned inUse() const noexcept;
    [[nodiscard]] unsigned peakInUse() const noexcept;
    [[nodiscard]] std::size_t waiting() const noexcept;
    [[nodiscard]] std::size_t outstanding() const noexcept;

private:
    struct Waiter {
        std::uint64_t ticket;
        unsigned cost;
    };

    [[nodiscard]] bool headFits(std::uint64_t ticket) const noexcept;
    LeaseResult grant(std::uint64_t ticket, unsigned cost);
    void dropWaiter(std::uint64_t ticket) noexcept;

    const unsigned capacity_;

    mutable std::mutex mutex_;
    std::condition_variable changed_;
    std::deque<Waiter> queue_;
    std::unordered_map<std::uint64_t, unsigned> leases_;
    unsigned inUse_ = 0;
    unsigned peak_ = 0;
    std::uint64_t nextTicket_ = 1;
    bool shutdown_ = false;
};

[[nodiscard]] const char* leaseErrorName(LeaseError error) noexcept;

}
