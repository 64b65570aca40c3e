#ifndef CARDEX_CLOCK_HPP
#define CARDEX_CLOCK_HPP

#include <atomic>
#include <chrono>
#include <cstdint>

namespace cardex {

// Block time source. Every time-dependent rule (listing windows, auction
// ends, Dutch decay, draw entropy) reads the time through this interface.
class Clock {
public:
    virtual ~Clock() = default;

    // Current block timestamp in seconds
    virtual uint64_t now() const = 0;

    // Current block height
    virtual uint64_t block_number() const = 0;
};

// Wall clock; one block per second
class SystemClock : public Clock {
public:
    uint64_t now() const override {
        return static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::system_clock::now().time_since_epoch()
            ).count()
        );
    }

    uint64_t block_number() const override { return now(); }
};

// Manually advanced clock for simulations and tests
class ManualClock : public Clock {
public:
    explicit ManualClock(uint64_t start = 1700000000, uint64_t height = 1)
        : now_(start), height_(height) {}

    uint64_t now() const override { return now_.load(); }
    uint64_t block_number() const override { return height_.load(); }

    void set(uint64_t timestamp) { now_.store(timestamp); }

    // Advances time and mines one block
    void advance(uint64_t seconds) {
        now_.fetch_add(seconds);
        height_.fetch_add(1);
    }

private:
    std::atomic<uint64_t> now_;
    std::atomic<uint64_t> height_;
};

} // namespace cardex

#endif // CARDEX_CLOCK_HPP
