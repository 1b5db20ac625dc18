#ifndef TICK_SCHEDULER_HPP
#define TICK_SCHEDULER_HPP

#include <array>
#include <cstddef>
#include <cstdint>

// Fixed-capacity, header-only cooperative tick table.
// - No dynamic allocation; entries are embedded.
// - Single-threaded: the owning task calls runDue() and sleeps in between.
// - Entries fire at a fixed rate (next_due += period). If an entry falls a full
//   period or more behind it is resynchronised to now + period instead of
//   replaying missed ticks.
// - Time is a wrapping millisecond counter; comparisons are wrap-safe.
template<std::size_t Capacity>
class TickScheduler {
public:
    static_assert(Capacity > 0, "TickScheduler capacity must be greater than zero");

    // Return false to retire the entry.
    using TickFn = bool (*)(void* arg, uint32_t now_ms);

    TickScheduler() : entries{}, count(0) {}

    bool add(TickFn fn, void* arg, uint32_t period_ms, uint32_t first_due_ms) {
        if (fn == nullptr || period_ms == 0) {
            return false;
        }
        for (Entry& e : entries) {
            if (!e.active) {
                e.fn = fn;
                e.arg = arg;
                e.period_ms = period_ms;
                e.next_due_ms = first_due_ms;
                e.active = true;
                ++count;
                return true;
            }
        }
        return false;
    }

    // Run every due entry once. Returns the number of callbacks invoked.
    std::size_t runDue(uint32_t now_ms) {
        std::size_t ran = 0;
        for (Entry& e : entries) {
            if (!e.active || !isDue(e.next_due_ms, now_ms)) {
                continue;
            }
            ++ran;
            bool keep = e.fn(e.arg, now_ms);
            if (!keep) {
                e.active = false;
                --count;
                continue;
            }
            e.next_due_ms += e.period_ms;
            if (isDue(e.next_due_ms, now_ms)) {
                e.next_due_ms = now_ms + e.period_ms;
            }
        }
        return ran;
    }

    // Milliseconds until the earliest active entry is due (0 if overdue).
    // Returns false when no entry is active.
    bool nextDelay(uint32_t now_ms, uint32_t& out_delay_ms) const {
        bool found = false;
        uint32_t best = 0;
        for (const Entry& e : entries) {
            if (!e.active) {
                continue;
            }
            uint32_t delay = isDue(e.next_due_ms, now_ms) ? 0U : (e.next_due_ms - now_ms);
            if (!found || delay < best) {
                best = delay;
                found = true;
            }
        }
        out_delay_ms = best;
        return found;
    }

    std::size_t activeCount() const {
        return count;
    }

    std::size_t getCapacity() const {
        return Capacity;
    }

private:
    struct Entry {
        TickFn   fn;
        void*    arg;
        uint32_t period_ms;
        uint32_t next_due_ms;
        bool     active;
    };

    static bool isDue(uint32_t due_ms, uint32_t now_ms) {
        return static_cast<int32_t>(now_ms - due_ms) >= 0;
    }

    std::array<Entry, Capacity> entries;
    std::size_t count;
};

#endif // TICK_SCHEDULER_HPP
