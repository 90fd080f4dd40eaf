// ZKVOTE - Clock
// Copyright (c) 2024 ZKVOTE Developers
// MIT License

#ifndef ZKVOTE_BALLOT_CLOCK_H
#define ZKVOTE_BALLOT_CLOCK_H

#include "zkvote/core/types.h"

#include <atomic>

namespace zkvote {
namespace ballot {

/// Time source for phase checks and record timestamps
class Clock {
public:
    virtual ~Clock() = default;

    /// Current Unix time in seconds
    virtual Timestamp Now() const = 0;
};

/// Wall clock; follows util mock time when it is enabled
class SystemClock : public Clock {
public:
    Timestamp Now() const override;
};

/// Clock that only moves when told to
class ManualClock : public Clock {
public:
    explicit ManualClock(Timestamp start = 0) : now_(start) {}

    Timestamp Now() const override { return now_.load(); }

    void Set(Timestamp t) { now_.store(t); }

    void Advance(int64_t seconds) { now_.fetch_add(seconds); }

private:
    std::atomic<Timestamp> now_;
};

} // namespace ballot
} // namespace zkvote

#endif // ZKVOTE_BALLOT_CLOCK_H
