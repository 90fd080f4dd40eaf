// ZKVOTE - Clock Implementation
// Copyright (c) 2024 ZKVOTE Developers
// MIT License

#include "zkvote/ballot/clock.h"
#include "zkvote/util/time.h"

namespace zkvote {
namespace ballot {

Timestamp SystemClock::Now() const {
    return util::GetTime();
}

} // namespace ballot
} // namespace zkvote
