#ifndef _COMMON_UTILS_TIME_H_
#define _COMMON_UTILS_TIME_H_

#include "base/defines.hpp"

#include <stdint.h>

namespace naivecall {

static constexpr int64_t kNumMillisecsPerSec = INT64_C(1000);
static constexpr int64_t kNumMicrosecsPerSec = INT64_C(1000000);
static constexpr int64_t kNumNanosecsPerSec = INT64_C(1000000000);

static constexpr int64_t kNumMicrosecsPerMillisec = kNumMicrosecsPerSec / kNumMillisecsPerSec;
static constexpr int64_t kNumNanosecsPerMillisec = kNumNanosecsPerSec / kNumMillisecsPerSec;

namespace utils {
namespace time {

// Monotonic time
// Returns the current monotonic time in milliseconds in 64 bits.
int64_t TimeInMillis();

// UTC time
// Returns the number of milliseconds since January 1, 1970, UTC.
// It is not guaranteed to be monotonic, use it to stamp messages 
// exchanged with other devices, never to measure intervals.
int64_t TimeUTCInMillis();
    
} // namespace time
} // namespace utils
} // namespace naivecall

#endif
