#include "common/utils_time.hpp"

#if defined(NAIVECALL_POSIX)
#include <sys/time.h>
#include <time.h>
#endif

namespace naivecall {
namespace utils {
namespace time {

int64_t TimeInMillis() {
#if defined(NAIVECALL_POSIX)
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return kNumMillisecsPerSec * static_cast<int64_t>(ts.tv_sec) +
           static_cast<int64_t>(ts.tv_nsec) / kNumNanosecsPerMillisec;
#else
    #error "Unsupported platform"
#endif
}

int64_t TimeUTCInMillis() {
#if defined(NAIVECALL_POSIX)
    // Using gettimeofday instead of clock_gettime
    struct timeval time;
    gettimeofday(&time, nullptr);
    return static_cast<int64_t>(time.tv_sec) * kNumMillisecsPerSec + time.tv_usec / kNumMicrosecsPerMillisec; 
#else
    #error "Unsupported platform"
#endif
}
    
} // namespace time
} // namespace utils
} // namespace naivecall
