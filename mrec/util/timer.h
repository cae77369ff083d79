#ifndef MREC_UTIL_TIMER_H_
#define MREC_UTIL_TIMER_H_

#include <sys/time.h>

#include <cstdint>

namespace mrec {

namespace util {

/**
 * Wall clock stopwatch, started on construction
 */
class Timer {
 public:
  Timer() : start(Timer::nowMs()) {}

  void reset() { this->start = Timer::nowMs(); }

  // Seconds since construction or the last reset
  double seconds() const {
    return static_cast<double>(Timer::nowMs() - this->start) / 1000.0;
  }

  // Wall clock time in milliseconds
  static uint64_t nowMs() {
    struct timeval now;
    gettimeofday(&now, NULL);

    return static_cast<uint64_t>(now.tv_sec) * 1000 + now.tv_usec / 1000;
  }

 private:
  uint64_t start;
};
}
}

#endif  // MREC_UTIL_TIMER_H_
