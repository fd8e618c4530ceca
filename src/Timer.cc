#include "Timer.h"

#include <time.h>

void Timer::start()
{
  time_ = currentTime();
  running_ = true;
}

void Timer::stop()
{
  if (!running_) {
    return;
  }
  total_ += currentTime() - time_;
  time_ = 0;
  running_ = false;
}

double Timer::elapsed() const
{
  NanoSeconds total = total_;
  if (running_) {
    total += currentTime() - time_;
  }
  return static_cast<double>(1e-6 * total);
}

void Timer::reset()
{
  total_ = 0;
  time_ = 0;
  running_ = false;
}

// private
Timer::NanoSeconds Timer::currentTime()
{
  struct timespec s;
  clock_gettime(CLOCK_MONOTONIC, &s);
  return static_cast<NanoSeconds>(s.tv_sec) * 1000000000ULL + static_cast<NanoSeconds>(s.tv_nsec);
}
