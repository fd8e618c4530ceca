#ifndef TIMER_H
#define TIMER_H

#include <cstdint>

// Accumulating wall clock timer, reports milliseconds
class Timer
{
public:
  typedef uint64_t NanoSeconds;

  // times the lifetime of the scope it is declared in
  class Scope
  {
  public:
    explicit Scope(Timer& timer) : timer_(timer) { timer_.start(); }
    ~Scope() { timer_.stop(); }
  private:
    Timer& timer_;
    Scope(const Scope&);
    Scope& operator=(const Scope&);
  };

  Timer() : total_(0), time_(0), running_(false) {}
  void start();
  void stop();
  double elapsed() const;
  void reset();
private:
  NanoSeconds total_;
  NanoSeconds time_;
  bool running_;
  static NanoSeconds currentTime();
};

#endif
