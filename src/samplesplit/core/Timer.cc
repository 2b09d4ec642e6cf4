#include "core/Timer.h"

Timer::Timer()
  : startTime(0),
    stopTime(0),
    started(false) {
}

void Timer::start() {
  startTime = Timer::posixTimeInMicros();
  started = true;
}

void Timer::stop() {
  stopTime = Timer::posixTimeInMicros();
  started = false;
}

uint64_t Timer::getElapsed() const {
  if (stopTime < startTime) {
    return 0;
  } else {
    return stopTime - startTime;
  }
}

uint64_t Timer::getStartTime() const {
  return startTime;
}

uint64_t Timer::getStopTime() const {
  return stopTime;
}

bool Timer::isRunning() const {
  return started;
}
