#include "sleeper.hpp"

#include <thread>

namespace twiper::upload {

void ThreadSleeper::SleepFor(std::chrono::milliseconds duration) {
  if (duration.count() > 0) {
    std::this_thread::sleep_for(duration);
  }
}

} // namespace twiper::upload
