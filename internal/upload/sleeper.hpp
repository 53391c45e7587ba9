#pragma once

#include <chrono>
#include <memory>

namespace twiper::upload {

/*
  Blocking wait used by backoff and STATUS polling.
*/
class Sleeper {
 public:
  virtual ~Sleeper() = default;

  virtual void SleepFor(std::chrono::milliseconds duration) = 0;
};

class ThreadSleeper final : public Sleeper {
 public:
  void SleepFor(std::chrono::milliseconds duration) override;
};

using SleeperPtr = std::shared_ptr<Sleeper>;

} // namespace twiper::upload
