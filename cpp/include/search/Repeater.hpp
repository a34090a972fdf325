#pragma once

#include <atomic>
#include <cstdint>
#include <functional>

namespace search {

/*
 * Calls func repeatedly until timeout_ns has elapsed since operator() was invoked, or until
 * cancel() is called. func is always called at least once, and the deadline is checked only
 * between calls. An exception thrown by func stops the loop and propagates.
 *
 * cancel() may be called from another thread. It affects the ongoing (or next) invocation only.
 */
class Repeater {
 public:
  struct Result {
    int64_t iterations = 0;
    int64_t elapsed_ns = 0;
  };

  Repeater(std::function<void()> func, int64_t timeout_ns);

  Result operator()();

  void cancel() { cancelled_ = true; }

  int64_t timeout_ns() const { return timeout_ns_; }
  void set_timeout_ns(int64_t timeout_ns) { timeout_ns_ = timeout_ns; }

 private:
  std::function<void()> func_;
  int64_t timeout_ns_;
  std::atomic<bool> cancelled_ = false;
};

}  // namespace search
