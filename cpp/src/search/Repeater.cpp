#include "search/Repeater.hpp"

#include "util/CppUtil.hpp"

namespace search {

Repeater::Repeater(std::function<void()> func, int64_t timeout_ns)
    : func_(std::move(func)), timeout_ns_(timeout_ns) {}

Repeater::Result Repeater::operator()() {
  Result result;
  int64_t start_ns = util::ns_since_epoch();
  int64_t deadline_ns = start_ns + timeout_ns_;
  int64_t now_ns = start_ns;
  do {
    func_();
    ++result.iterations;
    now_ns = util::ns_since_epoch();
  } while (now_ns < deadline_ns && !cancelled_);

  cancelled_ = false;
  result.elapsed_ns = now_ns - start_ns;
  return result;
}

}  // namespace search
