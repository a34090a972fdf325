#include "util/BoostUtil.hpp"
#include "util/Random.hpp"

#include <algorithm>
#include <ctime>
#include <iterator>
#include <stdexcept>

namespace util {

inline auto Random::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Random options");

  return desc.template add_option<"seed">(po::value<int>(&seed)->default_value(seed),
                                          "random seed (default: 0 means seed with current time)");
}

inline void Random::init(const Params& params) {
  if (params.seed) {
    set_seed(params.seed);
  }
}

inline void Random::set_seed(int seed) { default_prng().seed(seed); }

template <std::integral T, std::integral U>
inline auto Random::uniform_sample(std::mt19937& prng, T lower, U upper) {
  if (lower >= upper) {
    throw std::runtime_error("Random::uniform_sample() - invalid range");
  }
  using V = std::common_type_t<T, U>;
  std::uniform_int_distribution<V> dist{(V)lower, (V)(upper - 1)};
  return dist(prng);
}

template <std::integral T, std::integral U>
inline auto Random::uniform_sample(T lower, U upper) {
  return uniform_sample(default_prng(), lower, upper);
}

template <std::forward_iterator It>
It Random::uniform_choice(std::mt19937& prng, It begin, It end) {
  auto n = std::distance(begin, end);
  std::advance(begin, uniform_sample(prng, decltype(n)(0), n));
  return begin;
}

template <std::forward_iterator It>
It Random::uniform_choice(It begin, It end) {
  return uniform_choice(default_prng(), begin, end);
}

template <std::random_access_iterator T>
void Random::shuffle(std::mt19937& prng, T begin, T end) {
  std::shuffle(begin, end, prng);
}

template <std::random_access_iterator T>
void Random::shuffle(T begin, T end) {
  shuffle(default_prng(), begin, end);
}

inline std::mt19937& Random::default_prng() {
  static std::mt19937 prng(std::time(nullptr));
  return prng;
}

}  // namespace util
