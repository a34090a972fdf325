#include "agents/TreeAgentParams.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace agents {

inline auto TreeAgentParams::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Tree agent options");

  return desc
    .template add_option<"exploration-constant">(
      po2::default_value("{:.4f}", &exploration_constant),
      "UCT exploration constant")
    .template add_option<"max-playout-depth">(
      po::value<int>(&max_playout_depth)->default_value(max_playout_depth),
      "plies after which a playout is cut off and scored 0.5")
    .template add_option<"time-scale">(po2::default_value("{:.3f}", &time_scale),
                                       "fraction of the available time spent searching")
    .template add_option<"min-buffer-ms">(
      po::value<int64_t>(&min_buffer_ms)->default_value(min_buffer_ms),
      "time kept in reserve before the play clock would expire")
    .template add_option<"max-buffer-ms">(
      po::value<int64_t>(&max_buffer_ms)->default_value(max_buffer_ms),
      "time subtracted from the per-move allowance when computing the minimum budget")
    .template add_hidden_option<"guessed-remaining-moves">(
      po::value<int>(&guessed_remaining_moves)->default_value(guessed_remaining_moves),
      "number of moves the total time is spread over")
    .template add_option<"max-logged-options">(
      po::value<int>(&max_logged_options)->default_value(max_logged_options),
      "max number of move options logged per decision")
    .template add_flag<"build-book", "no-build-book">(
      &build_book, "spend the start clock on an opening book (perfect-information games)",
      "do not build an opening book");
}

}  // namespace agents
