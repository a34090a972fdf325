#include "agents/MctsAgent.hpp"
#include "agents/MultiObserverIsMctsAgent.hpp"
#include "agents/RandomAgent.hpp"
#include "agents/SoIsMctsAgent.hpp"
#include "agents/TreeAgentParams.hpp"
#include "core/Agent.hpp"
#include "core/GameClock.hpp"
#include "core/Match.hpp"
#include "games/Games.hpp"
#include "util/Asserts.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <boost/algorithm/string/join.hpp>
#include <boost/program_options.hpp>

#include <algorithm>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace {

struct Args {
  std::string game = "tictactoe";
  std::vector<std::string> agent_strs;
  std::string start_clock = core::GameClock::default_start_clock().to_string();
  std::string play_clock = core::GameClock::default_play_clock().to_string();
  int num_matches = 1;

  auto make_options_description();
};

auto Args::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Program options");

  return desc
    .template add_option<"game">(po::value<std::string>(&game)->default_value(game),
                                 "dark_split_corridor, minipoker or tictactoe")
    .template add_option<"agent">(po::value<std::vector<std::string>>(&agent_strs),
                                  "random, mcts, sois-mcts or mo-ismcts, one per role in role "
                                  "order (the chance role excluded)")
    .template add_option<"startclock">(
      po::value<std::string>(&start_clock)->default_value(start_clock),
      "start clock, \"T | I d D\" in seconds")
    .template add_option<"playclock">(
      po::value<std::string>(&play_clock)->default_value(play_clock),
      "play clock, \"T | I d D\" in seconds")
    .template add_option<"num-matches">(po::value<int>(&num_matches)->default_value(num_matches),
                                        "number of matches to play");
}

std::unique_ptr<core::Agent> make_agent(const std::string& name,
                                        const agents::TreeAgentParams& params) {
  core::InterpreterFactory factory = games::make_interpreter;
  if (name == "random") return std::make_unique<agents::RandomAgent>(factory);
  if (name == "mcts") return std::make_unique<agents::MctsAgent>(factory, params);
  if (name == "sois-mcts") return std::make_unique<agents::SoIsMctsAgent>(factory, params);
  if (name == "mo-ismcts") {
    return std::make_unique<agents::MultiObserverIsMctsAgent>(factory, params);
  }
  throw util::CleanException("unknown agent \"{}\"", name);
}

}  // namespace

int main(int ac, char* av[]) {
  try {
    namespace po = boost::program_options;
    namespace po2 = boost_util::program_options;

    Args args;
    util::Logging::Params log_params;
    util::Random::Params random_params;
    agents::TreeAgentParams tree_agent_params;

    po2::options_description raw_desc("General options");
    auto desc = raw_desc.template add_option<"help", 'h'>("help (most used options)")
                  .template add_option<"help-full">("help (all options)")
                  .add(args.make_options_description())
                  .add(tree_agent_params.make_options_description())
                  .add(log_params.make_options_description())
                  .add(random_params.make_options_description());

    po::variables_map vm = po2::parse_args(desc, ac, av);

    bool help_full = vm.count("help-full");
    bool help = vm.count("help");
    if (help || help_full) {
      po2::Settings::help_full = help_full;
      std::cout << desc << std::endl;
      return 0;
    }

    util::Logging::init(log_params);
    util::Random::init(random_params);

    core::Ruleset ruleset{args.game};
    core::InterpreterPtr interpreter = games::make_interpreter(ruleset);
    auto start_clock = core::GameClock::Configuration::from_str(args.start_clock);
    auto play_clock = core::GameClock::Configuration::from_str(args.play_clock);

    std::vector<core::Role> roles;
    for (const auto& role : interpreter->get_roles()) {
      if (role != core::random_role()) roles.push_back(role);
    }
    CLEAN_ASSERT(args.agent_strs.size() == roles.size(), "{} takes {} --agent options, got {}",
                 args.game, roles.size(), args.agent_strs.size());

    std::vector<std::unique_ptr<core::Agent>> agents;
    std::vector<std::unique_ptr<core::AgentScope>> scopes;
    core::Match::agents_t assignment;
    for (const auto& role : interpreter->get_roles()) {
      std::string name = "random";
      if (role != core::random_role()) {
        size_t index = std::find(roles.begin(), roles.end(), role) - roles.begin();
        name = args.agent_strs[index];
      }
      agents.push_back(make_agent(name, tree_agent_params));
      scopes.push_back(std::make_unique<core::AgentScope>(*agents.back()));
      assignment[role] = agents.back().get();
    }

    std::map<core::Role, int64_t> goal_sums;
    int aborted = 0;
    for (int i = 0; i < args.num_matches; ++i) {
      LOG_INFO("match {}/{}: {} ({} | {})", i + 1, args.num_matches, args.game,
               start_clock.to_string(), play_clock.to_string());
      core::Match match(interpreter, ruleset, assignment, start_clock, play_clock);
      core::Match::Result result = match.run();
      if (result.aborted()) {
        ++aborted;
        continue;
      }
      for (const auto& [role, goal] : result.goals) {
        if (goal) goal_sums[role] += *goal;
      }
    }

    std::vector<std::string> parts;
    int completed = args.num_matches - aborted;
    for (const auto& [role, sum] : goal_sums) {
      parts.push_back(fmt::format("{}={:.2f}", role.to_string(), double(sum) / completed));
    }
    LOG_INFO("{} matches, {} aborted. Mean goals: {}", args.num_matches, aborted,
             boost::algorithm::join(parts, " "));
  } catch (const util::CleanException& e) {
    std::cerr << "Caught a CleanException: ";
    std::cerr << e.what() << std::endl;
    return 1;
  }

  return 0;
}
