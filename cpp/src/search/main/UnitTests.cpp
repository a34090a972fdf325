#include "core/Exceptions.hpp"
#include "core/Interpreter.hpp"
#include "core/Record.hpp"
#include "core/State.hpp"
#include "core/Subrelation.hpp"
#include "core/Turn.hpp"
#include "games/dark_split_corridor/Interpreter.hpp"
#include "games/minipoker/Interpreter.hpp"
#include "games/tictactoe/Interpreter.hpp"
#include "search/BookBuilder.hpp"
#include "search/Evaluators.hpp"
#include "search/Exceptions.hpp"
#include "search/ImperfectInformationNode.hpp"
#include "search/Node.hpp"
#include "search/NodeArena.hpp"
#include "search/PerfectInformationNode.hpp"
#include "search/Repeater.hpp"
#include "search/Selectors.hpp"
#include "search/Valuation.hpp"
#include "util/Asserts.hpp"
#include "util/Exception.hpp"
#include "util/GTestUtil.hpp"
#include "util/Random.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <functional>
#include <memory>
#include <set>
#include <unordered_set>
#include <vector>

using core::Move;
using core::Role;
using core::State;
using core::Turn;
using search::node_id_t;
using search::PerfectInformationNode;
using search::kNullNodeId;
using Corridor = dark_split_corridor::Interpreter;
using MiniPoker = minipoker::Interpreter;
using TicTacToe = tictactoe::Interpreter;

namespace {

State tictactoe_state(const std::vector<std::pair<int, int>>& x_cells,
                      const std::vector<std::pair<int, int>>& o_cells, const Role& to_move) {
  State::facts_t facts = {TicTacToe::control(to_move)};
  for (auto [r, c] : x_cells) facts.push_back(TicTacToe::cell(r, c, TicTacToe::x()));
  for (auto [r, c] : o_cells) facts.push_back(TicTacToe::cell(r, c, TicTacToe::o()));
  return State(facts);
}

// Calls f on every node of the tree rooted at root, once per node.
void visit_tree(const search::NodeArena& arena, node_id_t root,
                const std::function<void(const search::Node&)>& f) {
  std::unordered_set<node_id_t> seen = {root};
  std::vector<node_id_t> stack = {root};
  while (!stack.empty()) {
    const search::Node& node = arena[stack.back()];
    stack.pop_back();
    f(node);
    if (!node.is_expanded()) continue;
    for (const auto& entry : node.children()) {
      if (seen.insert(entry.child).second) stack.push_back(entry.child);
    }
  }
}

search::ImperfectInformationNode& make_root(search::NodeArena& arena,
                                            const core::Interpreter& interpreter,
                                            const Role& role) {
  State init = interpreter.get_init_state();
  return search::ImperfectInformationNode::create(
    arena, kNullNodeId, 0, role, core::StateSet{init}, true,
    interpreter.get_sees_by_role(init, role), core::Interpreter::is_in_control(init, role));
}

// Plays moves from the initial state, one role in control per ply.
State play(const core::Interpreter& interpreter, const std::vector<Move>& moves) {
  State state = interpreter.get_init_state();
  for (const auto& move : moves) {
    std::set<Role> in_control = core::Interpreter::get_roles_in_control(state);
    state = interpreter.get_next_state(state, Turn{{*in_control.begin(), move}});
  }
  return state;
}

void set_valuation(search::NodeArena& arena, node_id_t id, double mean, int64_t playouts) {
  arena[id].set_valuation(std::make_unique<search::NormalizedUtilityValuation>(mean, playouts));
}

}  // namespace

TEST(PerfectInformationNode, tictactoe_expand) {
  TicTacToe interpreter;
  search::NodeArena arena;
  auto& root = arena.emplace<PerfectInformationNode>(kNullNodeId, 0, TicTacToe::x(),
                                                             interpreter.get_init_state());
  root.expand(interpreter);

  ASSERT_EQ(root.children().size(), 9u);
  std::set<Turn> keys;
  for (const auto& entry : root.children()) {
    EXPECT_FALSE(entry.key.state.has_value());
    ASSERT_EQ(entry.key.turn.size(), 1u);
    const Move& move = entry.key.turn.at(TicTacToe::x());
    EXPECT_EQ(move.name(), "cell");
    EXPECT_EQ(root.child(entry).depth(), 1);
    EXPECT_EQ(root.child(entry).parent(), root.id());
    keys.insert(entry.key.turn);
  }
  EXPECT_EQ(keys.size(), 9u);
  EXPECT_EQ(arena.size(), 10u);
}

TEST(PerfectInformationNode, expand_matches_interpreter) {
  util::Random::set_seed(1);
  TicTacToe interpreter;
  search::NodeArena arena;
  State state = interpreter.get_init_state();

  while (!interpreter.is_terminal(state)) {
    auto& node = arena.emplace<PerfectInformationNode>(kNullNodeId, 0, TicTacToe::o(),
                                                               state);
    node.expand(interpreter);
    core::Interpreter::next_states_t next_states = interpreter.get_all_next_states(state);

    ASSERT_EQ(node.children().size(), next_states.size());
    for (size_t i = 0; i < next_states.size(); ++i) {
      EXPECT_EQ(node.children()[i].key.turn, next_states[i].first);
      EXPECT_EQ(node.children()[i].next_state, next_states[i].second);
    }

    auto it = util::Random::uniform_choice(next_states.begin(), next_states.end());
    state = it->second;
  }
}

TEST(PerfectInformationNode, trim_keeps_committed_move) {
  TicTacToe interpreter;
  search::NodeArena arena;
  auto& root = arena.emplace<PerfectInformationNode>(kNullNodeId, 0, TicTacToe::x(),
                                                             interpreter.get_init_state());
  root.expand(interpreter);
  root.set_move(TicTacToe::mark(2, 2));
  root.trim();
  ASSERT_EQ(root.children().size(), 1u);

  search::Node::children_t first = root.children();
  root.trim();
  ASSERT_EQ(root.children().size(), first.size());
  EXPECT_EQ(root.children()[0].key, first[0].key);
  EXPECT_EQ(root.children()[0].child, first[0].child);

  EXPECT_EQ(arena.sweep({root.id()}), 8u);
}

TEST(PerfectInformationNode, develop) {
  TicTacToe interpreter;
  search::NodeArena arena;
  auto& root = arena.emplace<PerfectInformationNode>(kNullNodeId, 0, TicTacToe::x(),
                                                             interpreter.get_init_state());
  root.expand(interpreter);
  root.set_move(TicTacToe::mark(1, 1));

  State state = play(interpreter, {TicTacToe::mark(1, 1), TicTacToe::mark(3, 3)});
  node_id_t id = root.develop(interpreter, 2, interpreter.get_sees_by_role(state, TicTacToe::x()));
  auto& node = arena.as<PerfectInformationNode>(id);
  EXPECT_EQ(node.state(), state);
  EXPECT_EQ(node.depth(), 2);

  EXPECT_EQ(root.develop(interpreter, 0, interpreter.get_init_state()), root.id());
  EXPECT_THROW(root.develop(interpreter, 0, state), search::DevelopmentMismatchError);
  EXPECT_THROW(node.develop(interpreter, 1, state), util::ReleaseAssertionError);
}

TEST(FinalGoalNormalizedUtilityEvaluator, tictactoe) {
  TicTacToe interpreter;
  search::FinalGoalNormalizedUtilityEvaluator evaluator;
  search::NormalizedUtilityValuationFactory factory;
  search::NodeArena arena;

  State won = tictactoe_state({{1, 1}, {1, 2}, {1, 3}}, {{2, 1}, {2, 2}}, TicTacToe::o());
  auto& x_node = arena.emplace<PerfectInformationNode>(kNullNodeId, 5, TicTacToe::x(), won);
  auto& o_node = arena.emplace<PerfectInformationNode>(kNullNodeId, 5, TicTacToe::o(), won);
  EXPECT_EQ(x_node.evaluate(interpreter, evaluator, factory), 1.0);
  EXPECT_EQ(o_node.evaluate(interpreter, evaluator, factory), 0.0);
  EXPECT_EQ(x_node.valuation()->total_playouts(), 1);

  State draw = tictactoe_state({{1, 1}, {1, 3}, {2, 1}, {3, 2}, {3, 3}},
                               {{1, 2}, {2, 2}, {2, 3}, {3, 1}}, TicTacToe::o());
  EXPECT_EQ(evaluator.evaluate(draw, TicTacToe::x(), interpreter), 0.5);
  EXPECT_EQ(evaluator.evaluate(draw, TicTacToe::o(), interpreter), 0.5);

  // Non-terminal states carry no goal.
  EXPECT_EQ(evaluator.evaluate(interpreter.get_init_state(), TicTacToe::x(), interpreter), 0.5);
}

TEST(FinalGoalNormalizedUtilityEvaluator, utility_bounds_and_symmetry) {
  using Evaluator = search::FinalGoalNormalizedUtilityEvaluator;
  for (int places = 2; places <= 6; ++places) {
    for (int rank = 0; rank < places; ++rank) {
      for (int rank_count = 1; rank + rank_count <= places; ++rank_count) {
        double u = Evaluator::utility(rank, rank_count, places);
        EXPECT_GE(u, 0.0);
        EXPECT_LE(u, 1.0);
        EXPECT_EQ(u == 1.0, rank == 0 && rank_count == 1)
          << "rank=" << rank << " rank_count=" << rank_count << " places=" << places;
      }
    }
    // A shared first place is worth less than winning alone, and more than coming last.
    EXPECT_LT(Evaluator::utility(0, 2, places), 1.0);
    EXPECT_GT(Evaluator::utility(0, 2, places), Evaluator::utility(places - 1, 1, places));
    EXPECT_EQ(Evaluator::utility(places - 1, 1, places), 0.0);

    // Alone in its rank, a role is worth less the further it is from first.
    for (int rank = 1; rank < places; ++rank) {
      EXPECT_LT(Evaluator::utility(rank, 1, places), Evaluator::utility(rank - 1, 1, places))
        << "rank=" << rank << " places=" << places;
    }
    EXPECT_THROW(Evaluator::utility(places, 1, places), util::ReleaseAssertionError);
  }
  EXPECT_EQ(Evaluator::utility(0, 2, 2), 0.5);
  EXPECT_EQ(Evaluator::utility(1, 1, 2), 0.0);
}

TEST(FinalGoalNormalizedUtilityEvaluator, zero_sum_goals) {
  MiniPoker interpreter;
  search::FinalGoalNormalizedUtilityEvaluator evaluator;
  State called = play(interpreter, {MiniPoker::deal(MiniPoker::red()), MiniPoker::hold(),
                                    MiniPoker::call()});
  EXPECT_EQ(evaluator.evaluate(called, MiniPoker::caller(), interpreter), 1.0);
  EXPECT_EQ(evaluator.evaluate(called, MiniPoker::bluffer(), interpreter), 0.0);
  EXPECT_EQ(evaluator.evaluate(called, core::random_role(), interpreter), 0.5);
}

TEST(LightPlayoutEvaluator, bounds) {
  util::Random::set_seed(1);
  Corridor interpreter;
  search::LightPlayoutEvaluator evaluator;
  State init = interpreter.get_init_state();
  for (int i = 0; i < 50; ++i) {
    search::Evaluator::utilities_t utilities =
      evaluator.evaluate_all(init, {Corridor::left(), Corridor::right()}, interpreter);
    double left = utilities.at(Corridor::left());
    double right = utilities.at(Corridor::right());
    EXPECT_GE(left, 0.0);
    EXPECT_LE(left, 1.0);
    EXPECT_DOUBLE_EQ(left + right, 1.0);
  }
}

TEST(LightPlayoutEvaluator, depth_limit) {
  TicTacToe interpreter;
  search::LightPlayoutEvaluator evaluator(0);
  State init = interpreter.get_init_state();
  EXPECT_EQ(evaluator.evaluate(init, TicTacToe::x(), interpreter), 0.5);

  State won = tictactoe_state({{1, 1}, {1, 2}, {1, 3}}, {{2, 1}, {2, 2}}, TicTacToe::o());
  EXPECT_EQ(evaluator.evaluate(won, TicTacToe::x(), interpreter), 1.0);

  search::LightPlayoutEvaluator::Playout playout =
    search::LightPlayoutEvaluator(3).playout(init, interpreter);
  EXPECT_EQ(playout.depth, 3);
  EXPECT_FALSE(interpreter.is_terminal(playout.state));
}

TEST(LightPlayoutEvaluator, book) {
  TicTacToe interpreter;
  State init = interpreter.get_init_state();
  auto book = std::make_shared<search::Book>();
  (*book)[init] = 0.75;

  search::LightPlayoutEvaluator evaluator;
  evaluator.set_book(book, TicTacToe::x());
  EXPECT_EQ(evaluator.evaluate(init, TicTacToe::x(), interpreter), 0.75);
  EXPECT_EQ(evaluator.book_hits(), 1);
}

TEST(Valuation, propagate) {
  search::NormalizedUtilityValuation valuation(1.0);
  valuation.propagate(0.0);
  valuation.propagate(0.5);
  EXPECT_DOUBLE_EQ(valuation.mean(), 0.5);
  EXPECT_EQ(valuation.total_playouts(), 3);

  search::NormalizedUtilityValuation other(0.9, 5);
  valuation.propagate(other);
  EXPECT_DOUBLE_EQ(valuation.mean(), (1.5 + 4.5) / 8);
  EXPECT_EQ(valuation.total_playouts(), 8);

  using search::NormalizedUtilityValuation;
  EXPECT_TRUE(NormalizedUtilityValuation(0.4, 10) < NormalizedUtilityValuation(0.5, 1));
  EXPECT_TRUE(NormalizedUtilityValuation(0.5, 1) < NormalizedUtilityValuation(0.5, 2));
}

TEST(UctSelector, unvisited_child_first) {
  TicTacToe interpreter;
  search::NodeArena arena;
  State state = tictactoe_state({{1, 1}, {1, 2}, {2, 3}}, {{1, 3}, {2, 1}, {2, 2}}, TicTacToe::x());
  auto& node = arena.emplace<PerfectInformationNode>(kNullNodeId, 6, TicTacToe::x(), state);
  node.expand(interpreter);
  ASSERT_EQ(node.children().size(), 3u);

  set_valuation(arena, node.children()[0].child, 0.5, 10);
  set_valuation(arena, node.children()[2].child, 0.9, 5);

  search::UctSelector selector;
  for (int i = 0; i < 10; ++i) {
    EXPECT_EQ(selector.select(node).turn, node.children()[1].key.turn);
  }
}

TEST(UctSelector, ties_go_to_first_child) {
  TicTacToe interpreter;
  search::NodeArena arena;
  auto& node = arena.emplace<PerfectInformationNode>(kNullNodeId, 0, TicTacToe::x(),
                                                             interpreter.get_init_state());
  node.expand(interpreter);
  search::UctSelector uct;
  EXPECT_EQ(uct.select(node), node.children()[0].key);

  for (const auto& entry : node.children()) set_valuation(arena, entry.child, 0.5, 4);
  EXPECT_EQ(uct.select(node), node.children()[0].key);
  EXPECT_EQ(search::BestSelector().select(node), node.children()[0].key);
  EXPECT_EQ(search::MostVisitedSelector().select(node), node.children()[0].key);
}

TEST(UctSelector, opponent_nodes_minimize) {
  TicTacToe interpreter;
  search::NodeArena arena;
  State state = tictactoe_state({{1, 1}, {1, 2}, {2, 3}}, {{1, 3}, {2, 1}, {2, 2}}, TicTacToe::x());
  auto& mine = arena.emplace<PerfectInformationNode>(kNullNodeId, 6, TicTacToe::x(), state);
  auto& theirs = arena.emplace<PerfectInformationNode>(kNullNodeId, 6, TicTacToe::o(), state);
  for (search::Node* node : std::vector<search::Node*>{&mine, &theirs}) {
    node->expand(interpreter);
    set_valuation(arena, node->children()[0].child, 0.2, 10);
    set_valuation(arena, node->children()[1].child, 0.8, 10);
    set_valuation(arena, node->children()[2].child, 0.5, 10);
  }

  search::UctSelector greedy(0.0);
  EXPECT_EQ(greedy.select(mine), mine.children()[1].key);
  EXPECT_EQ(greedy.select(theirs), theirs.children()[0].key);
  EXPECT_EQ(search::BestSelector().select(mine), mine.children()[1].key);
}

TEST(UctSelector, chance_nodes_are_sampled) {
  util::Random::set_seed(1);
  MiniPoker interpreter;
  search::NodeArena arena;
  auto& node = arena.emplace<PerfectInformationNode>(kNullNodeId, 0, MiniPoker::bluffer(),
                                                             interpreter.get_init_state());
  node.expand(interpreter);
  ASSERT_TRUE(node.is_chance());
  set_valuation(arena, node.children()[0].child, 0.0, 100);
  set_valuation(arena, node.children()[1].child, 1.0, 1);

  search::UctSelector selector;
  std::set<Turn> picked;
  for (int i = 0; i < 100; ++i) picked.insert(selector.select(node).turn);
  EXPECT_EQ(picked.size(), 2u);
}

TEST(Selector, no_children) {
  TicTacToe interpreter;
  search::NodeArena arena;
  State won = tictactoe_state({{1, 1}, {1, 2}, {1, 3}}, {{2, 1}, {2, 2}}, TicTacToe::o());
  auto& node = arena.emplace<PerfectInformationNode>(kNullNodeId, 5, TicTacToe::x(), won);
  node.expand(interpreter);
  EXPECT_TRUE(node.is_terminal());
  EXPECT_THROW(search::UctSelector().select(node), util::Exception);
}

TEST(Selector, choose_move_aggregates_worlds) {
  MiniPoker interpreter;
  search::NodeArena arena;
  State red = play(interpreter, {MiniPoker::deal(MiniPoker::red()), MiniPoker::hold()});
  State black = play(interpreter, {MiniPoker::deal(MiniPoker::black()), MiniPoker::hold()});
  auto& node = arena.emplace<search::VisibleInformationSetNode>(
    kNullNodeId, 2, MiniPoker::caller(), core::StateSet{red, black}, true);
  node.expand(interpreter);
  ASSERT_EQ(node.children().size(), 4u);

  // Calling wins on red only and resigning loses on both, so call has more playouts and a better
  // mean.
  for (const auto& entry : node.children()) {
    bool call = entry.key.turn.at(MiniPoker::caller()) == MiniPoker::call();
    bool on_red = entry.key.state == red;
    set_valuation(arena, entry.child, call ? (on_red ? 1.0 : 0.0) : 0.0, call ? 6 : 2);
  }
  const Role& caller = MiniPoker::caller();
  EXPECT_EQ(search::MostVisitedSelector().choose_move(node, caller), MiniPoker::call());
  EXPECT_EQ(search::BestSelector().choose_move(node, caller), MiniPoker::call());

  search::Selector::options_t options = search::Selector::options(node);
  ASSERT_EQ(options.size(), 2u);
  EXPECT_FALSE(options[0].key.state.has_value());
  EXPECT_EQ(options[0].children.size(), 2u);

  options = search::Selector::options(node, &red);
  EXPECT_EQ(options.size(), 2u);
  for (const auto& option : options) EXPECT_EQ(option.key.state, red);
}

TEST(HiddenInformationSetNode, minipoker_caller_develop) {
  MiniPoker interpreter;
  search::NodeArena arena;
  auto& root = make_root(arena, interpreter, MiniPoker::caller());
  ASSERT_EQ(root.kind(), search::NodeKind::kHidden);

  core::View view{MiniPoker::control(MiniPoker::caller()), MiniPoker::dealt(), MiniPoker::held()};
  node_id_t id = root.develop(interpreter, 2, view);
  const auto& node = arena.as<search::VisibleInformationSetNode>(id);

  EXPECT_EQ(node.depth(), 2);
  EXPECT_EQ(node.view(), view);
  EXPECT_TRUE(node.is_view_consistent(interpreter));

  core::StateSet expected = {
    play(interpreter, {MiniPoker::deal(MiniPoker::red()), MiniPoker::hold()}),
    play(interpreter, {MiniPoker::deal(MiniPoker::black()), MiniPoker::hold()})};
  EXPECT_EQ(node.possible_states(), expected);
  for (const auto& state : node.possible_states()) {
    EXPECT_TRUE(state.includes(view));
    EXPECT_NE(state, view);
  }
}

TEST(ImperfectInformationNode, develop_is_idempotent) {
  MiniPoker interpreter;
  search::NodeArena arena;
  auto& root = make_root(arena, interpreter, MiniPoker::caller());
  core::View view{MiniPoker::control(MiniPoker::caller()), MiniPoker::dealt(), MiniPoker::held()};

  node_id_t first = root.develop(interpreter, 2, view);
  size_t size = arena.size();
  core::StateSet states = arena.as<search::ImperfectInformationNode>(first).possible_states();

  EXPECT_EQ(root.develop(interpreter, 2, view), first);
  EXPECT_EQ(arena[first].develop(interpreter, 2, view), first);
  EXPECT_EQ(arena.size(), size);
  EXPECT_EQ(arena.as<search::ImperfectInformationNode>(first).possible_states(), states);
}

TEST(ImperfectInformationNode, develop_mismatch) {
  MiniPoker interpreter;
  search::NodeArena arena;
  auto& root = make_root(arena, interpreter, MiniPoker::caller());
  core::View impossible{MiniPoker::control(MiniPoker::bluffer()), MiniPoker::held()};
  EXPECT_THROW(root.develop(interpreter, 2, impossible), search::DevelopmentMismatchError);
  EXPECT_THROW(root.develop(interpreter, 0, impossible), search::DevelopmentMismatchError);
}

TEST(ImperfectInformationNode, expansion_keeps_every_world) {
  Corridor interpreter;
  search::NodeArena arena;
  auto& root = make_root(arena, interpreter, Corridor::left());
  root.fill(interpreter);
  for (const auto& entry : root.children()) root.child(entry).fill(interpreter);

  int checked = 0;
  visit_tree(arena, root.id(), [&](const search::Node& n) {
    const auto& node = dynamic_cast<const search::ImperfectInformationNode&>(n);
    if (!node.is_expanded()) return;
    core::StateSet covered;
    for (const auto& entry : node.children()) {
      const auto& child = arena.as<search::ImperfectInformationNode>(entry.child);
      covered.insert(child.possible_states().begin(), child.possible_states().end());
      EXPECT_TRUE(child.possible_states().contains(entry.next_state));
      EXPECT_EQ(child.depth(), node.depth() + 1);
    }
    for (const auto& state : node.possible_states()) {
      for (const auto& [turn, next_state] : interpreter.get_all_next_states(state)) {
        EXPECT_TRUE(covered.contains(next_state)) << next_state.to_string();
      }
    }
    ++checked;
  });
  EXPECT_GT(checked, 1);
}

TEST(ImperfectInformationNode, visible_nodes_match_their_view) {
  Corridor interpreter;
  search::NodeArena arena;
  auto& root = make_root(arena, interpreter, Corridor::right());
  root.fill(interpreter);
  for (const auto& entry : root.children()) {
    search::Node& child = root.child(entry);
    child.fill(interpreter);
  }

  int visible = 0;
  visit_tree(arena, root.id(), [&](const search::Node& node) {
    if (node.kind() != search::NodeKind::kVisible) return;
    const auto& visible_node = dynamic_cast<const search::VisibleInformationSetNode&>(node);
    ASSERT_TRUE(visible_node.view().has_value());
    for (const auto& state : visible_node.possible_states()) {
      EXPECT_EQ(interpreter.get_sees_by_role(state, node.role()), *visible_node.view());
    }
    ++visible;
  });
  EXPECT_GT(visible, 0);
}

TEST(ImperfectInformationNode, hidden_children_merge_worlds) {
  MiniPoker interpreter;
  search::NodeArena arena;
  auto& root = make_root(arena, interpreter, MiniPoker::caller());
  root.expand(interpreter);

  // Two deals, one child: the caller cannot tell them apart.
  ASSERT_EQ(root.children().size(), 2u);
  EXPECT_EQ(root.children()[0].child, root.children()[1].child);
  EXPECT_EQ(root.arity(), 1u);
  const auto& child = arena.as<search::ImperfectInformationNode>(root.children()[0].child);
  EXPECT_EQ(child.possible_states().size(), 2u);

  // The bluffer can.
  auto& bluffer_root = make_root(arena, interpreter, MiniPoker::bluffer());
  bluffer_root.expand(interpreter);
  EXPECT_EQ(bluffer_root.arity(), 2u);
}

TEST(ImperfectInformationNode, trim_is_idempotent) {
  Corridor interpreter;
  search::NodeArena arena;
  auto& root = make_root(arena, interpreter, Corridor::left());
  ASSERT_EQ(root.kind(), search::NodeKind::kVisible);
  root.expand(interpreter);
  size_t before = root.children().size();

  root.set_move(Corridor::move("east"));
  root.trim();
  search::Node::children_t first = root.children();
  ASSERT_EQ(first.size(), 1u);
  EXPECT_LT(first.size(), before);

  root.trim();
  ASSERT_EQ(root.children().size(), first.size());
  for (size_t i = 0; i < first.size(); ++i) {
    EXPECT_EQ(root.children()[i].key, first[i].key);
    EXPECT_EQ(root.children()[i].child, first[i].child);
  }
}

TEST(ImperfectInformationNode, dark_split_corridor_view) {
  Corridor interpreter;
  const Role& left = Corridor::left();
  const Role& right = Corridor::right();

  std::vector<Move> moves = {Corridor::move("east"), Corridor::block("c1-c2"),
                             Corridor::block("a2-a3"), Corridor::block("a3-a4")};
  State state = play(interpreter, moves);
  core::View expected{Corridor::border(right, "a2-a3"), Corridor::control(left),
                      Corridor::at(left, "c1"), Corridor::at(right, "b1")};
  ASSERT_EQ(interpreter.get_sees_by_role(state, left), expected);

  search::NodeArena arena;
  node_id_t root = make_root(arena, interpreter, left).id();
  arena[root].set_move(moves[0]);
  arena[root].trim();
  State ply2 = play(interpreter, {moves[0], moves[1]});
  root = arena[root].develop(interpreter, 2, interpreter.get_sees_by_role(ply2, left));
  arena[root].set_move(moves[2]);
  arena[root].trim();
  root = arena[root].develop(interpreter, 4, expected);

  const auto& node = arena.as<search::VisibleInformationSetNode>(root);
  EXPECT_EQ(node.view(), expected);
  EXPECT_TRUE(node.possible_states().contains(state));
  EXPECT_FALSE(node.possible_states().contains(expected));
  for (const auto& world : node.possible_states()) {
    EXPECT_EQ(interpreter.get_sees_by_role(world, left), expected);
    EXPECT_TRUE(world.includes(expected));
    EXPECT_GT(world.size(), expected.size());
  }
}

TEST(ImperfectInformationNode, dark_split_corridor_hidden_borders) {
  Corridor interpreter;
  const Role& left = Corridor::left();

  search::NodeArena arena;
  node_id_t root = make_root(arena, interpreter, left).id();

  std::vector<Move> moves = {Corridor::block("b3-b4"), Corridor::block("c2-c3")};
  arena[root].set_move(moves[0]);
  arena[root].trim();
  State ply2 = play(interpreter, moves);
  root = arena[root].develop(interpreter, 2, interpreter.get_sees_by_role(ply2, left));
  arena.reroot(root);

  // Right may have blocked any crossing of left's board.
  EXPECT_EQ(arena.as<search::ImperfectInformationNode>(root).possible_states().size(), 15u);

  moves.push_back(Corridor::block("c1-c2"));
  moves.push_back(Corridor::move("east"));
  arena[root].set_move(moves[2]);
  arena[root].trim();
  State ply4 = play(interpreter, moves);
  root = arena[root].develop(interpreter, 4, interpreter.get_sees_by_role(ply4, left));
  arena.reroot(root);

  const auto& node = arena.as<search::ImperfectInformationNode>(root);
  EXPECT_EQ(node.possible_states().size(), 15u);
  EXPECT_TRUE(node.possible_states().contains(ply4));
}

TEST(ImperfectInformationNode, expand_world_expands_one_world) {
  Corridor interpreter;
  const Role& left = Corridor::left();

  search::NodeArena arena;
  node_id_t root = make_root(arena, interpreter, left).id();

  std::vector<Move> moves = {Corridor::block("b3-b4"), Corridor::block("c2-c3")};
  arena[root].set_move(moves[0]);
  arena[root].trim();
  root = arena[root].develop(interpreter, 2,
                             interpreter.get_sees_by_role(play(interpreter, moves), left));
  arena.reroot(root);

  auto& node = arena.as<search::ImperfectInformationNode>(root);
  ASSERT_EQ(node.possible_states().size(), 15u);
  ASSERT_FALSE(node.has_children());

  State world = *node.possible_states().begin();
  node.expand_world(interpreter, world);
  EXPECT_TRUE(node.has_expanded(world));
  EXPECT_FALSE(node.is_expanded());
  EXPECT_FALSE(node.is_terminal());
  EXPECT_EQ(node.children().size(), interpreter.get_all_next_states(world).size());
  for (const auto& entry : node.children()) EXPECT_EQ(*entry.key.state, world);
  EXPECT_THROW(node.expand_world(interpreter, interpreter.get_init_state()),
               util::ReleaseAssertionError);

  search::Node::children_t first = node.children();
  node.expand(interpreter);
  EXPECT_TRUE(node.is_expanded());
  ASSERT_GT(node.children().size(), first.size());
  for (size_t i = 0; i < first.size(); ++i) {
    EXPECT_EQ(node.children()[i].key, first[i].key);
    EXPECT_EQ(node.children()[i].child, first[i].child);
  }

  core::StateSet origins;
  for (const auto& entry : node.children()) {
    origins.insert(*entry.key.state);
    EXPECT_TRUE(node.has_expanded(*entry.key.state));
  }
  EXPECT_EQ(origins, node.possible_states());
}

TEST(ImperfectInformationNode, develop_samples_large_beliefs) {
  util::Random::set_seed(7);
  Corridor interpreter;
  const Role& left = Corridor::left();

  search::NodeArena arena;
  node_id_t root = make_root(arena, interpreter, left).id();

  // Right hides three borders on left's board, in any of several hundred placements.
  std::vector<Move> moves = {Corridor::block("b3-b4"), Corridor::block("a2-a3"),
                             Corridor::block("a1-a2"), Corridor::block("c2-c3"),
                             Corridor::block("c1-c2"), Corridor::block("a1-b1")};
  for (int ply = 2; ply <= 6; ply += 2) {
    arena[root].set_move(moves[ply - 2]);
    arena[root].trim();
    std::vector<Move> played(moves.begin(), moves.begin() + ply);
    root = arena[root].develop(interpreter, ply,
                               interpreter.get_sees_by_role(play(interpreter, played), left));
    arena.reroot(root);
    if (ply < 6) {
      EXPECT_TRUE(arena.as<search::ImperfectInformationNode>(root).fully_enumerated()) << ply;
    }
  }

  {
    const auto& node = arena.as<search::ImperfectInformationNode>(root);
    core::View view = interpreter.get_sees_by_role(play(interpreter, moves), left);
    EXPECT_EQ(node.depth(), 6);
    EXPECT_EQ(node.possible_states().size(), search::ImperfectInformationNode::kMaxPossibleStates);
    EXPECT_FALSE(node.fully_enumerated());
    for (const auto& world : node.possible_states()) {
      EXPECT_EQ(interpreter.get_sees_by_role(world, left), view);
    }
  }

  moves.push_back(Corridor::move("north"));
  moves.push_back(Corridor::move("north"));
  arena[root].set_move(moves[6]);
  arena[root].trim();
  core::View view = interpreter.get_sees_by_role(play(interpreter, moves), left);
  root = arena[root].develop(interpreter, 8, view);
  arena.reroot(root);

  const auto& node = arena.as<search::ImperfectInformationNode>(root);
  EXPECT_EQ(node.depth(), 8);
  EXPECT_FALSE(node.possible_states().empty());
  EXPECT_LE(node.possible_states().size(), search::ImperfectInformationNode::kMaxPossibleStates);
  for (const auto& world : node.possible_states()) {
    EXPECT_EQ(interpreter.get_sees_by_role(world, left), view);
  }
}

TEST(ImperfectInformationNode, sampled_develop_follows_developments) {
  Corridor interpreter;
  const Role& left = Corridor::left();

  search::NodeArena arena;
  node_id_t root = make_root(arena, interpreter, left).id();

  std::vector<Move> moves = {Corridor::block("b3-b4"), Corridor::block("a2-a3")};
  arena[root].set_move(moves[0]);
  arena[root].trim();
  State ply2 = play(interpreter, moves);
  root = arena[root].develop(interpreter, 2, interpreter.get_sees_by_role(ply2, left));
  arena.reroot(root);

  auto& node = arena.as<search::ImperfectInformationNode>(root);
  core::StateSet sample = {ply2};
  for (const auto& world : node.possible_states()) {
    if (sample.size() == 3) break;
    if (!world.contains(Corridor::border(left, "b1-c1"))) sample.insert(world);
  }
  node.set_sample(sample);
  ASSERT_EQ(node.possible_states(), sample);
  EXPECT_FALSE(node.fully_enumerated());

  moves.push_back(Corridor::move("east"));
  moves.push_back(Corridor::block("a3-a4"));
  node.set_move(moves[2]);
  node.trim();
  State ply4 = play(interpreter, moves);
  core::View view = interpreter.get_sees_by_role(ply4, left);

  core::Record record;
  record.possible_states[2] = sample;
  record.turns[2] = Turn{{left, moves[2]}};
  record.views[4][left] = view;
  core::StateSet expected;
  for (const auto& development : interpreter.get_developments(record)) {
    expected.insert(development.back().state);
  }

  const auto& developed =
    arena.as<search::ImperfectInformationNode>(node.develop(interpreter, 4, view));
  EXPECT_EQ(developed.depth(), 4);
  EXPECT_EQ(developed.possible_states(), expected);
  EXPECT_TRUE(developed.possible_states().contains(ply4));
  EXPECT_FALSE(developed.fully_enumerated());
}

TEST(ImperfectInformationNode, sampled_develop_rebuilds_from_history) {
  Corridor interpreter;
  const Role& left = Corridor::left();

  search::NodeArena arena;
  node_id_t root = make_root(arena, interpreter, left).id();

  std::vector<Move> moves = {Corridor::block("b3-b4"), Corridor::block("b1-b2")};
  arena[root].set_move(moves[0]);
  arena[root].trim();
  root = arena[root].develop(interpreter, 2,
                             interpreter.get_sees_by_role(play(interpreter, moves), left));
  arena.reroot(root);

  // Keep a single world, one where left is free to move north.
  auto& node = arena.as<search::ImperfectInformationNode>(root);
  auto it = std::find_if(node.possible_states().begin(), node.possible_states().end(),
                         [&](const State& world) {
                           return !world.contains(Corridor::border(left, "b1-b2"));
                         });
  ASSERT_NE(it, node.possible_states().end());
  node.set_sample(core::StateSet{*it});

  // Left runs into the border instead, and right steps forward.
  moves.push_back(Corridor::move("north"));
  moves.push_back(Corridor::move("north"));
  node.set_move(moves[2]);
  node.trim();
  State ply4 = play(interpreter, moves);
  ASSERT_TRUE(ply4.contains(Corridor::revealed(left, "b1-b2")));
  core::View view = interpreter.get_sees_by_role(ply4, left);

  const auto& developed =
    arena.as<search::ImperfectInformationNode>(node.develop(interpreter, 4, view));
  EXPECT_EQ(developed.depth(), 4);
  EXPECT_EQ(developed.possible_states(), core::StateSet{ply4});
  EXPECT_TRUE(developed.fully_enumerated());
  EXPECT_EQ(developed.history().views.at(4).at(left), view);
  EXPECT_EQ(developed.history().turns.at(2), (Turn{{left, moves[2]}}));
}

TEST(ImperfectInformationNode, contract_violations) {
  MiniPoker interpreter;
  search::NodeArena arena;
  EXPECT_THROW(search::ImperfectInformationNode::create(
                 arena, kNullNodeId, 0, MiniPoker::caller(), core::StateSet{}, true, core::View(),
                 false),
               util::ReleaseAssertionError);

  auto& root = make_root(arena, interpreter, MiniPoker::caller());
  core::View view{MiniPoker::control(MiniPoker::caller()), MiniPoker::dealt(), MiniPoker::held()};
  node_id_t id = root.develop(interpreter, 2, view);
  EXPECT_THROW(arena[id].develop(interpreter, 1, view), util::ReleaseAssertionError);
}

TEST(NodeArena, sweep_and_reuse) {
  TicTacToe interpreter;
  search::NodeArena arena;
  auto& root = arena.emplace<PerfectInformationNode>(kNullNodeId, 0, TicTacToe::x(),
                                                             interpreter.get_init_state());
  root.expand(interpreter);
  node_id_t root_id = root.id();
  node_id_t child_id = root.children()[4].child;
  EXPECT_EQ(arena.size(), 10u);

  EXPECT_EQ(arena.reroot(child_id), child_id);
  EXPECT_TRUE(arena[child_id].is_root());
  EXPECT_FALSE(arena.contains(root_id));
  EXPECT_EQ(arena.size(), 1u);

  // Freed ids are recycled.
  auto& other = arena.emplace<PerfectInformationNode>(kNullNodeId, 0, TicTacToe::o(),
                                                              interpreter.get_init_state());
  EXPECT_LT(other.id(), 10);
  EXPECT_THROW(arena.as<search::ImperfectInformationNode>(other.id()), util::ReleaseAssertionError);

  arena.clear();
  EXPECT_EQ(arena.size(), 0u);
}

TEST(Repeater, zero_timeout_runs_once) {
  int count = 0;
  search::Repeater repeater([&] { ++count; }, 0);
  search::Repeater::Result result = repeater();
  EXPECT_EQ(result.iterations, 1);
  EXPECT_GE(result.elapsed_ns, 0);
  EXPECT_EQ(count, 1);

  repeater.set_timeout_ns(-5);
  EXPECT_EQ(repeater().iterations, 1);
  EXPECT_EQ(count, 2);
}

TEST(Repeater, runs_until_timeout) {
  int count = 0;
  search::Repeater repeater([&] { ++count; }, util::ms_to_ns(20));
  search::Repeater::Result result = repeater();
  EXPECT_EQ(result.iterations, count);
  EXPECT_GE(result.elapsed_ns, util::ms_to_ns(20));
}

TEST(Repeater, cancel) {
  int count = 0;
  search::Repeater* self = nullptr;
  search::Repeater repeater(
    [&] {
      if (++count == 3) self->cancel();
    },
    util::s_to_ns(60));
  self = &repeater;
  EXPECT_EQ(repeater().iterations, 3);
}

TEST(Repeater, exception_stops_the_loop) {
  int count = 0;
  search::Repeater repeater(
    [&] {
      if (++count == 2) throw core::InterpreterTimeoutError("query timed out");
    },
    util::s_to_ns(60));
  EXPECT_THROW(repeater(), core::InterpreterTimeoutError);
  EXPECT_EQ(count, 2);
}

TEST(BookBuilder, tictactoe_is_a_draw) {
  auto interpreter = std::make_shared<TicTacToe>();
  search::BookBuilder builder(interpreter, TicTacToe::x());
  while (!builder.done()) builder.step();

  State init = interpreter->get_init_state();
  ASSERT_TRUE(builder.value(init).has_value());
  EXPECT_DOUBLE_EQ(*builder.value(init), 0.5);

  search::Book book = builder.book();
  EXPECT_TRUE(book.contains(init));
  for (const auto& [state, value] : book) {
    EXPECT_GE(value, 0.0);
    EXPECT_LE(value, 1.0);
    EXPECT_EQ(builder.value(state), value);
  }

  // x wins by completing the top row.
  State threat = tictactoe_state({{1, 1}, {1, 2}}, {{2, 1}, {2, 2}}, TicTacToe::x());
  if (builder.value(threat)) {
    EXPECT_EQ(*builder.value(threat), 1.0);
  }
}

TEST(BookBuilder, minipoker_chance_nodes_average) {
  auto interpreter = std::make_shared<MiniPoker>();
  State init = interpreter->get_init_state();
  for (const Role& role : {MiniPoker::bluffer(), MiniPoker::caller()}) {
    search::BookBuilder builder(interpreter, role);
    int steps = 0;
    while (!builder.done()) {
      builder.step();
      ASSERT_LT(++steps, 10000);
    }
    ASSERT_TRUE(builder.value(init).has_value());
    EXPECT_DOUBLE_EQ(*builder.value(init), 0.5) << role.to_string();
  }

  search::BookBuilder bluffer_book(interpreter, MiniPoker::bluffer());
  while (!bluffer_book.done()) bluffer_book.step();
  State red = play(*interpreter, {MiniPoker::deal(MiniPoker::red())});
  State black = play(*interpreter, {MiniPoker::deal(MiniPoker::black())});
  EXPECT_EQ(bluffer_book.value(red), 0.0);
  EXPECT_EQ(bluffer_book.value(black), 1.0);
}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
