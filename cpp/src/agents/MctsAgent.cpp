#include "agents/MctsAgent.hpp"

#include "search/BookBuilder.hpp"
#include "search/PerfectInformationNode.hpp"
#include "util/CppUtil.hpp"
#include "util/LoggingUtil.hpp"

#include <memory>

namespace agents {

void MctsAgent::step() {
  const core::Interpreter& interp = interpreter();

  search::node_id_t node_id = root_;
  while (arena_[node_id].is_expanded() && !arena_[node_id].is_terminal()) {
    const search::Node& node = arena_[node_id];
    search::ChildKey key = selector_->select(node);
    node_id = node.children()[node.find(key)].child;
  }

  search::Node& leaf = arena_[node_id];
  leaf.expand(interp);
  double utility = leaf.evaluate(interp, *evaluator_, *valuation_factory_);
  backpropagate(node_id, utility);
}

void MctsAgent::init_tree() {
  const core::Interpreter& interp = interpreter();
  root_ = arena_
            .emplace<search::PerfectInformationNode>(search::kNullNodeId, 0, role(),
                                                     interp.get_init_state())
            .id();
  if (params_.build_book) build_book();
}

void MctsAgent::develop(int ply, const core::View& view) {
  root_ = arena_[root_].develop(interpreter(), ply, view);
  arena_.reroot(root_);
}

void MctsAgent::commit(const core::Move& move) {
  search::Node& root = arena_[root_];
  root.set_move(move);
  root.trim();
  root_ = arena_.reroot(descend_if_determinate(root_));
}

void MctsAgent::reset() {
  TreeAgent::reset();
  root_ = search::kNullNodeId;
}

void MctsAgent::build_book() {
  const core::GameClock::Configuration& start_clock = start_clock_config();
  int64_t budget_ns = int64_t(start_clock.total_time_ns() * params_.time_scale) -
                      util::ms_to_ns(params_.min_buffer_ms);
  int64_t start_ns = util::ns_since_epoch();

  search::BookBuilder builder(interpreter_ptr(), role());
  int64_t steps = 0;
  while (!builder.done() && util::ns_since_epoch() - start_ns < budget_ns) {
    builder.step();
    ++steps;
  }

  auto book = std::make_shared<search::Book>(builder.book());
  LOG_INFO("{} built a book of {} states in {} steps ({:.3f}s, {})", name(), book->size(), steps,
           (util::ns_since_epoch() - start_ns) * 1e-9, builder.done() ? "complete" : "partial");

  auto evaluator = std::make_shared<search::LightPlayoutEvaluator>(params_.max_playout_depth);
  evaluator->set_book(std::move(book), role());
  evaluator_ = std::move(evaluator);
}

}  // namespace agents
