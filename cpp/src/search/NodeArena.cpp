#include "search/NodeArena.hpp"

#include <boost/dynamic_bitset.hpp>

namespace search {

size_t NodeArena::sweep(const std::vector<node_id_t>& roots) {
  boost::dynamic_bitset<> reachable(nodes_.size());
  std::vector<node_id_t> stack;
  for (node_id_t root : roots) {
    if (contains(root) && !reachable.test(root)) {
      reachable.set(root);
      stack.push_back(root);
    }
  }
  while (!stack.empty()) {
    const Node& node = *nodes_[stack.back()];
    stack.pop_back();
    if (!node.has_children()) continue;
    for (const auto& entry : node.children()) {
      if (!reachable.test(entry.child)) {
        reachable.set(entry.child);
        stack.push_back(entry.child);
      }
    }
  }

  size_t freed = 0;
  for (size_t id = 0; id < nodes_.size(); ++id) {
    if (nodes_[id] && !reachable.test(id)) {
      nodes_[id].reset();
      free_ids_.push_back(id);
      ++freed;
    }
  }
  live_count_ -= freed;
  return freed;
}

void NodeArena::clear() {
  nodes_.clear();
  free_ids_.clear();
  live_count_ = 0;
}

}  // namespace search
