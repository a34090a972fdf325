#include "search/NodeArena.hpp"

#include "util/Asserts.hpp"

namespace search {

template <typename NodeT, typename... Ts>
NodeT& NodeArena::emplace(Ts&&... ts) {
  node_id_t id;
  if (free_ids_.empty()) {
    id = nodes_.size();
    nodes_.emplace_back();
  } else {
    id = free_ids_.back();
    free_ids_.pop_back();
  }
  auto node = std::make_unique<NodeT>(this, id, std::forward<Ts>(ts)...);
  NodeT& out = *node;
  nodes_[id] = std::move(node);
  ++live_count_;
  return out;
}

inline Node& NodeArena::operator[](node_id_t id) const {
  RELEASE_ASSERT(contains(id), "no node with id {}", id);
  return *nodes_[id];
}

template <typename NodeT>
NodeT& NodeArena::as(node_id_t id) const {
  NodeT* node = dynamic_cast<NodeT*>(&(*this)[id]);
  RELEASE_ASSERT(node != nullptr, "node {} has an unexpected type", id);
  return *node;
}

inline bool NodeArena::contains(node_id_t id) const {
  return id >= 0 && id < (node_id_t)nodes_.size() && nodes_[id] != nullptr;
}

inline void NodeArena::detach(node_id_t id) { (*this)[id].parent_ = kNullNodeId; }

inline node_id_t NodeArena::reroot(node_id_t root) {
  detach(root);
  sweep({root});
  return root;
}

}  // namespace search
