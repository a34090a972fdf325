#pragma once

#include "search/Node.hpp"

#include <cstddef>
#include <memory>
#include <vector>

namespace search {

/*
 * Owner of every node of one or more search trees.
 *
 * Ids of freed nodes are recycled. Nodes are freed only by sweep(), which keeps what is reachable
 * from the given roots through children lists.
 */
class NodeArena {
 public:
  NodeArena() = default;
  NodeArena(const NodeArena&) = delete;
  NodeArena& operator=(const NodeArena&) = delete;

  // Constructs NodeT(this, id, ts...).
  template <typename NodeT, typename... Ts>
  NodeT& emplace(Ts&&... ts);

  Node& operator[](node_id_t id) const;

  // Like operator[], checking the node's type.
  template <typename NodeT>
  NodeT& as(node_id_t id) const;

  bool contains(node_id_t id) const;

  // Makes id a root: its parent reference is dropped.
  void detach(node_id_t id);

  // Frees every node not reachable from roots. Returns the number of freed nodes.
  size_t sweep(const std::vector<node_id_t>& roots);

  // detach() then sweep() with root as the only root.
  node_id_t reroot(node_id_t root);

  // Number of live nodes.
  size_t size() const { return live_count_; }

  void clear();

 private:
  std::vector<std::unique_ptr<Node>> nodes_;
  std::vector<node_id_t> free_ids_;
  size_t live_count_ = 0;
};

}  // namespace search

#include "inline/search/NodeArena.inl"
