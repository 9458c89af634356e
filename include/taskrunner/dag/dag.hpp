#pragma once

#include "taskrunner/core/error.hpp"
#include "taskrunner/util/id.hpp"

#include <cstdint>
#include <unordered_map>
#include <vector>

namespace taskrunner {

using NodeIndex = std::uint32_t;

// Dependency graph over task names. Node indices follow insertion order,
// which is also the tie-break order of get_topological_order().
class DAG {
public:
  auto add_node(TaskId task_id) -> NodeIndex;

  // `to` depends on `from`. UnknownDependency when either name was never
  // added, CycleDetected when the edge would close a cycle.
  [[nodiscard]] auto add_edge(const TaskId& from, const TaskId& to)
      -> Result<void>;

  // Kahn's algorithm; among ready nodes the lowest index goes first.
  [[nodiscard]] auto get_topological_order() const
      -> Result<std::vector<TaskId>>;

private:
  [[nodiscard]] auto would_create_cycle(NodeIndex from, NodeIndex to) const
      -> bool;

  struct Node {
    std::vector<NodeIndex> deps;
    std::vector<NodeIndex> dependents;
  };

  std::vector<Node> nodes_;
  std::vector<TaskId> keys_;
  std::unordered_map<TaskId, NodeIndex> key_to_idx_;
};

}  // namespace taskrunner
