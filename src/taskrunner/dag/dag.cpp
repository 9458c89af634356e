#include "taskrunner/dag/dag.hpp"

#include <functional>
#include <queue>

namespace taskrunner {

auto DAG::add_node(TaskId task_id) -> NodeIndex {
  auto it = key_to_idx_.find(task_id);
  if (it != key_to_idx_.end()) {
    return it->second;
  }

  NodeIndex idx = static_cast<NodeIndex>(nodes_.size());
  nodes_.emplace_back();
  keys_.push_back(task_id);
  key_to_idx_.emplace(std::move(task_id), idx);
  return idx;
}

auto DAG::add_edge(const TaskId& from, const TaskId& to) -> Result<void> {
  auto from_it = key_to_idx_.find(from);
  auto to_it = key_to_idx_.find(to);
  if (from_it == key_to_idx_.end() || to_it == key_to_idx_.end()) {
    return fail(Error::UnknownDependency);
  }
  NodeIndex from_idx = from_it->second;
  NodeIndex to_idx = to_it->second;

  // A self-dependency is the shortest possible cycle
  if (from_idx == to_idx || would_create_cycle(from_idx, to_idx)) {
    return fail(Error::CycleDetected);
  }

  nodes_[to_idx].deps.push_back(from_idx);
  nodes_[from_idx].dependents.push_back(to_idx);
  return ok();
}

// Adding from -> to closes a cycle iff `from` already (transitively)
// depends on `to`.
auto DAG::would_create_cycle(NodeIndex from, NodeIndex to) const -> bool {
  std::vector<bool> visited(nodes_.size(), false);
  std::vector<NodeIndex> stack;
  stack.push_back(from);

  while (!stack.empty()) {
    NodeIndex current = stack.back();
    stack.pop_back();

    if (current == to) {
      return true;
    }

    if (visited[current]) {
      continue;
    }
    visited[current] = true;

    for (NodeIndex dep : nodes_[current].deps) {
      if (!visited[dep]) {
        stack.push_back(dep);
      }
    }
  }
  return false;
}

auto DAG::get_topological_order() const -> Result<std::vector<TaskId>> {
  std::vector<std::size_t> in_degree;
  in_degree.reserve(nodes_.size());
  for (const auto& node : nodes_) {
    in_degree.push_back(node.deps.size());
  }

  std::priority_queue<NodeIndex, std::vector<NodeIndex>, std::greater<>> ready;
  for (NodeIndex i = 0; i < nodes_.size(); ++i) {
    if (in_degree[i] == 0) {
      ready.push(i);
    }
  }

  std::vector<TaskId> result;
  result.reserve(nodes_.size());
  while (!ready.empty()) {
    NodeIndex current = ready.top();
    ready.pop();
    result.push_back(keys_[current]);

    for (NodeIndex dependent : nodes_[current].dependents) {
      if (--in_degree[dependent] == 0) {
        ready.push(dependent);
      }
    }
  }

  if (result.size() != nodes_.size()) {
    return fail(Error::CycleDetected);
  }
  return ok(std::move(result));
}

}  // namespace taskrunner
