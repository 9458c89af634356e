#include "taskrunner/dag/task_graph.hpp"

#include "taskrunner/dag/dag.hpp"
#include "taskrunner/util/log.hpp"

namespace taskrunner {

namespace {

[[nodiscard]] auto trim(std::string_view s) -> std::string_view {
  constexpr std::string_view kBlanks = " \t\r\n";
  auto first = s.find_first_not_of(kBlanks);
  if (first == std::string_view::npos) {
    return {};
  }
  auto last = s.find_last_not_of(kBlanks);
  return s.substr(first, last - first + 1);
}

}  // namespace

auto TaskGraph::resolve(std::span<const TaskSpec> tasks)
    -> Result<std::vector<TaskId>> {
  DAG dag;
  for (const auto& task : tasks) {
    dag.add_node(task.task_id);
  }

  for (const auto& task : tasks) {
    for (const auto& dep : task.dependencies) {
      if (auto r = dag.add_edge(dep, task.task_id); !r) {
        if (r.error() == make_error_code(Error::UnknownDependency)) {
          log::error("{}: depends on unknown task '{}'", task.task_id, dep);
        } else {
          log::error("{}: dependency on {} creates a cycle", task.task_id, dep);
        }
        return fail(r.error());
      }
    }
  }

  return dag.get_topological_order();
}

auto parse_depends_on(std::string_view value) -> std::vector<TaskId> {
  std::vector<TaskId> deps;
  while (true) {
    auto comma = value.find(',');
    auto item = trim(value.substr(0, comma));
    if (!item.empty()) {
      deps.emplace_back(std::string{item});
    }
    if (comma == std::string_view::npos) {
      break;
    }
    value.remove_prefix(comma + 1);
  }
  return deps;
}

}  // namespace taskrunner
