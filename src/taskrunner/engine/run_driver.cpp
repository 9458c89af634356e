#include "taskrunner/engine/run_driver.hpp"

#include "taskrunner/config/task_directory.hpp"
#include "taskrunner/dag/task_graph.hpp"
#include "taskrunner/util/log.hpp"

#include <cstdint>
#include <vector>

namespace taskrunner {

RunDriver::RunDriver(const RunSettings& settings,
                     const ITaskConfigSource& tasks,
                     std::map<std::string, std::string> env_overlay,
                     IProcessSupervisor& supervisor, SleepFunction sleep)
    : settings_{settings},
      tasks_{tasks},
      env_overlay_{std::move(env_overlay)},
      engine_{settings, tasks, supervisor, std::move(sleep)} {
}

auto RunDriver::prepare(const std::filesystem::path& task_dir) const
    -> Result<RunPlan> {
  auto names = list_task_directory(task_dir.string());
  if (!names) {
    return fail(names.error());
  }

  std::vector<TaskSpec> specs;
  specs.reserve(names->size());
  for (auto& name : *names) {
    if (name == settings_.halt_task) {
      continue;
    }
    TaskId task_id{std::move(name)};
    auto deps = tasks_.depends_on(task_id);
    specs.push_back(TaskSpec{std::move(task_id), std::move(deps)});
  }

  auto order = TaskGraph::resolve(specs);
  if (!order) {
    return fail(order.error());
  }

  RunPlan plan{
      .task_dir = task_dir,
      .order = std::move(*order),
      .env = Environment::inherit(),
  };
  if (!env_overlay_.empty()) {
    log::debug("updating environment with {} variables", env_overlay_.size());
    plan.env.overlay(env_overlay_);
  }
  return ok(std::move(plan));
}

auto RunDriver::run(const std::filesystem::path& task_dir,
                    std::optional<int> times) -> Result<void> {
  bool forever = !times || *times <= 0;
  auto limit = forever ? std::uint64_t{0} : static_cast<std::uint64_t>(*times);
  for (std::uint64_t i = 1; forever || i <= limit; ++i) {
    iterations_ = i;
    log::info("iteration {}", i);

    auto plan = prepare(task_dir);
    if (!plan) {
      return fail(plan.error());
    }

    auto succeeded = engine_.run(*plan);
    if (!succeeded) {
      return fail(succeeded.error());
    }
    if (!*succeeded) {
      return fail(Error::Halted);
    }
  }
  return ok();
}

}  // namespace taskrunner
