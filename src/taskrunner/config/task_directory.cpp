#include "taskrunner/config/task_directory.hpp"

#include "taskrunner/util/log.hpp"

#include <algorithm>
#include <filesystem>

namespace taskrunner {

auto list_task_directory(std::string_view dir)
    -> Result<std::vector<std::string>> {
  std::error_code ec;
  std::filesystem::directory_iterator it{std::filesystem::path{dir}, ec};
  if (ec) {
    log::error("Cannot list task directory {}: {}", dir, ec.message());
    return fail(Error::FileNotFound);
  }

  std::vector<std::string> names;
  for (; it != std::filesystem::directory_iterator{}; it.increment(ec)) {
    if (ec) {
      break;
    }
    auto name = it->path().filename().string();
    if (name.starts_with('.')) {
      continue;
    }
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec)) {
      continue;
    }
    names.push_back(std::move(name));
  }
  if (ec) {
    log::error("Cannot list task directory {}: {}", dir, ec.message());
    return fail(Error::FileNotFound);
  }

  std::ranges::sort(names);
  return ok(std::move(names));
}

}  // namespace taskrunner
