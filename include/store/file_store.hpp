#pragma once

#include <filesystem>
#include <mutex>
#include <string>

#include "store/task_store.hpp"

namespace orchestra::store {

// One JSON document per task under a directory. Ids are escaped so that any
// id maps to a single file name inside the directory.
class FileTaskStore final : public TaskStore {
 public:
  explicit FileTaskStore(std::filesystem::path directory);

  core::Result<void> put(const model::task& task) override;
  core::Result<std::optional<model::task>> get(const std::string& id) override;
  core::Result<std::vector<model::task>> list() override;
  core::Result<void> remove(const std::string& id) override;

  [[nodiscard]] const std::filesystem::path& directory() const noexcept { return directory_; }

 private:
  [[nodiscard]] std::filesystem::path path_for(const std::string& id) const;
  core::Result<void> ensure_directory();

  std::filesystem::path directory_;
  std::mutex mutex_;
};

std::string escape_file_name(const std::string& id);

}  // namespace orchestra::store
