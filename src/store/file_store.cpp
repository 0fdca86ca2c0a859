#include "store/file_store.hpp"

#include <fstream>
#include <iostream>
#include <system_error>
#include <utility>

namespace orchestra::store {
namespace {

constexpr const char* kExtension = ".json";

bool is_safe_char(const unsigned char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
}

core::Error storage_error(const std::string& what, const std::filesystem::path& path) {
  return core::make_error(core::ErrorKind::storage, what + ": " + path.string());
}

core::Result<model::task> read_task_file(const std::filesystem::path& path) {
  std::ifstream input(path);
  if (!input.is_open()) {
    return storage_error("unable to open task file", path);
  }

  try {
    const auto document = nlohmann::json::parse(input);
    return document.get<model::task>();
  } catch (const std::exception& ex) {
    return storage_error(std::string("malformed task file (") + ex.what() + ")", path);
  }
}

}  // namespace

std::string escape_file_name(const std::string& id) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(id.size());
  for (const char ch : id) {
    const auto c = static_cast<unsigned char>(ch);
    if (is_safe_char(c)) {
      out.push_back(ch);
      continue;
    }
    out.push_back('%');
    out.push_back(kHex[c >> 4U]);
    out.push_back(kHex[c & 0x0FU]);
  }
  return out;
}

FileTaskStore::FileTaskStore(std::filesystem::path directory) : directory_(std::move(directory)) {}

std::filesystem::path FileTaskStore::path_for(const std::string& id) const {
  return directory_ / (escape_file_name(id) + kExtension);
}

core::Result<void> FileTaskStore::ensure_directory() {
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    return storage_error("unable to create store directory (" + ec.message() + ")", directory_);
  }
  return core::ok();
}

core::Result<void> FileTaskStore::put(const model::task& task) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto created = ensure_directory(); !created) {
    return created;
  }

  const auto target = path_for(task.id);
  auto staging = target;
  staging += ".tmp";

  {
    std::ofstream output(staging, std::ios::trunc);
    if (!output.is_open()) {
      return storage_error("unable to write task file", staging);
    }
    output << nlohmann::json(task).dump();
    output.flush();
    if (!output) {
      return storage_error("short write on task file", staging);
    }
  }

  std::error_code ec;
  std::filesystem::rename(staging, target, ec);
  if (ec) {
    std::filesystem::remove(staging, ec);
    return storage_error("unable to replace task file", target);
  }
  return core::ok();
}

core::Result<std::optional<model::task>> FileTaskStore::get(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto path = path_for(id);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return std::optional<model::task>{};
  }

  auto loaded = read_task_file(path);
  if (!loaded) {
    return loaded.error();
  }
  return std::optional<model::task>{std::move(loaded).value()};
}

core::Result<std::vector<model::task>> FileTaskStore::list() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<model::task> out;

  std::error_code ec;
  if (!std::filesystem::exists(directory_, ec)) {
    return out;
  }

  std::filesystem::directory_iterator it(directory_, ec);
  if (ec) {
    return storage_error("unable to list store directory (" + ec.message() + ")", directory_);
  }

  for (const auto& entry : it) {
    if (!entry.is_regular_file() || entry.path().extension() != kExtension) {
      continue;
    }
    auto loaded = read_task_file(entry.path());
    if (!loaded) {
      // Corrupt documents are skipped, not fatal to the listing.
      std::cerr << "[store] skipping " << core::describe(loaded.error()) << '\n';
      continue;
    }
    out.push_back(std::move(loaded).value());
  }
  return out;
}

core::Result<void> FileTaskStore::remove(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::error_code ec;
  std::filesystem::remove(path_for(id), ec);
  if (ec) {
    return storage_error("unable to remove task file (" + ec.message() + ")", path_for(id));
  }
  return core::ok();
}

}  // namespace orchestra::store
