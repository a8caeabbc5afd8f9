#pragma once

#include <filesystem>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace docqa_core {

class VersionTrackerError : public std::exception {
 public:
  explicit VersionTrackerError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct VersionRecord {
  std::string file_name;
  std::string content_hash;
  std::string last_modified;  // ISO-8601 time of the update
  std::uintmax_t size = 0;
  nlohmann::json metadata = nlohmann::json::object();
};

// Re-ingestion is called for exactly when the file's SHA-256 differs from the
// last recorded hash for its file name. Records live in a JSON file keyed by
// file name; each entry keeps earlier records and the backups taken of it.
class VersionTracker {
 public:
  using ReindexCallback = std::function<bool(const std::filesystem::path&)>;

  VersionTracker(std::filesystem::path version_file, std::filesystem::path backup_dir);

  VersionTracker(const VersionTracker&) = delete;
  VersionTracker& operator=(const VersionTracker&) = delete;

  // True when the file is new, changed, or cannot be hashed.
  bool needs_reindex(const std::filesystem::path& file_path) const;

  // Records the current hash. Throws VersionTrackerError on I/O failure.
  void update(const std::filesystem::path& file_path,
              const nlohmann::json& metadata = nlohmann::json::object());

  // Oldest first, current record last. Empty for unknown files.
  std::vector<VersionRecord> history(const std::string& file_name) const;

  // Copies the file to <backup_dir>/<stem>_<YYYYmmdd_HHMMSS><ext> and returns
  // the backup path.
  std::filesystem::path backup(const std::filesystem::path& file_path);

  // Copies the backup over the target and hands the target to the reindex
  // callback. Returns the callback's verdict (true when none is set).
  bool restore(const std::filesystem::path& backup_path, const std::filesystem::path& target_path);

  // Keeps the newest max_versions backups per original file; returns the
  // number deleted.
  size_t cleanup_old_versions(size_t max_versions);

  void set_reindex_callback(ReindexCallback callback);

  const std::filesystem::path& backup_dir() const { return backup_dir_; }

 private:
  void load();
  void save_locked() const;
  static VersionRecord record_from_json(const std::string& file_name, const nlohmann::json& json);
  static nlohmann::json record_to_json(const VersionRecord& record);

  std::filesystem::path version_file_;
  std::filesystem::path backup_dir_;
  mutable std::mutex mutex_;
  nlohmann::json versions_ = nlohmann::json::object();
  ReindexCallback reindex_callback_;
};

}  // namespace docqa_core
