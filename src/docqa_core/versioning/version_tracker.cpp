#include "docqa_core/versioning/version_tracker.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <map>
#include <regex>

#include "docqa_core/utils/hashing.hpp"
#include "docqa_core/utils/time_utils.hpp"

namespace docqa_core {

namespace fs = std::filesystem;

VersionTracker::VersionTracker(fs::path version_file, fs::path backup_dir)
    : version_file_(std::move(version_file)), backup_dir_(std::move(backup_dir)) {
  load();
}

void VersionTracker::load() {
  if (!fs::exists(version_file_)) {
    return;
  }
  try {
    std::ifstream in(version_file_);
    auto parsed = nlohmann::json::parse(in);
    if (parsed.is_object()) {
      versions_ = std::move(parsed);
    }
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[VersionTracker] Error loading versions from " << version_file_ << ": " << e.what()
              << std::endl;
  }
}

void VersionTracker::save_locked() const {
  std::error_code ec;
  if (version_file_.has_parent_path()) {
    fs::create_directories(version_file_.parent_path(), ec);
  }
  const fs::path tmp = version_file_.string() + ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      throw VersionTrackerError("Cannot write version file " + tmp.string());
    }
    out << versions_.dump(2);
    if (!out) {
      throw VersionTrackerError("Failed writing version file " + tmp.string());
    }
  }
  fs::rename(tmp, version_file_, ec);
  if (ec) {
    throw VersionTrackerError("Cannot replace version file " + version_file_.string() + ": " + ec.message());
  }
}

VersionRecord VersionTracker::record_from_json(const std::string& file_name, const nlohmann::json& json) {
  VersionRecord record;
  record.file_name = file_name;
  record.content_hash = json.value("hash", "");
  record.last_modified = json.value("last_modified", "");
  record.size = json.value("size", std::uintmax_t{0});
  record.metadata = json.value("metadata", nlohmann::json::object());
  return record;
}

nlohmann::json VersionTracker::record_to_json(const VersionRecord& record) {
  return {{"hash", record.content_hash},
          {"last_modified", record.last_modified},
          {"size", record.size},
          {"metadata", record.metadata}};
}

bool VersionTracker::needs_reindex(const fs::path& file_path) const {
  try {
    const std::string hash = sha256_file(file_path);
    const std::string file_name = file_path.filename().string();

    std::lock_guard<std::mutex> lock(mutex_);
    if (!versions_.contains(file_name)) {
      return true;
    }
    return versions_[file_name].value("hash", "") != hash;
  } catch (const std::exception& e) {
    std::cerr << "[VersionTracker] Error checking version of " << file_path << ": " << e.what()
              << std::endl;
    return true;
  }
}

void VersionTracker::update(const fs::path& file_path, const nlohmann::json& metadata) {
  VersionRecord record;
  record.file_name = file_path.filename().string();
  try {
    record.content_hash = sha256_file(file_path);
    record.size = fs::file_size(file_path);
  } catch (const std::exception& e) {
    throw VersionTrackerError("Cannot fingerprint " + file_path.string() + ": " + e.what());
  }
  record.last_modified = to_iso8601(std::chrono::system_clock::now());
  record.metadata = metadata.is_null() ? nlohmann::json::object() : metadata;

  std::lock_guard<std::mutex> lock(mutex_);
  nlohmann::json entry = record_to_json(record);
  if (versions_.contains(record.file_name)) {
    const auto& previous = versions_[record.file_name];
    entry["previous"] = previous.value("previous", nlohmann::json::array());
    entry["backups"] = previous.value("backups", nlohmann::json::array());
    if (previous.value("hash", "") != record.content_hash) {
      nlohmann::json prior = previous;
      prior.erase("previous");
      prior.erase("backups");
      entry["previous"].push_back(std::move(prior));
    }
  }
  versions_[record.file_name] = std::move(entry);
  save_locked();
  std::cout << "[VersionTracker] Updated version for " << record.file_name << std::endl;
}

std::vector<VersionRecord> VersionTracker::history(const std::string& file_name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<VersionRecord> records;
  if (!versions_.contains(file_name)) {
    return records;
  }
  const auto& entry = versions_[file_name];
  for (const auto& prior : entry.value("previous", nlohmann::json::array())) {
    records.push_back(record_from_json(file_name, prior));
  }
  records.push_back(record_from_json(file_name, entry));
  return records;
}

fs::path VersionTracker::backup(const fs::path& file_path) {
  std::error_code ec;
  if (!fs::is_regular_file(file_path, ec)) {
    throw VersionTrackerError("Cannot back up missing file " + file_path.string());
  }
  fs::create_directories(backup_dir_, ec);
  if (ec) {
    throw VersionTrackerError("Cannot create backup directory " + backup_dir_.string() + ": " + ec.message());
  }

  const fs::path backup_path =
      backup_dir_ / (file_path.stem().string() + "_" +
                     compact_timestamp(std::chrono::system_clock::now()) + file_path.extension().string());
  fs::copy_file(file_path, backup_path, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    throw VersionTrackerError("Backup of " + file_path.string() + " failed: " + ec.message());
  }
  std::cout << "[VersionTracker] Created backup at " << backup_path << std::endl;

  std::lock_guard<std::mutex> lock(mutex_);
  const std::string file_name = file_path.filename().string();
  if (versions_.contains(file_name)) {
    auto& entry = versions_[file_name];
    if (!entry.contains("backups")) entry["backups"] = nlohmann::json::array();
    entry["backups"].push_back(
        {{"path", backup_path.string()}, {"created_at", to_iso8601(std::chrono::system_clock::now())}});
    save_locked();
  }
  return backup_path;
}

bool VersionTracker::restore(const fs::path& backup_path, const fs::path& target_path) {
  std::error_code ec;
  if (!fs::is_regular_file(backup_path, ec)) {
    throw VersionTrackerError("Backup not found: " + backup_path.string());
  }
  fs::copy_file(backup_path, target_path, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    throw VersionTrackerError("Restore to " + target_path.string() + " failed: " + ec.message());
  }
  std::cout << "[VersionTracker] Restored " << target_path << " from " << backup_path << std::endl;

  ReindexCallback callback;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    callback = reindex_callback_;
  }
  if (!callback) {
    return true;
  }
  return callback(target_path);
}

size_t VersionTracker::cleanup_old_versions(size_t max_versions) {
  std::error_code ec;
  if (!fs::is_directory(backup_dir_, ec)) {
    return 0;
  }

  // <original stem>_<YYYYmmdd>_<HHMMSS>
  static const std::regex backup_name("^(.*)_(\\d{8}_\\d{6})$");
  std::map<std::string, std::vector<std::pair<std::string, fs::path>>> groups;
  for (const auto& entry : fs::directory_iterator(backup_dir_, ec)) {
    if (!entry.is_regular_file()) continue;
    const std::string stem = entry.path().stem().string();
    std::smatch match;
    if (!std::regex_match(stem, match, backup_name)) continue;
    groups[match[1].str() + entry.path().extension().string()].emplace_back(match[2].str(), entry.path());
  }

  size_t removed = 0;
  for (auto& [original, backups] : groups) {
    std::sort(backups.begin(), backups.end(),
              [](const auto& a, const auto& b) { return a.first > b.first; });
    for (size_t i = max_versions; i < backups.size(); ++i) {
      if (fs::remove(backups[i].second, ec)) {
        ++removed;
        std::cout << "[VersionTracker] Removed old version: " << backups[i].second << std::endl;
      } else if (ec) {
        std::cerr << "[VersionTracker] Could not remove " << backups[i].second << ": " << ec.message()
                  << std::endl;
      }
    }
  }
  return removed;
}

void VersionTracker::set_reindex_callback(ReindexCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  reindex_callback_ = std::move(callback);
}

}  // namespace docqa_core
