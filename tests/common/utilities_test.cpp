#include "utilities_test.hpp"

#include <atomic>
#include <chrono>
#include <cmath>
#include <fstream>
#include <functional>
#include <random>

namespace docqa_tests {

namespace {

std::string unique_suffix() {
  static std::atomic<int> counter{0};
  auto now = std::chrono::system_clock::now();
  auto timestamp = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count();
  return std::to_string(timestamp) + "_" + std::to_string(counter.fetch_add(1));
}

}  // namespace

std::filesystem::path TestUtilities::create_temp_test_db() {
  auto temp_dir = std::filesystem::temp_directory_path() / "docqa_tests";
  std::filesystem::create_directories(temp_dir);
  return temp_dir / ("test_" + unique_suffix() + ".db");
}

void TestUtilities::cleanup_temp_db(const std::filesystem::path& db_path) {
  std::error_code ec;
  std::filesystem::remove(db_path, ec);
  // WAL journal side files
  std::filesystem::remove(db_path.string() + "-wal", ec);
  std::filesystem::remove(db_path.string() + "-shm", ec);

  // Also cleanup the parent directory if it's empty
  auto parent_dir = db_path.parent_path();
  if (std::filesystem::exists(parent_dir, ec) && std::filesystem::is_empty(parent_dir, ec)) {
    std::filesystem::remove(parent_dir, ec);
  }
}

std::filesystem::path TestUtilities::create_temp_dir(const std::string& prefix) {
  auto dir = std::filesystem::temp_directory_path() / (prefix + "_" + unique_suffix());
  std::filesystem::create_directories(dir);
  return dir;
}

void TestUtilities::cleanup_temp_dir(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
}

std::filesystem::path TestUtilities::write_file(const std::filesystem::path& dir, const std::string& name,
                                                const std::string& content) {
  auto path = dir / name;
  std::filesystem::create_directories(path.parent_path());
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  file << content;
  return path;
}

std::vector<float> TestUtilities::create_test_vector(const std::string& seed_text, size_t dimension) {
  std::mt19937 generator(static_cast<std::mt19937::result_type>(std::hash<std::string>{}(seed_text)));
  std::normal_distribution<float> distribution(0.0f, 1.0f);

  std::vector<float> vector(dimension);
  double norm = 0.0;
  for (auto& value : vector) {
    value = distribution(generator);
    norm += static_cast<double>(value) * value;
  }
  norm = std::sqrt(norm);
  for (auto& value : vector) {
    value = static_cast<float>(value / norm);
  }
  return vector;
}

docqa_core::DocumentChunk TestUtilities::create_test_chunk(const std::string& content,
                                                           const std::string& source_file, int chunk_index,
                                                           const std::string& title) {
  docqa_core::DocumentChunk chunk;
  chunk.title = title;
  chunk.content = content;
  chunk.source_file = source_file;
  chunk.chunk_index = chunk_index;
  chunk.created_at = std::chrono::system_clock::now();
  return chunk;
}

docqa_core::RetrievalResult TestUtilities::create_test_result(const std::string& content, float score,
                                                              const std::string& source_file,
                                                              const std::string& title) {
  docqa_core::RetrievalResult result;
  result.chunk = create_test_chunk(content, source_file, 0, title);
  result.score = score;
  return result;
}

std::string TestUtilities::create_text_of_size(size_t length, const std::string& sentence) {
  std::string text;
  while (text.size() < length) {
    text += sentence;
  }
  return text.substr(0, length);
}

}  // namespace docqa_tests
