#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "docqa_core/chunking/text_chunker.hpp"
#include "docqa_core/db/chunk_store.hpp"
#include "docqa_core/embedding/embedder.hpp"
#include "docqa_core/extractors/content_extractor_factory.hpp"
#include "docqa_core/index/vector_index.hpp"
#include "docqa_core/versioning/version_tracker.hpp"

namespace docqa_core {

struct IngestionOptions {
  std::filesystem::path processed_dir = "./data/processed";
  size_t num_workers = 0;  // 0 = max(1, cores / 2)
  size_t batch_size = 10;
};

enum class FileIngestStatus { Processed, Skipped, Failed };

std::string to_string(FileIngestStatus status);

struct FileIngestResult {
  std::filesystem::path path;
  FileIngestStatus status = FileIngestStatus::Failed;
  size_t chunks = 0;
  size_t embeddings = 0;
  size_t retired_chunks = 0;
  std::string error;
};

struct IngestionResult {
  size_t processed_count = 0;
  size_t skipped_count = 0;
  size_t failed_count = 0;
  std::vector<FileIngestResult> files;
};

// Per file: skip check -> extract -> chunk -> retire the file's previous
// chunks -> [persist -> embed -> index] per batch -> processed marker.
//
// A processed marker is <processed_dir>/<file name> holding a JSON record of
// the run. A file is skipped when its marker is at least as new as the file,
// unless force_reprocess is set. Files run in parallel on a worker pool;
// batches inside one file run sequentially.
class IngestionPipeline {
 public:
  IngestionPipeline(ContentExtractorFactory& extractors, TextChunker& chunker, Embedder& embedder,
                    ChunkStore& chunk_store, VectorIndex& index, VersionTracker* version_tracker,
                    IngestionOptions options = IngestionOptions());

  IngestionPipeline(const IngestionPipeline&) = delete;
  IngestionPipeline& operator=(const IngestionPipeline&) = delete;

  // Regular, non-hidden files directly inside `directory`. Never throws for
  // per-file problems; the index is saved once at the end.
  IngestionResult process_directory(const std::filesystem::path& directory, bool force_reprocess = false);

  // Single file, saving the index afterwards. Never throws.
  FileIngestResult process_file(const std::filesystem::path& file_path, bool force_reprocess = false);

  bool is_already_processed(const std::filesystem::path& file_path) const;

  std::filesystem::path marker_path(const std::filesystem::path& file_path) const;

  size_t worker_count() const { return num_workers_; }

 private:
  FileIngestResult ingest(const std::filesystem::path& file_path, bool force_reprocess);
  void write_marker(const std::filesystem::path& file_path, const FileIngestResult& result) const;
  void save_index();

  ContentExtractorFactory& extractors_;
  TextChunker& chunker_;
  Embedder& embedder_;
  ChunkStore& chunk_store_;
  VectorIndex& index_;
  VersionTracker* version_tracker_;
  IngestionOptions options_;
  size_t num_workers_;
};

}  // namespace docqa_core
