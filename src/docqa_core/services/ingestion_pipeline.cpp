#include "docqa_core/services/ingestion_pipeline.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <thread>

#include "docqa_core/async/worker_pool.hpp"
#include "docqa_core/types/file.hpp"
#include "docqa_core/utils/time_utils.hpp"

namespace docqa_core {

namespace fs = std::filesystem;

std::string to_string(FileIngestStatus status) {
  switch (status) {
    case FileIngestStatus::Processed:
      return "processed";
    case FileIngestStatus::Skipped:
      return "skipped";
    case FileIngestStatus::Failed:
    default:
      return "failed";
  }
}

IngestionPipeline::IngestionPipeline(ContentExtractorFactory& extractors, TextChunker& chunker,
                                     Embedder& embedder, ChunkStore& chunk_store, VectorIndex& index,
                                     VersionTracker* version_tracker, IngestionOptions options)
    : extractors_(extractors),
      chunker_(chunker),
      embedder_(embedder),
      chunk_store_(chunk_store),
      index_(index),
      version_tracker_(version_tracker),
      options_(std::move(options)) {
  const size_t cores = std::max(1u, std::thread::hardware_concurrency());
  num_workers_ = options_.num_workers > 0 ? options_.num_workers : std::max<size_t>(1, cores / 2);
  if (options_.batch_size == 0) {
    options_.batch_size = 10;
  }
}

fs::path IngestionPipeline::marker_path(const fs::path& file_path) const {
  return options_.processed_dir / file_path.filename();
}

bool IngestionPipeline::is_already_processed(const fs::path& file_path) const {
  std::error_code ec;
  const fs::path marker = marker_path(file_path);
  if (!fs::exists(marker, ec)) {
    return false;
  }
  const auto file_time = fs::last_write_time(file_path, ec);
  if (ec) return false;
  const auto marker_time = fs::last_write_time(marker, ec);
  if (ec) return false;
  return file_time <= marker_time;
}

void IngestionPipeline::write_marker(const fs::path& file_path, const FileIngestResult& result) const {
  std::error_code ec;
  fs::create_directories(options_.processed_dir, ec);

  nlohmann::json marker = {
      {"path", file_path.string()},
      {"chunks", result.chunks},
      {"embeddings", result.embeddings},
      {"timestamp", to_iso8601(std::chrono::system_clock::now())},
      {"chunk_size", chunker_.options().chunk_size},
      {"chunk_overlap", chunker_.options().chunk_overlap},
  };
  std::ofstream out(marker_path(file_path), std::ios::trunc);
  if (!out) {
    throw std::runtime_error("Cannot write processed marker " + marker_path(file_path).string());
  }
  out << marker.dump(2);
}

void IngestionPipeline::save_index() {
  try {
    index_.save();
  } catch (const std::exception& e) {
    std::cerr << "[IngestionPipeline] Error saving vector index: " << e.what() << std::endl;
  }
}

FileIngestResult IngestionPipeline::ingest(const fs::path& file_path, bool force_reprocess) {
  FileIngestResult result;
  result.path = file_path;

  try {
    std::error_code ec;
    if (fs::is_regular_file(file_path, ec) && fs::file_size(file_path, ec) == 0 && !ec) {
      std::cerr << "[IngestionPipeline] Skipping empty file: " << file_path.filename() << std::endl;
      result.status = FileIngestStatus::Skipped;
      return result;
    }

    const std::string source_file = file_path.lexically_normal().string();

    if (!force_reprocess) {
      if (is_already_processed(file_path)) {
        std::cout << "[IngestionPipeline] Skipping " << file_path.filename() << " - already processed"
                  << std::endl;
        result.status = FileIngestStatus::Skipped;
        return result;
      }
      // Touched but byte-identical: refresh the marker without re-embedding.
      if (version_tracker_ && !version_tracker_->needs_reindex(file_path) &&
          !chunk_store_.chunk_ids_for_source(source_file).empty()) {
        std::cout << "[IngestionPipeline] Content of " << file_path.filename()
                  << " unchanged, refreshing marker" << std::endl;
        result.chunks = chunk_store_.chunk_ids_for_source(source_file).size();
        result.embeddings = result.chunks;
        write_marker(file_path, result);
        result.status = FileIngestStatus::Skipped;
        return result;
      }
    }

    std::cout << "[IngestionPipeline] Processing file: " << file_path << std::endl;
    ExtractionResult extraction = extractors_.extract(file_path);
    if (extraction.status == ExtractionStatus::NotFound) {
      result.status = FileIngestStatus::Failed;
      result.error = extraction.to_document_text();
      return result;
    }
    if (!extraction.ok()) {
      std::cerr << "[IngestionPipeline] Warning: extraction of " << file_path.filename() << " returned "
                << to_string(extraction.status) << ": " << extraction.error_message << std::endl;
    }

    auto chunks = chunker_.chunk_document(title_from_filename(file_path), source_file,
                                          extraction.to_document_text());
    result.chunks = chunks.size();

    // Supersede whatever an earlier run stored for this file.
    const auto retired = chunk_store_.delete_by_source(source_file);
    if (!retired.empty()) {
      result.retired_chunks = index_.remove_ids(retired);
      std::cout << "[IngestionPipeline] Retired " << retired.size() << " stale chunks of "
                << file_path.filename() << std::endl;
    }

    for (size_t start = 0; start < chunks.size(); start += options_.batch_size) {
      const size_t end = std::min(chunks.size(), start + options_.batch_size);

      std::vector<long long> ids;
      std::vector<std::string> texts;
      for (size_t i = start; i < end; ++i) {
        try {
          ids.push_back(chunk_store_.save_chunk(chunks[i]));
          texts.push_back(chunks[i].content);
        } catch (const ChunkStoreError& e) {
          std::cerr << "[IngestionPipeline] Warning: database write failed for chunk "
                    << chunks[i].chunk_index << " of " << file_path.filename() << ": " << e.what()
                    << std::endl;
        }
      }
      if (ids.empty()) {
        continue;
      }

      try {
        auto vectors = embedder_.embed(texts);
        std::vector<std::pair<long long, std::vector<float>>> stored;
        stored.reserve(ids.size());
        for (size_t i = 0; i < ids.size(); ++i) {
          stored.emplace_back(ids[i], vectors[i]);
        }
        chunk_store_.attach_embeddings(stored);
        index_.add(vectors, ids);
        result.embeddings += vectors.size();
      } catch (const EmbeddingDimensionMismatch&) {
        throw;
      } catch (const std::exception& e) {
        std::cerr << "[IngestionPipeline] Embedding error in " << file_path.filename() << ": "
                  << e.what() << std::endl;
      }
    }

    write_marker(file_path, result);
    if (version_tracker_) {
      version_tracker_->update(file_path, {{"chunks", result.chunks}, {"embeddings", result.embeddings}});
    }
    result.status = FileIngestStatus::Processed;
    std::cout << "[IngestionPipeline] Processed " << file_path.filename() << ": " << result.chunks
              << " chunks, " << result.embeddings << " embeddings" << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "[IngestionPipeline] Failed to process " << file_path << ": " << e.what() << std::endl;
    result.status = FileIngestStatus::Failed;
    result.error = e.what();
  }
  return result;
}

FileIngestResult IngestionPipeline::process_file(const fs::path& file_path, bool force_reprocess) {
  FileIngestResult result = ingest(file_path, force_reprocess);
  if (result.status == FileIngestStatus::Processed) {
    save_index();
  }
  return result;
}

IngestionResult IngestionPipeline::process_directory(const fs::path& directory, bool force_reprocess) {
  IngestionResult summary;
  std::error_code ec;
  fs::create_directories(directory, ec);
  fs::create_directories(options_.processed_dir, ec);

  std::vector<fs::path> files;
  for (const auto& entry : fs::directory_iterator(directory, ec)) {
    if (!entry.is_regular_file()) continue;
    const std::string name = entry.path().filename().string();
    if (name.empty() || name[0] == '.') continue;
    files.push_back(entry.path());
  }
  if (ec) {
    std::cerr << "[IngestionPipeline] Cannot list " << directory << ": " << ec.message() << std::endl;
    return summary;
  }
  std::sort(files.begin(), files.end());
  if (files.empty()) {
    std::cerr << "[IngestionPipeline] No files found in " << directory << std::endl;
    return summary;
  }

  std::cout << "[IngestionPipeline] Ingesting " << files.size() << " files with " << num_workers_
            << " workers" << std::endl;

  std::vector<std::future<FileIngestResult>> futures;
  {
    async::WorkerPool pool(std::min(num_workers_, files.size()));
    pool.start();
    futures.reserve(files.size());
    for (const auto& file : files) {
      futures.push_back(pool.submit([this, file, force_reprocess] { return ingest(file, force_reprocess); }));
    }
    pool.stop();
  }

  for (size_t i = 0; i < futures.size(); ++i) {
    FileIngestResult result;
    try {
      result = futures[i].get();
    } catch (const std::exception& e) {
      result.path = files[i];
      result.status = FileIngestStatus::Failed;
      result.error = e.what();
    }
    switch (result.status) {
      case FileIngestStatus::Processed:
        ++summary.processed_count;
        break;
      case FileIngestStatus::Skipped:
        ++summary.skipped_count;
        break;
      case FileIngestStatus::Failed:
        ++summary.failed_count;
        break;
    }
    summary.files.push_back(std::move(result));
  }

  if (summary.processed_count > 0) {
    save_index();
  }
  std::cout << "[IngestionPipeline] Processed " << summary.processed_count << ", skipped "
            << summary.skipped_count << ", failed " << summary.failed_count << std::endl;
  return summary;
}

}  // namespace docqa_core
