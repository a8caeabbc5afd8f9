#include "docqa_core/db/chunk_store.hpp"

#include <cstring>
#include <iostream>
#include <sstream>
#include <unordered_map>

#include "docqa_core/db/pooled_connection.hpp"
#include "docqa_core/db/sqlite_error_utils.hpp"
#include "docqa_core/db/transaction.hpp"
#include "docqa_core/services/compression_service.hpp"
#include "docqa_core/utils/time_utils.hpp"

namespace docqa_core {

ChunkStore::ChunkStore(DatabaseManager& db_manager) : db_manager_(db_manager) {}

long long ChunkStore::save_chunk(const DocumentChunk& chunk) {
  if (chunk.source_file.empty()) {
    throw ChunkStoreError("Chunk has no source_file");
  }
  try {
    std::vector<char> compressed = CompressionService::compress(chunk.content);
    auto created_at = chunk.created_at.time_since_epoch().count() == 0
                          ? std::chrono::system_clock::now()
                          : chunk.created_at;

    PooledConnection conn(db_manager_);
    *conn << "INSERT INTO documents (title, content, source_file, chunk_index, created_at) "
             "VALUES (?, ?, ?, ?, ?)"
          << chunk.title << compressed << chunk.source_file << chunk.chunk_index
          << time_point_to_string(created_at);
    return static_cast<long long>(conn->last_insert_rowid());
  } catch (const sqlite::sqlite_exception& e) {
    throw ChunkStoreError(format_db_error("save_chunk", e));
  } catch (const CompressionError& e) {
    throw ChunkStoreError("save_chunk failed: " + std::string(e.what()));
  }
}

void ChunkStore::attach_embeddings(
    const std::vector<std::pair<long long, std::vector<float>>>& embeddings) {
  if (embeddings.empty()) {
    return;
  }
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, "attach_embeddings");
    for (const auto& [id, vector] : embeddings) {
      std::vector<char> vector_blob(vector.size() * sizeof(float));
      std::memcpy(vector_blob.data(), vector.data(), vector_blob.size());
      *conn << "UPDATE documents SET vector_blob = ? WHERE id = ?" << vector_blob << id;
    }
    tx.commit();
  } catch (const sqlite::sqlite_exception& e) {
    throw ChunkStoreError(format_db_error("attach_embeddings", e));
  }
}

std::optional<DocumentChunk> ChunkStore::get_chunk(long long id) {
  auto chunks = get_chunks({id});
  if (chunks.empty()) {
    return std::nullopt;
  }
  return chunks.front();
}

std::vector<DocumentChunk> ChunkStore::get_chunks(const std::vector<long long>& ids) {
  if (ids.empty()) {
    return {};
  }

  std::unordered_map<long long, DocumentChunk> by_id;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, title, content, source_file, chunk_index, created_at FROM documents "
             "WHERE id IN (" + ids_to_comma_string(ids) + ")" >>
        [&](long long id, std::string title, std::vector<char> content, std::string source_file,
            int chunk_index, std::string created_at) {
          DocumentChunk chunk;
          chunk.id = id;
          chunk.title = std::move(title);
          chunk.content = CompressionService::decompress(content);
          chunk.source_file = std::move(source_file);
          chunk.chunk_index = chunk_index;
          chunk.created_at = string_to_time_point(created_at);
          by_id[id] = std::move(chunk);
        };
  } catch (const sqlite::sqlite_exception& e) {
    throw ChunkStoreError(format_db_error("get_chunks", e));
  } catch (const CompressionError& e) {
    throw ChunkStoreError("get_chunks failed: " + std::string(e.what()));
  }

  std::vector<DocumentChunk> result;
  result.reserve(ids.size());
  for (long long id : ids) {
    auto it = by_id.find(id);
    if (it != by_id.end()) {
      result.push_back(it->second);
    } else {
      std::cerr << "[ChunkStore] Warning: chunk " << id << " not found" << std::endl;
    }
  }
  return result;
}

std::vector<long long> ChunkStore::chunk_ids_for_source(const std::string& source_file) {
  std::vector<long long> ids;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT id FROM documents WHERE source_file = ? ORDER BY id" << source_file >>
        [&](long long id) { ids.push_back(id); };
  } catch (const sqlite::sqlite_exception& e) {
    throw ChunkStoreError(format_db_error("chunk_ids_for_source", e));
  }
  return ids;
}

std::vector<long long> ChunkStore::delete_by_source(const std::string& source_file) {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, "delete_by_source");
    std::vector<long long> ids;
    *conn << "SELECT id FROM documents WHERE source_file = ? ORDER BY id" << source_file >>
        [&](long long id) { ids.push_back(id); };
    *conn << "DELETE FROM documents WHERE source_file = ?" << source_file;
    tx.commit();
    return ids;
  } catch (const sqlite::sqlite_exception& e) {
    throw ChunkStoreError(format_db_error("delete_by_source", e));
  }
}

std::vector<StoredVector> ChunkStore::load_vectors(size_t dimension) {
  std::vector<StoredVector> vectors;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, vector_blob FROM documents WHERE vector_blob IS NOT NULL ORDER BY id" >>
        [&](long long id, std::vector<char> vector_blob) {
          if (vector_blob.size() == dimension * sizeof(float)) {
            const float* data = reinterpret_cast<const float*>(vector_blob.data());
            vectors.push_back({id, std::vector<float>(data, data + dimension)});
          } else if (!vector_blob.empty()) {
            std::cerr << "[ChunkStore] Warning: skipping chunk " << id
                      << " with mismatched vector size " << vector_blob.size() << " bytes"
                      << std::endl;
          }
        };
  } catch (const sqlite::sqlite_exception& e) {
    throw ChunkStoreError(format_db_error("load_vectors", e));
  }
  return vectors;
}

size_t ChunkStore::count() {
  try {
    PooledConnection conn(db_manager_);
    long long total = 0;
    *conn << "SELECT COUNT(*) FROM documents" >> total;
    return static_cast<size_t>(total);
  } catch (const sqlite::sqlite_exception& e) {
    throw ChunkStoreError(format_db_error("count", e));
  }
}

std::string ChunkStore::ids_to_comma_string(const std::vector<long long>& ids) {
  std::stringstream ss;
  for (size_t i = 0; i < ids.size(); ++i) {
    ss << ids[i];
    if (i < ids.size() - 1) ss << ",";
  }
  return ss.str();
}

}  // namespace docqa_core
