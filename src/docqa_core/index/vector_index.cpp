#include "docqa_core/index/vector_index.hpp"

#include <faiss/IndexFlat.h>
#include <faiss/IndexIVFFlat.h>
#include <faiss/impl/FaissException.h>
#include <faiss/index_io.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <mutex>
#include <unordered_set>

namespace docqa_core {

namespace {

void normalize_in_place(float* data, size_t dimension) {
  double norm = 0.0;
  for (size_t i = 0; i < dimension; ++i) {
    norm += static_cast<double>(data[i]) * data[i];
  }
  norm = std::sqrt(norm);
  if (norm == 0.0) return;
  for (size_t i = 0; i < dimension; ++i) {
    data[i] = static_cast<float>(data[i] / norm);
  }
}

}  // namespace

std::string to_string(IndexType type) {
  switch (type) {
    case IndexType::Ivf:
      return "ivf";
    case IndexType::Flat:
    default:
      return "flat";
  }
}

IndexType index_type_from_string(const std::string& name) {
  if (name == "flat") return IndexType::Flat;
  if (name == "ivf") return IndexType::Ivf;
  throw std::invalid_argument("Unknown index type: " + name);
}

VectorIndex::VectorIndex(VectorIndexOptions options, std::filesystem::path directory, std::string name)
    : options_(options), directory_(std::move(directory)), name_(std::move(name)) {
  if (options_.dimension == 0) {
    throw VectorIndexError("Vector dimension must be positive");
  }
}

std::filesystem::path VectorIndex::index_path() const {
  return directory_ / (name_ + ".faiss");
}

std::filesystem::path VectorIndex::id_map_path() const {
  return directory_ / (name_ + "_ids.bin");
}

void VectorIndex::check_dimension(const std::vector<float>& vector) const {
  if (vector.size() != options_.dimension) {
    throw VectorIndexError("Vector dimension mismatch. Expected " + std::to_string(options_.dimension) +
                           ", got " + std::to_string(vector.size()));
  }
}

std::unique_ptr<faiss::Index> VectorIndex::create_index(const std::vector<float>& flat, size_t n) const {
  const auto d = static_cast<faiss::idx_t>(options_.dimension);
  if (options_.type != IndexType::Ivf) {
    return std::make_unique<faiss::IndexFlatIP>(d);
  }
  const size_t nlist = std::max<size_t>(1, std::min<size_t>(static_cast<size_t>(options_.ivf_nlist), n));
  auto* quantizer = new faiss::IndexFlatIP(d);
  auto ivf = std::make_unique<faiss::IndexIVFFlat>(quantizer, d, nlist, faiss::METRIC_INNER_PRODUCT);
  ivf->own_fields = true;
  ivf->train(static_cast<faiss::idx_t>(n), flat.data());
  ivf->nprobe = std::min<size_t>(static_cast<size_t>(std::max(1, options_.ivf_nprobe)), nlist);
  std::cout << "[VectorIndex] Trained IVF index with nlist=" << nlist << " on " << n << " vectors" << std::endl;
  return ivf;
}

std::unique_ptr<faiss::Index> VectorIndex::build_populated(const std::vector<float>& flat, size_t n) const {
  try {
    auto index = create_index(flat, n);
    index->add(static_cast<faiss::idx_t>(n), flat.data());
    return index;
  } catch (const faiss::FaissException& e) {
    throw VectorIndexError("Failed to build index: " + std::string(e.what()));
  }
}

void VectorIndex::add(const std::vector<std::vector<float>>& vectors, const std::vector<long long>& ids) {
  if (vectors.size() != ids.size()) {
    throw VectorIndexError("Got " + std::to_string(vectors.size()) + " vectors but " +
                           std::to_string(ids.size()) + " ids");
  }
  if (vectors.empty()) return;

  std::vector<float> flat;
  flat.reserve(vectors.size() * options_.dimension);
  for (const auto& vector : vectors) {
    check_dimension(vector);
    flat.insert(flat.end(), vector.begin(), vector.end());
    normalize_in_place(flat.data() + flat.size() - options_.dimension, options_.dimension);
  }

  std::unique_lock lock(mutex_);
  if (state_ == IndexState::Untrained) {
    // Untrained -> Trained only once the first batch is in.
    index_ = build_populated(flat, vectors.size());
    state_ = IndexState::Trained;
  } else {
    try {
      index_->add(static_cast<faiss::idx_t>(vectors.size()), flat.data());
    } catch (const faiss::FaissException& e) {
      throw VectorIndexError("Failed to add vectors: " + std::string(e.what()));
    }
  }
  id_map_.insert(id_map_.end(), ids.begin(), ids.end());
  raw_vectors_.insert(raw_vectors_.end(), flat.begin(), flat.end());
}

std::vector<IndexHit> VectorIndex::search(const std::vector<float>& query, int k) const {
  check_dimension(query);
  std::vector<float> normalized = query;
  normalize_in_place(normalized.data(), normalized.size());

  std::shared_lock lock(mutex_);
  if (state_ == IndexState::Untrained || !index_ || index_->ntotal == 0 || k <= 0) {
    return {};
  }

  const auto actual_k = std::min<faiss::idx_t>(k, index_->ntotal);
  std::vector<float> distances(static_cast<size_t>(actual_k));
  std::vector<faiss::idx_t> labels(static_cast<size_t>(actual_k));
  try {
    index_->search(1, normalized.data(), actual_k, distances.data(), labels.data());
  } catch (const faiss::FaissException& e) {
    throw VectorIndexError("Search failed: " + std::string(e.what()));
  }

  std::vector<IndexHit> hits;
  hits.reserve(labels.size());
  for (size_t i = 0; i < labels.size(); ++i) {
    if (labels[i] < 0 || static_cast<size_t>(labels[i]) >= id_map_.size()) continue;
    hits.push_back({id_map_[static_cast<size_t>(labels[i])], distances[i]});
  }
  return hits;
}

size_t VectorIndex::remove_ids(const std::vector<long long>& ids) {
  if (ids.empty()) return 0;
  const std::unordered_set<long long> doomed(ids.begin(), ids.end());

  std::unique_lock lock(mutex_);
  std::vector<int64_t> kept_ids;
  std::vector<float> kept_vectors;
  for (size_t slot = 0; slot < id_map_.size(); ++slot) {
    if (doomed.count(id_map_[slot])) continue;
    kept_ids.push_back(id_map_[slot]);
    const auto begin = raw_vectors_.begin() + static_cast<std::ptrdiff_t>(slot * options_.dimension);
    kept_vectors.insert(kept_vectors.end(), begin, begin + static_cast<std::ptrdiff_t>(options_.dimension));
  }

  const size_t removed = id_map_.size() - kept_ids.size();
  if (removed == 0) return 0;

  std::unique_ptr<faiss::Index> rebuilt;
  if (!kept_ids.empty()) {
    rebuilt = build_populated(kept_vectors, kept_ids.size());
  }
  index_ = std::move(rebuilt);
  state_ = index_ ? IndexState::Trained : IndexState::Untrained;
  id_map_ = std::move(kept_ids);
  raw_vectors_ = std::move(kept_vectors);
  std::cout << "[VectorIndex] Removed " << removed << " vectors, " << id_map_.size() << " remain"
            << std::endl;
  return removed;
}

void VectorIndex::reset() {
  std::unique_lock lock(mutex_);
  index_.reset();
  state_ = IndexState::Untrained;
  id_map_.clear();
  raw_vectors_.clear();
}

void VectorIndex::save() const {
  std::shared_lock lock(mutex_);
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    throw VectorIndexError("Cannot create index directory " + directory_.string() + ": " + ec.message());
  }

  if (state_ == IndexState::Untrained || !index_) {
    std::filesystem::remove(index_path(), ec);
    std::filesystem::remove(id_map_path(), ec);
    return;
  }

  const auto index_tmp = index_path().string() + ".tmp";
  const auto ids_tmp = id_map_path().string() + ".tmp";
  try {
    faiss::write_index(index_.get(), index_tmp.c_str());
  } catch (const faiss::FaissException& e) {
    throw VectorIndexError("Failed to write index: " + std::string(e.what()));
  }

  {
    std::ofstream out(ids_tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw VectorIndexError("Cannot open " + ids_tmp + " for writing");
    }
    const uint64_t n = id_map_.size();
    out.write(reinterpret_cast<const char*>(&n), sizeof(n));
    out.write(reinterpret_cast<const char*>(id_map_.data()),
              static_cast<std::streamsize>(id_map_.size() * sizeof(int64_t)));
    if (!out) {
      throw VectorIndexError("Failed writing id map " + ids_tmp);
    }
  }

  std::filesystem::rename(index_tmp, index_path());
  std::filesystem::rename(ids_tmp, id_map_path());
  std::cout << "[VectorIndex] Saved " << id_map_.size() << " vectors to " << index_path() << std::endl;
}

bool VectorIndex::load() {
  if (!std::filesystem::exists(index_path())) {
    return false;
  }
  if (!std::filesystem::exists(id_map_path())) {
    throw VectorIndexError("Index file " + index_path().string() + " has no id map at " +
                           id_map_path().string());
  }

  std::unique_ptr<faiss::Index> loaded;
  try {
    loaded.reset(faiss::read_index(index_path().string().c_str()));
  } catch (const faiss::FaissException& e) {
    throw VectorIndexError("Failed to read index: " + std::string(e.what()));
  }
  if (static_cast<size_t>(loaded->d) != options_.dimension) {
    throw VectorIndexError("Stored index dimension " + std::to_string(loaded->d) +
                           " does not match configured dimension " + std::to_string(options_.dimension));
  }

  std::vector<int64_t> ids;
  {
    std::ifstream in(id_map_path(), std::ios::binary);
    uint64_t n = 0;
    if (!in.read(reinterpret_cast<char*>(&n), sizeof(n))) {
      throw VectorIndexError("Corrupt id map " + id_map_path().string());
    }
    ids.resize(n);
    if (!in.read(reinterpret_cast<char*>(ids.data()), static_cast<std::streamsize>(n * sizeof(int64_t)))) {
      throw VectorIndexError("Truncated id map " + id_map_path().string());
    }
  }
  if (ids.size() != static_cast<size_t>(loaded->ntotal)) {
    throw VectorIndexError("Index holds " + std::to_string(loaded->ntotal) + " vectors but id map has " +
                           std::to_string(ids.size()) + " entries");
  }

  std::vector<float> raw(ids.size() * options_.dimension);
  try {
    if (auto* ivf = dynamic_cast<faiss::IndexIVF*>(loaded.get())) {
      ivf->make_direct_map();
      ivf->nprobe = std::min<size_t>(static_cast<size_t>(std::max(1, options_.ivf_nprobe)), ivf->nlist);
    }
    if (!ids.empty()) {
      loaded->reconstruct_n(0, loaded->ntotal, raw.data());
    }
  } catch (const faiss::FaissException& e) {
    throw VectorIndexError("Failed to reconstruct stored vectors: " + std::string(e.what()));
  }

  std::unique_lock lock(mutex_);
  index_ = std::move(loaded);
  state_ = IndexState::Trained;
  id_map_ = std::move(ids);
  raw_vectors_ = std::move(raw);
  std::cout << "[VectorIndex] Loaded " << id_map_.size() << " vectors from " << index_path() << std::endl;
  return true;
}

size_t VectorIndex::count() const {
  std::shared_lock lock(mutex_);
  return index_ ? static_cast<size_t>(index_->ntotal) : 0;
}

size_t VectorIndex::id_map_size() const {
  std::shared_lock lock(mutex_);
  return id_map_.size();
}

IndexState VectorIndex::state() const {
  std::shared_lock lock(mutex_);
  return state_;
}

}  // namespace docqa_core
