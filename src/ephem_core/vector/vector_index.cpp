#include "ephem_core/vector/vector_index.hpp"

#include <faiss/impl/FaissException.h>
#include <faiss/utils/distances.h>

#include <algorithm>
#include <cmath>
#include <iostream>

#include "ephem_core/errors.hpp"

namespace ephem_core {

VectorIndex::VectorIndex(size_t dimension) : dimension_(dimension) {
  if (dimension == 0) {
    throw InvalidArgumentError("Vector index dimension must be greater than 0");
  }
  index_ = std::make_unique<faiss::IndexFlatIP>(static_cast<faiss::idx_t>(dimension));
}

VectorIndex::~VectorIndex() = default;

size_t VectorIndex::size() const {
  return static_cast<size_t>(index_->ntotal);
}

void VectorIndex::check_direction(const std::vector<float> &v) {
  for (float x : v) {
    if (!std::isfinite(x)) {
      throw InvalidArgumentError("Vector contains a non-finite component");
    }
  }
  if (faiss::fvec_norm_L2sqr(v.data(), v.size()) < MIN_NORM_SQR) {
    throw InvalidArgumentError("Vector has zero norm and carries no direction");
  }
}

void VectorIndex::validate_row(const std::vector<float> &v) const {
  if (v.size() != dimension_) {
    throw DimensionMismatchError(dimension_, v.size());
  }
  check_direction(v);
}

std::vector<float> VectorIndex::normalized(const std::vector<float> &v) {
  if (v.empty()) {
    throw InvalidArgumentError("Cannot normalize an empty vector");
  }
  check_direction(v);
  std::vector<float> out(v);
  faiss::fvec_renorm_L2(out.size(), 1, out.data());
  return out;
}

void VectorIndex::append(const std::vector<std::vector<float>> &vectors, size_t start_index) {
  if (start_index != size()) {
    std::cerr << "[VectorIndex] CRITICAL: append at " << start_index << " but index holds "
              << size() << " rows" << std::endl;
    throw CorruptedIndexError("Append position " + std::to_string(start_index) +
                              " does not match index size " + std::to_string(size()));
  }
  if (vectors.empty()) {
    return;
  }

  // Validate everything first so a bad row leaves the index untouched
  for (const auto &v : vectors) {
    validate_row(v);
  }

  std::vector<float> flat;
  flat.reserve(vectors.size() * dimension_);
  for (const auto &v : vectors) {
    flat.insert(flat.end(), v.begin(), v.end());
  }
  faiss::fvec_renorm_L2(dimension_, vectors.size(), flat.data());

  try {
    index_->add(static_cast<faiss::idx_t>(vectors.size()), flat.data());
  } catch (const faiss::FaissException &e) {
    throw CorruptedIndexError("Faiss add failed: " + std::string(e.what()));
  }
}

std::vector<ScoredIndex> VectorIndex::query(const std::vector<float> &query_vector,
                                            size_t k) const {
  if (query_vector.size() != dimension_) {
    throw DimensionMismatchError(dimension_, query_vector.size());
  }
  const size_t actual_k = std::min(k, size());
  if (actual_k == 0) {
    return {};
  }

  std::vector<float> q = normalized(query_vector);
  std::vector<float> scores(actual_k);
  std::vector<faiss::idx_t> labels(actual_k);
  try {
    index_->search(1, q.data(), static_cast<faiss::idx_t>(actual_k), scores.data(),
                   labels.data());
  } catch (const faiss::FaissException &e) {
    throw CorruptedIndexError("Faiss search failed: " + std::string(e.what()));
  }

  std::vector<ScoredIndex> results;
  results.reserve(actual_k);
  for (size_t i = 0; i < actual_k; ++i) {
    if (labels[i] < 0) {
      continue;
    }
    results.push_back({static_cast<size_t>(labels[i]), scores[i]});
  }

  // The flat scan keeps the first-seen row on equal scores; the heap it
  // returns is not ordered among equals, so fix the order here.
  std::sort(results.begin(), results.end(), [](const ScoredIndex &a, const ScoredIndex &b) {
    if (a.score != b.score) {
      return a.score > b.score;
    }
    return a.index < b.index;
  });
  return results;
}

std::vector<float> VectorIndex::vector_at(size_t index) const {
  if (index >= size()) {
    throw InvalidArgumentError("Row " + std::to_string(index) + " is out of range");
  }
  std::vector<float> out(dimension_);
  try {
    index_->reconstruct(static_cast<faiss::idx_t>(index), out.data());
  } catch (const faiss::FaissException &e) {
    throw CorruptedIndexError("Faiss reconstruct failed: " + std::string(e.what()));
  }
  return out;
}

}  // namespace ephem_core
