#pragma once

#include <faiss/IndexFlat.h>

#include <memory>
#include <vector>

namespace ephem_core {

struct ScoredIndex {
  size_t index;
  float score;
};

/**
 * @class VectorIndex
 * @brief Exact cosine-similarity index over the vectors of one session.
 *
 * Rows are unit-normalized on insertion and kept in a flat inner-product
 * FAISS index, so a query is an exhaustive dot-product scan. Row i is the
 * vector of the chunk with insertion index i.
 *
 * Not internally synchronized; the owning Session serializes writers
 * against readers.
 */
class VectorIndex {
 public:
  explicit VectorIndex(size_t dimension);
  ~VectorIndex();

  VectorIndex(const VectorIndex &) = delete;
  VectorIndex &operator=(const VectorIndex &) = delete;
  VectorIndex(VectorIndex &&) = delete;
  VectorIndex &operator=(VectorIndex &&) = delete;

  /**
   * @brief Appends rows in order. All rows are validated before any is added.
   * @param start_index Must equal size(); anything else means the caller's
   *        chunk list and this index disagree.
   * @throws DimensionMismatchError, InvalidArgumentError (zero or non-finite
   *         vector), CorruptedIndexError.
   */
  void append(const std::vector<std::vector<float>> &vectors, size_t start_index);

  // Top-k rows by score, highest first, ties broken by lower index.
  // k is clamped to size().
  std::vector<ScoredIndex> query(const std::vector<float> &query_vector, size_t k) const;

  // The stored (normalized) vector of one row
  std::vector<float> vector_at(size_t index) const;

  size_t size() const;
  size_t dimension() const {
    return dimension_;
  }

  // Unit-length copy of v. Throws InvalidArgumentError when v has no direction.
  static std::vector<float> normalized(const std::vector<float> &v);

 private:
  void validate_row(const std::vector<float> &v) const;
  static void check_direction(const std::vector<float> &v);

  size_t dimension_;
  std::unique_ptr<faiss::IndexFlatIP> index_;

  static constexpr float MIN_NORM_SQR = 1e-12f;
};

}  // namespace ephem_core
