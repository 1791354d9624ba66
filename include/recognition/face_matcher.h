#pragma once

#include "models/face_match.h"
#include "recognition/embedding_registry.h"
#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief Distance metrics the matcher understands
 *
 * The threshold only has meaning for the metric the registry embeddings were
 * produced under, so both travel together in MatchConfig.
 */
enum class DistanceMetric {
  EUCLIDEAN // L2 distance
};

/**
 * @brief L2 acceptance threshold for L2-normalised SFace embeddings
 */
constexpr double kDefaultMatchThreshold = 1.128;

/**
 * @brief Metric + acceptance threshold, configured as one unit
 */
struct MatchConfig {
  DistanceMetric metric = DistanceMetric::EUCLIDEAN;
  double threshold = kDefaultMatchThreshold;

  /**
   * @brief Build from configuration values
   * @throws InputError for an unsupported metric name or a negative or
   * non-finite threshold
   */
  static MatchConfig fromConfig(const std::string &metricName,
                                double threshold);

  static std::string getMetricName(DistanceMetric metric);
};

/**
 * @brief Nearest neighbour matcher over an immutable registry snapshot
 *
 * The matcher never observes later registry changes; build a new one to
 * pick them up. All methods are const and safe to call concurrently.
 */
class FaceMatcher {
public:
  /**
   * @throws InputError if config is invalid
   * @throws DimensionMismatchError if snapshot rows differ in length
   */
  FaceMatcher(const EmbeddingSnapshot &snapshot, const MatchConfig &config);

  /**
   * @brief Match one query vector
   *
   * Computes the distance to every row, keeps the first row with the minimum
   * distance and accepts it iff distance <= threshold. A rejected match
   * reports kUnknownIdentity with the true minimum distance. An empty
   * snapshot reports kUnknownIdentity with kEmptyRegistryDistance.
   *
   * @throws DimensionMismatchError if the query length differs from the
   * snapshot dimension
   */
  MatchResult match(const std::vector<float> &query) const;

  /**
   * @brief Match several faces independently
   * @return One result per query, carrying boxes[i]
   * @throws InputError if queries and boxes differ in length
   */
  std::vector<MatchResult>
  matchBatch(const std::vector<std::vector<float>> &queries,
             const std::vector<BoundingBox> &boxes) const;

  size_t size() const { return identities_.size(); }
  size_t dimension() const { return dimension_; }
  uint64_t version() const { return version_; }
  double threshold() const { return config_.threshold; }
  const MatchConfig &config() const { return config_; }
  const std::vector<std::string> &identities() const { return identities_; }

  static double euclideanDistance(const float *a, const float *b, size_t dim);

private:
  std::vector<std::string> identities_;
  std::vector<float> matrix_; // row major, size() x dimension_
  size_t dimension_ = 0;
  uint64_t version_ = 0;
  MatchConfig config_;
};
