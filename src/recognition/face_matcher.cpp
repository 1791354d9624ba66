#include "recognition/face_matcher.h"
#include "core/errors.h"
#include <algorithm>
#include <cmath>
#include <limits>

MatchConfig MatchConfig::fromConfig(const std::string &metricName,
                                    double threshold) {
  std::string lower = metricName;
  std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

  MatchConfig config;
  if (lower == "euclidean" || lower == "l2") {
    config.metric = DistanceMetric::EUCLIDEAN;
  } else {
    throw InputError("Unsupported distance metric '" + metricName +
                     "'. Only 'euclidean' is supported");
  }

  if (!std::isfinite(threshold) || threshold < 0.0) {
    throw InputError("Match threshold must be a finite, non-negative number");
  }
  config.threshold = threshold;
  return config;
}

std::string MatchConfig::getMetricName(DistanceMetric metric) {
  switch (metric) {
  case DistanceMetric::EUCLIDEAN:
    return "euclidean";
  }
  return "unknown";
}

FaceMatcher::FaceMatcher(const EmbeddingSnapshot &snapshot,
                         const MatchConfig &config)
    : identities_(snapshot.identities), version_(snapshot.version),
      config_(MatchConfig::fromConfig(MatchConfig::getMetricName(config.metric),
                                      config.threshold)) {
  if (snapshot.vectors.size() != snapshot.identities.size()) {
    throw InputError("Snapshot has " +
                     std::to_string(snapshot.identities.size()) +
                     " identities but " +
                     std::to_string(snapshot.vectors.size()) + " vectors");
  }

  dimension_ = snapshot.vectors.empty() ? 0 : snapshot.vectors.front().size();
  matrix_.reserve(snapshot.vectors.size() * dimension_);
  for (const auto &row : snapshot.vectors) {
    if (row.size() != dimension_) {
      throw DimensionMismatchError(dimension_, row.size());
    }
    matrix_.insert(matrix_.end(), row.begin(), row.end());
  }
}

double FaceMatcher::euclideanDistance(const float *a, const float *b,
                                      size_t dim) {
  double sum = 0.0;
  for (size_t i = 0; i < dim; ++i) {
    double d = static_cast<double>(a[i]) - static_cast<double>(b[i]);
    sum += d * d;
  }
  return std::sqrt(sum);
}

MatchResult FaceMatcher::match(const std::vector<float> &query) const {
  MatchResult result;
  if (identities_.empty()) {
    result.identity = kUnknownIdentity;
    result.distance = kEmptyRegistryDistance;
    return result;
  }

  if (query.size() != dimension_) {
    throw DimensionMismatchError(dimension_, query.size());
  }

  size_t best = 0;
  double bestDistance = std::numeric_limits<double>::infinity();
  for (size_t row = 0; row < identities_.size(); ++row) {
    double d =
        euclideanDistance(query.data(), &matrix_[row * dimension_], dimension_);
    // Strict comparison keeps the first row on ties.
    if (d < bestDistance) {
      bestDistance = d;
      best = row;
    }
  }

  result.distance = bestDistance;
  result.identity =
      bestDistance <= config_.threshold ? identities_[best] : kUnknownIdentity;
  return result;
}

std::vector<MatchResult>
FaceMatcher::matchBatch(const std::vector<std::vector<float>> &queries,
                        const std::vector<BoundingBox> &boxes) const {
  if (queries.size() != boxes.size()) {
    throw InputError("Got " + std::to_string(queries.size()) +
                     " vectors for " + std::to_string(boxes.size()) +
                     " boxes");
  }

  std::vector<MatchResult> results;
  results.reserve(queries.size());
  for (size_t i = 0; i < queries.size(); ++i) {
    MatchResult result = match(queries[i]);
    result.box = boxes[i];
    results.push_back(std::move(result));
  }
  return results;
}
