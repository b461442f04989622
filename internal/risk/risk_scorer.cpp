#include "internal/risk/risk_scorer.hpp"

#include <algorithm>
#include <cmath>

#include "internal/util/errors.hpp"

namespace vault::risk {

namespace {

double Normalize(const std::optional<double>& signal) {
  if (!signal || std::isnan(*signal)) return RiskScorer::kWorst;
  return std::clamp(*signal, 0.0, 100.0);
}

} // namespace

RiskScorer::RiskScorer(RiskWeights weights, TierBounds bounds) : weights_(weights), bounds_(bounds) {
  for (double w : {weights_.device, weights_.network, weights_.behavior, weights_.content}) {
    if (!(w >= 0.0) || std::isinf(w)) throw util::ValidationError("risk weights must be finite and non-negative");
  }
  if (weights_.device + weights_.network + weights_.behavior + weights_.content <= 0.0) {
    throw util::ValidationError("risk weights must not all be zero");
  }
  if (!(bounds_.full_max >= 0.0 && bounds_.full_max < bounds_.standard_max && bounds_.standard_max < bounds_.elevated_max &&
        bounds_.elevated_max <= 100.0)) {
    throw util::ValidationError("risk tier bounds must be strictly increasing within [0, 100]");
  }
}

double RiskScorer::Score(const RiskSignals& signals) const {
  const double total = weights_.device + weights_.network + weights_.behavior + weights_.content;
  const double sum   = weights_.device * Normalize(signals.device) + weights_.network * Normalize(signals.network) +
                     weights_.behavior * Normalize(signals.behavior) + weights_.content * Normalize(signals.content);
  return std::clamp(sum / total, 0.0, 100.0);
}

AccessTier RiskScorer::Tier(double score) const {
  if (std::isnan(score)) return AccessTier::kDenied;
  if (score <= bounds_.full_max) return AccessTier::kFull;
  if (score <= bounds_.standard_max) return AccessTier::kStandard;
  if (score <= bounds_.elevated_max) return AccessTier::kElevated;
  return AccessTier::kDenied;
}

} // namespace vault::risk
