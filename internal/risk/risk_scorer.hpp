#pragma once

#include <optional>

#include "internal/risk/access_tier.hpp"

namespace vault::risk {

struct RiskWeights {
  double device   = 1.0;
  double network  = 1.0;
  double behavior = 1.0;
  double content  = 1.0;
};

// Inclusive upper score of each tier. Above elevated_max is DENIED.
struct TierBounds {
  double full_max     = 20.0;
  double standard_max = 40.0;
  double elevated_max = 80.0;
};

// Each signal is in [0, 100]; higher is riskier. Unset means unknown.
struct RiskSignals {
  std::optional<double> device;
  std::optional<double> network;
  std::optional<double> behavior;
  std::optional<double> content;
};

/*
  RiskScorer

  Weighted mean of the four signals. Weights are non-negative, so the
  score never decreases when any single signal increases. Unknown or NaN
  signals count as kWorst.
*/
class RiskScorer {
 public:
  static constexpr double kWorst = 100.0;

  // throws util::ValidationError on negative/all-zero weights or
  // bounds that are not strictly increasing within [0, 100]
  RiskScorer(RiskWeights weights, TierBounds bounds);

  double     Score(const RiskSignals& signals) const;
  AccessTier Tier(double score) const;

  const RiskWeights& Weights() const {
    return weights_;
  }
  const TierBounds& Bounds() const {
    return bounds_;
  }

 private:
  RiskWeights weights_;
  TierBounds  bounds_;
};

} // namespace vault::risk
