#pragma once

#include <memory>
#include <vector>

#include "internal/risk/risk_scorer.hpp"
#include "internal/risk/signal_sources.hpp"

namespace vault::risk {

struct Assessment {
  RiskSignals signals;
  double      score = RiskScorer::kWorst;
  AccessTier  tier  = AccessTier::kDenied;
  // at least one signal was unavailable and scored as worst case
  bool degraded = false;
};

class RiskEngine {
 public:
  RiskEngine(RiskScorer scorer, std::vector<std::unique_ptr<RiskSignalSource>> sources);

  Assessment Assess(const SignalInput& input) const;

  const RiskScorer& Scorer() const {
    return scorer_;
  }

 private:
  RiskScorer                                     scorer_;
  std::vector<std::unique_ptr<RiskSignalSource>> sources_;
};

} // namespace vault::risk
