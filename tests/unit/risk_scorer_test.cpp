#include "internal/risk/risk_scorer.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

#include "internal/risk/risk_engine.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace vault::risk;

RiskSignals All(double v) {
  return {v, v, v, v};
}

void TestTierLadder() {
  RiskScorer scorer(RiskWeights{}, TierBounds{});

  assert(scorer.Tier(0.0) == AccessTier::kFull);
  assert(scorer.Tier(20.0) == AccessTier::kFull && "bounds are inclusive");
  assert(scorer.Tier(20.5) == AccessTier::kStandard);
  assert(scorer.Tier(40.0) == AccessTier::kStandard);
  assert(scorer.Tier(40.1) == AccessTier::kElevated);
  assert(scorer.Tier(80.0) == AccessTier::kElevated);
  assert(scorer.Tier(80.1) == AccessTier::kDenied);
  assert(scorer.Tier(100.0) == AccessTier::kDenied);
  assert(scorer.Tier(std::nan("")) == AccessTier::kDenied);
}

void TestWeightedMean() {
  RiskScorer scorer(RiskWeights{.device = 3.0, .network = 1.0, .behavior = 0.0, .content = 0.0}, TierBounds{});
  RiskSignals s{.device = 20.0, .network = 60.0, .behavior = 100.0, .content = 100.0};
  assert(std::abs(scorer.Score(s) - 30.0) < 1e-9);

  RiskScorer equal(RiskWeights{}, TierBounds{});
  assert(std::abs(equal.Score(All(10.0)) - 10.0) < 1e-9);
}

void TestUnknownSignalsScoreWorst() {
  RiskScorer  scorer(RiskWeights{}, TierBounds{});
  RiskSignals partial{.device = 0.0, .network = 0.0, .behavior = 0.0, .content = std::nullopt};
  assert(std::abs(scorer.Score(partial) - 25.0) < 1e-9);

  RiskSignals nan_signal{.device = std::nan(""), .network = 0.0, .behavior = 0.0, .content = 0.0};
  assert(std::abs(scorer.Score(nan_signal) - 25.0) < 1e-9);

  assert(scorer.Score(RiskSignals{}) == RiskScorer::kWorst);
  assert(scorer.Tier(scorer.Score(RiskSignals{})) == AccessTier::kDenied);

  // out-of-range inputs are clamped
  assert(scorer.Score(All(250.0)) == 100.0);
  assert(scorer.Score(All(-5.0)) == 0.0);
}

void TestScoreIsMonotonic() {
  RiskScorer scorer(RiskWeights{.device = 2.0, .network = 0.5, .behavior = 1.0, .content = 0.0}, TierBounds{});

  const double steps[] = {0.0, 10.0, 35.0, 70.0, 100.0};
  for (double base : steps) {
    for (double bump : steps) {
      if (bump < base) continue;
      for (int which = 0; which < 4; ++which) {
        RiskSignals lo = All(base);
        RiskSignals hi = All(base);
        std::optional<double>* slot[] = {&hi.device, &hi.network, &hi.behavior, &hi.content};
        *slot[which]                  = bump;
        assert(scorer.Score(hi) >= scorer.Score(lo));
        assert(!MoreRestrictive(scorer.Tier(scorer.Score(lo)), scorer.Tier(scorer.Score(hi))));
      }
    }
  }
}

void TestInvalidConfigurationRejected() {
  auto rejects = [](RiskWeights w, TierBounds b) {
    try {
      RiskScorer scorer(w, b);
    } catch (const vault::util::ValidationError&) {
      return true;
    }
    return false;
  };

  assert(rejects({.device = -1.0}, TierBounds{}));
  assert(rejects({.device = 0.0, .network = 0.0, .behavior = 0.0, .content = 0.0}, TierBounds{}));
  assert(rejects({.device = std::numeric_limits<double>::infinity()}, TierBounds{}));
  assert(rejects(RiskWeights{}, {.full_max = 40.0, .standard_max = 20.0, .elevated_max = 80.0}));
  assert(rejects(RiskWeights{}, {.full_max = 20.0, .standard_max = 40.0, .elevated_max = 120.0}));
  assert(!rejects(RiskWeights{}, TierBounds{}));
}

void TestSignalSources() {
  SignalInput in;

  DeviceSignalSource device;
  assert(!device.Evaluate(in).has_value() && "no fingerprint, nothing to judge");
  in.request.client_fingerprint = "fp-1";
  assert(*device.Evaluate(in) == 10.0);
  in.bound_fingerprint = "fp-1";
  assert(*device.Evaluate(in) == 10.0);
  in.bound_fingerprint = "fp-2";
  assert(*device.Evaluate(in) == 70.0);

  NetworkSignalSource network({"203.0.113."});
  assert(!network.Evaluate(in).has_value());
  in.request.ip_address = "10.0.0.5";
  in.bound_ip           = "10.0.0.5";
  assert(*network.Evaluate(in) == 10.0);
  in.bound_ip = "10.0.0.9";
  assert(*network.Evaluate(in) == 60.0);
  in.request.ip_address = "203.0.113.7";
  assert(*network.Evaluate(in) == 100.0);

  BehaviorSignalSource behavior;
  assert(*behavior.Evaluate(in) == 10.0);
  in.request.failed_attempts = 1;
  in.recorded_failures       = 2;
  assert(*behavior.Evaluate(in) == 70.0);
  in.recorded_failures = 20;
  assert(*behavior.Evaluate(in) == 100.0);

  ContentSignalSource content({{"pii", 60.0}, {"medical", 90.0}});
  assert(*content.Evaluate(in) == 0.0);
  in.request.data_categories = {"public", "pii"};
  assert(*content.Evaluate(in) == 60.0);
  in.request.data_categories.push_back("medical");
  assert(*content.Evaluate(in) == 90.0);
}

class ThrowingSource final : public RiskSignalSource {
 public:
  Signal Kind() const override {
    return Signal::kNetwork;
  }
  std::optional<double> Evaluate(const SignalInput&) const override {
    throw std::runtime_error("geoip lookup timed out");
  }
};

void TestEngineDegradesToWorstCase() {
  std::vector<std::unique_ptr<RiskSignalSource>> sources;
  sources.push_back(std::make_unique<DeviceSignalSource>());
  sources.push_back(std::make_unique<ThrowingSource>());
  sources.push_back(std::make_unique<BehaviorSignalSource>());
  sources.push_back(std::make_unique<ContentSignalSource>(std::unordered_map<std::string, double>{}));
  RiskEngine engine(RiskScorer(RiskWeights{}, TierBounds{}), std::move(sources));

  SignalInput in;
  in.request.client_fingerprint = "fp";
  auto a                        = engine.Assess(in);
  assert(a.degraded);
  assert(!a.signals.network.has_value());
  // (10 + 100 + 10 + 0) / 4
  assert(std::abs(a.score - 30.0) < 1e-9);
  assert(a.tier == AccessTier::kStandard);

  RiskEngine healthy(RiskScorer(RiskWeights{}, TierBounds{}), DefaultSources({}, {}));
  in.request.ip_address = "10.0.0.1";
  auto b                = healthy.Assess(in);
  assert(!b.degraded);
  assert(b.tier == AccessTier::kFull);
}

} // namespace

int main() {
  TestTierLadder();
  TestWeightedMean();
  TestUnknownSignalsScoreWorst();
  TestScoreIsMonotonic();
  TestInvalidConfigurationRejected();
  TestSignalSources();
  TestEngineDegradesToWorstCase();

  std::cout << "vault_unit_risk_scorer: pass\n";
  return 0;
}
