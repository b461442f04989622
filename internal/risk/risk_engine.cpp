#include "internal/risk/risk_engine.hpp"

#include <cmath>

#include "internal/observability/logging.hpp"

namespace vault::risk {

namespace {

std::optional<double>& Slot(RiskSignals& signals, Signal kind) {
  switch (kind) {
    case Signal::kDevice:
      return signals.device;
    case Signal::kNetwork:
      return signals.network;
    case Signal::kBehavior:
      return signals.behavior;
    case Signal::kContent:
      break;
  }
  return signals.content;
}

} // namespace

RiskEngine::RiskEngine(RiskScorer scorer, std::vector<std::unique_ptr<RiskSignalSource>> sources)
    : scorer_(scorer), sources_(std::move(sources)) {
}

Assessment RiskEngine::Assess(const SignalInput& input) const {
  Assessment out;

  for (const auto& source : sources_) {
    std::optional<double> value;
    try {
      value = source->Evaluate(input);
    } catch (const std::exception& e) {
      VAULT_LOG_WARN("risk signal failed", {observability::StringField("signal", ToString(source->Kind())),
                                            observability::StringField("error", e.what())});
    }
    Slot(out.signals, source->Kind()) = value;
  }

  for (const auto* s : {&out.signals.device, &out.signals.network, &out.signals.behavior, &out.signals.content}) {
    if (!s->has_value() || std::isnan(**s)) out.degraded = true;
  }
  if (out.degraded) {
    VAULT_LOG_DEBUG("risk assessment degraded; unknown signals scored as worst case");
  }

  out.score = scorer_.Score(out.signals);
  out.tier  = scorer_.Tier(out.score);
  return out;
}

} // namespace vault::risk
