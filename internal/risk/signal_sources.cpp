#include "internal/risk/signal_sources.hpp"

#include <algorithm>

namespace vault::risk {

const char* ToString(Signal signal) {
  switch (signal) {
    case Signal::kDevice:
      return "device";
    case Signal::kNetwork:
      return "network";
    case Signal::kBehavior:
      return "behavior";
    case Signal::kContent:
      return "content";
  }
  return "unknown";
}

std::optional<double> DeviceSignalSource::Evaluate(const SignalInput& input) const {
  if (input.request.client_fingerprint.empty()) return std::nullopt;
  if (input.bound_fingerprint.empty() || input.request.client_fingerprint == input.bound_fingerprint) return 10.0;
  return 70.0;
}

NetworkSignalSource::NetworkSignalSource(std::vector<std::string> blocked_prefixes) : blocked_prefixes_(std::move(blocked_prefixes)) {
}

std::optional<double> NetworkSignalSource::Evaluate(const SignalInput& input) const {
  const auto& ip = input.request.ip_address;
  if (ip.empty()) return std::nullopt;

  double score = (input.bound_ip.empty() || ip == input.bound_ip) ? 10.0 : 60.0;
  for (const auto& prefix : blocked_prefixes_) {
    if (!prefix.empty() && ip.compare(0, prefix.size(), prefix) == 0) {
      score += 40.0;
      break;
    }
  }
  return std::min(score, 100.0);
}

std::optional<double> BehaviorSignalSource::Evaluate(const SignalInput& input) const {
  const double failures = static_cast<double>(input.request.failed_attempts) + static_cast<double>(input.recorded_failures);
  return std::min(100.0, 10.0 + 20.0 * failures);
}

ContentSignalSource::ContentSignalSource(std::unordered_map<std::string, double> sensitivity) : sensitivity_(std::move(sensitivity)) {
}

std::optional<double> ContentSignalSource::Evaluate(const SignalInput& input) const {
  double score = 0.0;
  for (const auto& category : input.request.data_categories) {
    if (auto it = sensitivity_.find(category); it != sensitivity_.end()) {
      score = std::max(score, it->second);
    }
  }
  return score;
}

std::vector<std::unique_ptr<RiskSignalSource>> DefaultSources(std::vector<std::string>                blocked_prefixes,
                                                              std::unordered_map<std::string, double> sensitivity) {
  std::vector<std::unique_ptr<RiskSignalSource>> sources;
  sources.push_back(std::make_unique<DeviceSignalSource>());
  sources.push_back(std::make_unique<NetworkSignalSource>(std::move(blocked_prefixes)));
  sources.push_back(std::make_unique<BehaviorSignalSource>());
  sources.push_back(std::make_unique<ContentSignalSource>(std::move(sensitivity)));
  return sources;
}

} // namespace vault::risk
