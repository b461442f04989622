#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace vault::risk {

// What the caller knows about the request being evaluated.
struct RequestContext {
  std::string              client_fingerprint;
  std::string              ip_address;
  std::uint32_t            failed_attempts = 0;
  std::vector<std::string> data_categories;
};

struct SignalInput {
  RequestContext request;
  // bound to the session at issue
  std::string   bound_fingerprint;
  std::string   bound_ip;
  std::uint32_t recorded_failures = 0;
};

enum class Signal {
  kDevice,
  kNetwork,
  kBehavior,
  kContent,
};

const char* ToString(Signal signal);

class RiskSignalSource {
 public:
  virtual ~RiskSignalSource() = default;

  virtual Signal Kind() const = 0;

  // nullopt when the input carries nothing to judge by
  virtual std::optional<double> Evaluate(const SignalInput& input) const = 0;
};

class DeviceSignalSource final : public RiskSignalSource {
 public:
  Signal Kind() const override {
    return Signal::kDevice;
  }
  std::optional<double> Evaluate(const SignalInput& input) const override;
};

class NetworkSignalSource final : public RiskSignalSource {
 public:
  explicit NetworkSignalSource(std::vector<std::string> blocked_prefixes);

  Signal Kind() const override {
    return Signal::kNetwork;
  }
  std::optional<double> Evaluate(const SignalInput& input) const override;

 private:
  std::vector<std::string> blocked_prefixes_;
};

class BehaviorSignalSource final : public RiskSignalSource {
 public:
  Signal Kind() const override {
    return Signal::kBehavior;
  }
  std::optional<double> Evaluate(const SignalInput& input) const override;
};

class ContentSignalSource final : public RiskSignalSource {
 public:
  explicit ContentSignalSource(std::unordered_map<std::string, double> sensitivity);

  Signal Kind() const override {
    return Signal::kContent;
  }
  std::optional<double> Evaluate(const SignalInput& input) const override;

 private:
  std::unordered_map<std::string, double> sensitivity_;
};

std::vector<std::unique_ptr<RiskSignalSource>> DefaultSources(std::vector<std::string>                blocked_prefixes,
                                                              std::unordered_map<std::string, double> sensitivity);

} // namespace vault::risk
