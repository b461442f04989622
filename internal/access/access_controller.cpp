#include "internal/access/access_controller.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace vault::access {

using observability::KeyField;
using observability::StringField;

AccessController::AccessController(std::shared_ptr<session::SessionManager> sessions, std::shared_ptr<domain::DomainGate> domains,
                                   std::shared_ptr<version::VersionStore> records, std::shared_ptr<util::Clock> clock,
                                   std::shared_ptr<audit::AuditSink> audit)
    : sessions_(std::move(sessions)),
      domains_(std::move(domains)),
      records_(std::move(records)),
      clock_(std::move(clock)),
      audit_(std::move(audit)) {
}

AccessResult AccessController::Evaluate(const AccessRequest& request) {
  auto check = sessions_->Authenticate(request.token);
  if (!check) {
    return {Decision::Deny(*check.denied), std::nullopt, std::nullopt};
  }
  if (check.session->actor_hk != request.actor_hk) {
    return {Decision::Deny(DenyReason::kActorMismatch), std::nullopt, std::nullopt};
  }

  auto domain = domains_->Authorize(request.actor_hk, request.resource_domain, request.action, request.resource_category);
  if (!domain) {
    return {domain, std::nullopt, std::nullopt};
  }

  auto context = request.context;
  if (!request.resource_category.empty() &&
      std::find(context.data_categories.begin(), context.data_categories.end(), request.resource_category) == context.data_categories.end()) {
    context.data_categories.push_back(request.resource_category);
  }

  auto validation = sessions_->Validate(request.token, context);
  if (!validation) {
    return {Decision::Deny(*validation.denied), validation.assessment, std::nullopt};
  }

  if (validation.assessment->tier == risk::AccessTier::kElevated && !request.step_up_verified) {
    return {Decision::Deny(DenyReason::kStepUpRequired), validation.assessment, std::nullopt};
  }
  return {Decision::Allow(), validation.assessment, std::nullopt};
}

void AccessController::Audit(const AccessRequest& request, const AccessResult& result, const std::string& error) {
  if (!result.decision) {
    VAULT_LOG_INFO("access denied", {KeyField("actor", request.actor_hk), StringField("domain", request.resource_domain),
                                     StringField("action", ToString(request.action)),
                                     StringField("reason", ToString(*result.decision.reason))});
  }
  if (!error.empty()) {
    VAULT_LOG_WARN("authorized access failed", {KeyField("actor", request.actor_hk), StringField("domain", request.resource_domain),
                                                StringField("action", ToString(request.action)), StringField("error", error)});
  }

  audit::SafeRecord(audit_.get(), audit::DecisionEvent{
                                      .timestamp       = clock_->Now(),
                                      .actor_hk        = request.actor_hk,
                                      .allowed         = result.decision.allowed && error.empty(),
                                      .reason          = result.decision.reason,
                                      .resource_domain = request.resource_domain,
                                      .action          = ToString(request.action),
                                      .risk_score      = result.assessment ? result.assessment->score : 0.0,
                                      .tier            = result.assessment ? std::optional(result.assessment->tier) : std::nullopt,
                                      .error           = error,
                                      .urgent          = false,
                                  });
}

AccessResult AccessController::Check(const AccessRequest& request) {
  auto result = Evaluate(request);
  Audit(request, result);
  return result;
}

AccessResult AccessController::Write(AccessRequest request, const identity::HashKey& hash_key, const std::string& payload) {
  request.action = Action::kWrite;

  auto result = Evaluate(request);
  if (result.decision && !records_->HasParent(hash_key)) {
    const auto message = records_->Satellite() + ": unknown record " + identity::ToHex(hash_key);
    Audit(request, result, message);
    throw util::NotFound(message);
  }
  if (result.decision) {
    auto usage = sessions_->Consume(request.token, 1, payload.size());
    if (!usage) {
      result.decision = Decision::Deny(*usage.denied);
    }
  }
  if (!result.decision) {
    Audit(request, result);
    return result;
  }

  try {
    result.version = records_->Put(hash_key, payload, "access:" + identity::ToHex(request.actor_hk));
  } catch (const std::exception& e) {
    Audit(request, result, e.what());
    throw;
  }
  Audit(request, result);
  return result;
}

AccessResult AccessController::Read(AccessRequest request, const identity::HashKey& hash_key) {
  request.action = Action::kRead;

  auto result = Evaluate(request);
  if (result.decision) {
    result.version = records_->Current(hash_key);
    auto usage     = sessions_->Consume(request.token, 1, result.version ? result.version->payload.size() : 0);
    if (!usage) {
      result.decision = Decision::Deny(*usage.denied);
      result.version.reset();
    }
  }
  Audit(request, result);
  return result;
}

} // namespace vault::access
