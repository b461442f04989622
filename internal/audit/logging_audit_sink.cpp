#include "internal/audit/audit_sink.hpp"

#include "internal/observability/logging.hpp"

namespace vault::audit {

using observability::BoolField;
using observability::DoubleField;
using observability::KeyField;
using observability::StringField;
using observability::TimeField;

std::string VersionId(const identity::HashKey& hash_key, util::TimePoint effective_from) {
  return identity::ToHex(hash_key) + "@" + std::to_string(util::ToUnixMicros(effective_from));
}

void LoggingAuditSink::RecordDecision(const DecisionEvent& event) {
  VAULT_LOG_AUDIT("audit decision", {TimeField("ts", event.timestamp), KeyField("actor", event.actor_hk),
                                    BoolField("allowed", event.allowed),
                                    StringField("reason", event.reason ? access::ToString(*event.reason) : "-"),
                                    StringField("domain", event.resource_domain), StringField("action", event.action),
                                    DoubleField("risk_score", event.risk_score),
                                    StringField("tier", event.tier ? risk::ToString(*event.tier) : "-"), BoolField("urgent", event.urgent),
                                    StringField("error", event.error.empty() ? "-" : event.error)});
}

void LoggingAuditSink::RecordMutation(const MutationEvent& event) {
  VAULT_LOG_AUDIT("audit mutation", {TimeField("ts", event.timestamp), StringField("family", event.record_family),
                                    StringField("version", event.version_id), StringField("source", event.record_source)});
}

void SafeRecord(AuditSink* sink, const DecisionEvent& event) noexcept {
  if (!sink) return;
  try {
    sink->RecordDecision(event);
  } catch (const std::exception& e) {
    VAULT_LOG_ERROR("audit delivery failed", {StringField("kind", "decision"), StringField("error", e.what())});
  }
}

void SafeRecord(AuditSink* sink, const MutationEvent& event) noexcept {
  if (!sink) return;
  try {
    sink->RecordMutation(event);
  } catch (const std::exception& e) {
    VAULT_LOG_ERROR("audit delivery failed", {StringField("kind", "mutation"), StringField("version", event.version_id),
                                              StringField("error", e.what())});
  }
}

} // namespace vault::audit
