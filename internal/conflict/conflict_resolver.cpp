#include "internal/conflict/conflict_resolver.hpp"

#include "internal/cache/cipher.hpp"

namespace syncore::conflict {

using namespace syncore::v1;

namespace {

Resolution Make(const Conflict& conflict, ConflictRule rule, ResolutionKind kind, std::string value, std::string reason) {
  Resolution resolution;
  resolution.set_conflict_id(conflict.id());
  resolution.set_rule(rule);
  resolution.set_kind(kind);
  resolution.set_value(std::move(value));
  resolution.set_reason(std::move(reason));
  return resolution;
}

Resolution KeepLocal(const Conflict& conflict, ConflictRule rule, std::string reason) {
  return Make(conflict, rule, RESOLUTION_KIND_KEEP_LOCAL, conflict.local().value(), std::move(reason));
}

Resolution KeepRemote(const Conflict& conflict, ConflictRule rule, std::string reason) {
  return Make(conflict, rule, RESOLUTION_KIND_KEEP_REMOTE, conflict.remote().value(), std::move(reason));
}

Resolution Manual(const Conflict& conflict, ConflictRule rule, std::string reason) {
  return Make(conflict, rule, RESOLUTION_KIND_MANUAL_REQUIRED, {}, std::move(reason));
}

} // namespace

ResolverRules ResolverRules::FromConfig(const syncore::runtime::config::ResolverConfig& config) {
  ResolverRules rules;
  rules.protected_kinds.insert(config.protected_kinds().begin(), config.protected_kinds().end());
  rules.sensitive_kinds.insert(config.sensitive_kinds().begin(), config.sensitive_kinds().end());
  for (const auto& [role, rank] : config.role_precedence()) {
    rules.role_precedence[role] = rank;
  }
  rules.max_clock_skew = util::FromProto(config.max_clock_skew(), rules.max_clock_skew);
  return rules;
}

std::string_view RuleName(ConflictRule rule) {
  switch (rule) {
    case CONFLICT_RULE_PROTECTED_FIELD:
      return "protected_field";
    case CONFLICT_RULE_ROLE_PRECEDENCE:
      return "role_precedence";
    case CONFLICT_RULE_CONTENT_SENSITIVITY:
      return "content_sensitivity";
    case CONFLICT_RULE_MERGE:
      return "merge";
    case CONFLICT_RULE_RECENCY:
      return "recency";
    case CONFLICT_RULE_MANUAL:
      return "manual";
    default:
      return "unspecified";
  }
}

std::string_view ResolutionName(ResolutionKind kind) {
  switch (kind) {
    case RESOLUTION_KIND_KEEP_LOCAL:
      return "keep_local";
    case RESOLUTION_KIND_KEEP_REMOTE:
      return "keep_remote";
    case RESOLUTION_KIND_MERGED:
      return "merged";
    case RESOLUTION_KIND_MANUAL_REQUIRED:
      return "manual_required";
    default:
      return "unspecified";
  }
}

ConflictResolver::ConflictResolver(ResolverRules rules) : rules_(std::move(rules)) {
}

void ConflictResolver::RegisterMerge(const std::string& kind, MergeFunction merge) {
  merges_[kind] = std::move(merge);
}

Resolution ConflictResolver::Resolve(const Conflict& conflict) const {
  if (auto resolution = ProtectedField(conflict)) return *resolution;
  if (auto resolution = RolePrecedence(conflict)) return *resolution;
  if (auto resolution = Sensitivity(conflict)) return *resolution;
  if (auto resolution = Merge(conflict)) return *resolution;
  return Recency(conflict);
}

// ------------------------------------------------------------
// Rules
// ------------------------------------------------------------

std::optional<Resolution> ConflictResolver::ProtectedField(const Conflict& conflict) const {
  if (!rules_.protected_kinds.contains(conflict.kind())) {
    return std::nullopt;
  }
  const auto& remote = conflict.remote();
  if (remote.checksum().empty()) {
    return Manual(conflict, CONFLICT_RULE_PROTECTED_FIELD, "protected kind " + conflict.kind() + ": remote value carries no checksum");
  }
  if (cache::Sha256Hex(remote.value()) != remote.checksum()) {
    return Manual(conflict, CONFLICT_RULE_PROTECTED_FIELD, "protected kind " + conflict.kind() + ": remote checksum mismatch");
  }
  // verified; later rules may override automatically
  return std::nullopt;
}

std::optional<Resolution> ConflictResolver::RolePrecedence(const Conflict& conflict) const {
  auto local_rank  = rules_.role_precedence.find(conflict.local().role());
  auto remote_rank = rules_.role_precedence.find(conflict.remote().role());
  if (local_rank == rules_.role_precedence.end() || remote_rank == rules_.role_precedence.end()) {
    return std::nullopt;
  }
  if (local_rank->second == remote_rank->second) {
    return std::nullopt;
  }
  if (local_rank->second < remote_rank->second) {
    return KeepLocal(conflict, CONFLICT_RULE_ROLE_PRECEDENCE, "role " + conflict.local().role() + " outranks " + conflict.remote().role());
  }
  return KeepRemote(conflict, CONFLICT_RULE_ROLE_PRECEDENCE, "role " + conflict.remote().role() + " outranks " + conflict.local().role());
}

std::optional<Resolution> ConflictResolver::Sensitivity(const Conflict& conflict) const {
  if (rules_.sensitive_kinds.contains(conflict.kind())) {
    return Manual(conflict, CONFLICT_RULE_CONTENT_SENSITIVITY, "kind " + conflict.kind() + " requires review");
  }
  if (conflict.local().requires_review() || conflict.remote().requires_review()) {
    return Manual(conflict, CONFLICT_RULE_CONTENT_SENSITIVITY, "change flagged for review");
  }
  return std::nullopt;
}

std::optional<Resolution> ConflictResolver::Merge(const Conflict& conflict) const {
  auto it = merges_.find(conflict.kind());
  if (it == merges_.end()) {
    return std::nullopt;
  }
  auto merged = it->second(conflict.local(), conflict.remote());
  if (!merged) {
    return std::nullopt;
  }
  return Make(conflict, CONFLICT_RULE_MERGE, RESOLUTION_KIND_MERGED, std::move(*merged), "merged by " + conflict.kind() + " merge function");
}

Resolution ConflictResolver::Recency(const Conflict& conflict) const {
  const uint64_t horizon      = conflict.detected_at_ms() + static_cast<uint64_t>(rules_.max_clock_skew.count());
  const uint64_t local_ts     = conflict.local().timestamp_ms();
  const uint64_t remote_ts    = conflict.remote().timestamp_ms();
  const bool     local_valid  = local_ts <= horizon;
  const bool     remote_valid = remote_ts <= horizon;

  if (local_valid && !remote_valid) {
    return KeepLocal(conflict, CONFLICT_RULE_RECENCY, "remote timestamp beyond clock skew");
  }
  if (!local_valid && remote_valid) {
    return KeepRemote(conflict, CONFLICT_RULE_RECENCY, "local timestamp beyond clock skew");
  }
  if (!local_valid) {
    return KeepRemote(conflict, CONFLICT_RULE_RECENCY, "both timestamps beyond clock skew");
  }
  if (local_ts > remote_ts) {
    return KeepLocal(conflict, CONFLICT_RULE_RECENCY, "local change is newer");
  }
  if (remote_ts > local_ts) {
    return KeepRemote(conflict, CONFLICT_RULE_RECENCY, "remote change is newer");
  }
  return KeepRemote(conflict, CONFLICT_RULE_RECENCY, "equal timestamps");
}

} // namespace syncore::conflict
