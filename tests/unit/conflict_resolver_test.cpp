#include "internal/conflict/conflict_resolver.hpp"

#include <cassert>
#include <iostream>
#include <optional>
#include <string>

#include "internal/cache/cipher.hpp"

namespace {

using syncore::conflict::ConflictResolver;
using syncore::conflict::ResolverRules;
using namespace syncore::v1;

constexpr uint64_t kDetectedAt = 1767607200000ull;

ResolverRules DefaultRules() {
  ResolverRules rules;
  rules.role_precedence = {{"head_teacher", 0}, {"subject_teacher", 1}, {"student", 3}};
  rules.max_clock_skew  = syncore::util::Millis(5 * 60 * 1000);
  return rules;
}

Conflict MakeConflict(const std::string& kind, const std::string& local_role, uint64_t local_ts, const std::string& remote_role,
                      uint64_t remote_ts) {
  Conflict conflict;
  conflict.set_id("c-1");
  conflict.set_operation_id("op-1");
  conflict.set_key("grade/42");
  conflict.set_kind(kind);
  conflict.set_detected_at_ms(kDetectedAt);

  auto* local = conflict.mutable_local();
  local->set_value("B+");
  local->set_version(3);
  local->set_timestamp_ms(local_ts);
  local->set_role(local_role);

  auto* remote = conflict.mutable_remote();
  remote->set_value("A-");
  remote->set_version(4);
  remote->set_timestamp_ms(remote_ts);
  remote->set_role(remote_role);
  remote->set_checksum(syncore::cache::Sha256Hex("A-"));
  return conflict;
}

void TestRolePrecedenceBeatsRecency() {
  ConflictResolver resolver(DefaultRules());

  // the student edit is newer, the teacher still wins
  auto conflict   = MakeConflict("grade", "subject_teacher", kDetectedAt - 60000, "student", kDetectedAt - 1000);
  auto resolution = resolver.Resolve(conflict);
  assert(resolution.rule() == CONFLICT_RULE_ROLE_PRECEDENCE);
  assert(resolution.kind() == RESOLUTION_KIND_KEEP_LOCAL);
  assert(resolution.value() == "B+");
  assert(resolution.conflict_id() == "c-1");

  auto flipped = resolver.Resolve(MakeConflict("grade", "student", kDetectedAt - 1000, "head_teacher", kDetectedAt - 60000));
  assert(flipped.rule() == CONFLICT_RULE_ROLE_PRECEDENCE);
  assert(flipped.kind() == RESOLUTION_KIND_KEEP_REMOTE);
  assert(flipped.value() == "A-");
}

void TestRecencyWhenRolesTie() {
  ConflictResolver resolver(DefaultRules());

  auto newer_local = resolver.Resolve(MakeConflict("note", "student", kDetectedAt - 1000, "student", kDetectedAt - 5000));
  assert(newer_local.rule() == CONFLICT_RULE_RECENCY);
  assert(newer_local.kind() == RESOLUTION_KIND_KEEP_LOCAL);

  auto unknown_role = resolver.Resolve(MakeConflict("note", "visitor", kDetectedAt - 5000, "student", kDetectedAt - 1000));
  assert(unknown_role.rule() == CONFLICT_RULE_RECENCY);
  assert(unknown_role.kind() == RESOLUTION_KIND_KEEP_REMOTE);

  auto tie = resolver.Resolve(MakeConflict("note", "student", kDetectedAt - 1000, "student", kDetectedAt - 1000));
  assert(tie.kind() == RESOLUTION_KIND_KEEP_REMOTE);
}

void TestClockSkewInvalidatesFutureTimestamps() {
  ConflictResolver resolver(DefaultRules());

  // remote claims to be ten minutes in the future
  auto skewed = resolver.Resolve(MakeConflict("note", "student", kDetectedAt - 1000, "student", kDetectedAt + 10 * 60000));
  assert(skewed.rule() == CONFLICT_RULE_RECENCY);
  assert(skewed.kind() == RESOLUTION_KIND_KEEP_LOCAL);

  // inside the tolerated skew it is simply newer
  auto tolerated = resolver.Resolve(MakeConflict("note", "student", kDetectedAt - 1000, "student", kDetectedAt + 60000));
  assert(tolerated.kind() == RESOLUTION_KIND_KEEP_REMOTE);

  auto both = resolver.Resolve(MakeConflict("note", "student", kDetectedAt + 20 * 60000, "student", kDetectedAt + 10 * 60000));
  assert(both.kind() == RESOLUTION_KIND_KEEP_REMOTE);
}

void TestProtectedKindNeedsVerifiedRemote() {
  auto rules = DefaultRules();
  rules.protected_kinds.insert("transcript");
  ConflictResolver resolver(rules);

  auto tampered = MakeConflict("transcript", "head_teacher", kDetectedAt - 1000, "student", kDetectedAt - 500);
  tampered.mutable_remote()->set_checksum(syncore::cache::Sha256Hex("something else"));
  auto manual = resolver.Resolve(tampered);
  assert(manual.rule() == CONFLICT_RULE_PROTECTED_FIELD);
  assert(manual.kind() == RESOLUTION_KIND_MANUAL_REQUIRED);
  assert(manual.value().empty());

  auto unsigned_remote = MakeConflict("transcript", "head_teacher", kDetectedAt - 1000, "student", kDetectedAt - 500);
  unsigned_remote.mutable_remote()->clear_checksum();
  assert(resolver.Resolve(unsigned_remote).rule() == CONFLICT_RULE_PROTECTED_FIELD);

  // verified values fall through to the remaining rules
  auto verified = resolver.Resolve(MakeConflict("transcript", "head_teacher", kDetectedAt - 1000, "student", kDetectedAt - 500));
  assert(verified.rule() == CONFLICT_RULE_ROLE_PRECEDENCE);
  assert(verified.kind() == RESOLUTION_KIND_KEEP_LOCAL);
}

void TestSensitiveContentRequiresReview() {
  auto rules = DefaultRules();
  rules.sensitive_kinds.insert("medical");
  ConflictResolver resolver(rules);

  auto medical = resolver.Resolve(MakeConflict("medical", "student", kDetectedAt - 1000, "student", kDetectedAt - 500));
  assert(medical.rule() == CONFLICT_RULE_CONTENT_SENSITIVITY);
  assert(medical.kind() == RESOLUTION_KIND_MANUAL_REQUIRED);

  auto flagged = MakeConflict("note", "student", kDetectedAt - 1000, "student", kDetectedAt - 500);
  flagged.mutable_local()->set_requires_review(true);
  assert(resolver.Resolve(flagged).kind() == RESOLUTION_KIND_MANUAL_REQUIRED);
}

void TestMergeFunction() {
  ConflictResolver resolver(DefaultRules());
  resolver.RegisterMerge("tags", [](const VersionedValue& local, const VersionedValue& remote) -> std::optional<std::string> {
    if (local.value() == remote.value()) return std::nullopt;
    return local.value() + "," + remote.value();
  });

  auto merged = resolver.Resolve(MakeConflict("tags", "student", kDetectedAt - 1000, "student", kDetectedAt - 500));
  assert(merged.rule() == CONFLICT_RULE_MERGE);
  assert(merged.kind() == RESOLUTION_KIND_MERGED);
  assert(merged.value() == "B+,A-");

  // declining defers to recency
  auto same = MakeConflict("tags", "student", kDetectedAt - 1000, "student", kDetectedAt - 500);
  same.mutable_local()->set_value("A-");
  assert(resolver.Resolve(same).rule() == CONFLICT_RULE_RECENCY);
}

void TestResolveIsPure() {
  ConflictResolver resolver(DefaultRules());
  const auto       conflict = MakeConflict("note", "student", kDetectedAt - 1000, "student", kDetectedAt - 500);
  const auto       before   = conflict.SerializeAsString();

  auto first  = resolver.Resolve(conflict);
  auto second = resolver.Resolve(conflict);
  assert(first.SerializeAsString() == second.SerializeAsString());
  assert(conflict.SerializeAsString() == before);
}

void TestNames() {
  assert(syncore::conflict::RuleName(CONFLICT_RULE_ROLE_PRECEDENCE) == "role_precedence");
  assert(syncore::conflict::ResolutionName(RESOLUTION_KIND_MANUAL_REQUIRED) == "manual_required");
}

} // namespace

int main() {
  TestRolePrecedenceBeatsRecency();
  TestRecencyWhenRolesTie();
  TestClockSkewInvalidatesFutureTimestamps();
  TestProtectedKindNeedsVerifiedRemote();
  TestSensitiveContentRequiresReview();
  TestMergeFunction();
  TestResolveIsPure();
  TestNames();

  std::cout << "conflict_resolver_test: pass\n";
  return 0;
}
