#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

#include "config/config.pb.h"
#include "internal/util/time.hpp"
#include "syncore/v1/conflict.pb.h"

namespace syncore::conflict {

// Returns the merged value, or nullopt to defer to the next rule.
using MergeFunction =
    std::function<std::optional<std::string>(const syncore::v1::VersionedValue& local, const syncore::v1::VersionedValue& remote)>;

struct ResolverRules {
  std::unordered_set<std::string>           protected_kinds;
  std::unordered_set<std::string>           sensitive_kinds;
  // lower rank = more authoritative
  std::unordered_map<std::string, uint32_t> role_precedence;
  util::Millis                              max_clock_skew{5 * 60 * 1000};

  static ResolverRules FromConfig(const syncore::runtime::config::ResolverConfig& config);
};

std::string_view RuleName(syncore::v1::ConflictRule rule);
std::string_view ResolutionName(syncore::v1::ResolutionKind kind);

/*
  Deterministic conflict adjudication.

  Rules, first match wins:
    1. protected field  - remote value must carry a matching checksum,
                          otherwise manual resolution is required
    2. role precedence  - the more authoritative role wins outright
    3. sensitivity      - flagged content is never auto-resolved
    4. merge            - a merge function registered for the kind
    5. recency          - later validated timestamp wins, ties keep remote

  Resolve() performs no I/O and reads no clock: the conflict's detection time
  is the reference for timestamp validation. Audit records are written by the
  caller.
*/
class ConflictResolver {
 public:
  explicit ConflictResolver(ResolverRules rules);

  void RegisterMerge(const std::string& kind, MergeFunction merge);

  syncore::v1::Resolution Resolve(const syncore::v1::Conflict& conflict) const;

  const ResolverRules& Rules() const {
    return rules_;
  }

 private:
  std::optional<syncore::v1::Resolution> ProtectedField(const syncore::v1::Conflict& conflict) const;
  std::optional<syncore::v1::Resolution> RolePrecedence(const syncore::v1::Conflict& conflict) const;
  std::optional<syncore::v1::Resolution> Sensitivity(const syncore::v1::Conflict& conflict) const;
  std::optional<syncore::v1::Resolution> Merge(const syncore::v1::Conflict& conflict) const;
  syncore::v1::Resolution                Recency(const syncore::v1::Conflict& conflict) const;

  ResolverRules                                  rules_;
  std::unordered_map<std::string, MergeFunction> merges_;
};

} // namespace syncore::conflict
