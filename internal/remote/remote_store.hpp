#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "syncore/v1/remote_service.pb.h"

namespace syncore::remote {

/*
  In-memory versioned change store.

  Backs the reference remote server and the loopback endpoint. Every accepted
  write appends to a change log; the pull cursor is the decimal position in
  that log. A push conflicts when its base_version is not the key's current
  version. Pushes are idempotent per operation id.
*/
class RemoteStore {
 public:
  explicit RemoteStore(uint32_t schema_version = 1);

  syncore::v1::PullResponse Pull(const syncore::v1::PullRequest& request) const;
  syncore::v1::PushResponse Push(const syncore::v1::PushRequest& request);

  // A write made by another device. Assigns the next version of the key.
  syncore::v1::Change Write(syncore::v1::Change change);

  std::optional<syncore::v1::Change> Current(const std::string& key) const;
  size_t                             LogSize() const;
  uint32_t                           SchemaVersion() const {
    return schema_version_;
  }

 private:
  syncore::v1::Change AppendLocked(syncore::v1::Change change);
  void                CheckSchema(uint32_t schema_version) const;

  uint32_t schema_version_;

  mutable std::mutex                                   mutex_;
  std::vector<syncore::v1::Change>                     log_;
  std::unordered_map<std::string, syncore::v1::Change> current_;
  std::unordered_map<std::string, uint64_t>            applied_;
};

} // namespace syncore::remote
