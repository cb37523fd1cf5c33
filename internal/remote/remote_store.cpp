#include "internal/remote/remote_store.hpp"

#include <algorithm>
#include <charconv>

#include "internal/cache/cipher.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace syncore::remote {

using namespace syncore::v1;

namespace {

uint64_t ParseCursor(const std::string& cursor) {
  if (cursor.empty()) return 0;
  uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(cursor.data(), cursor.data() + cursor.size(), value);
  if (ec != std::errc() || ptr != cursor.data() + cursor.size()) {
    throw util::ValidationError("invalid pull cursor: " + cursor);
  }
  return value;
}

} // namespace

RemoteStore::RemoteStore(uint32_t schema_version) : schema_version_(schema_version) {
}

void RemoteStore::CheckSchema(uint32_t schema_version) const {
  if (schema_version != schema_version_) {
    throw util::FatalError("schema version " + std::to_string(schema_version) + " not supported (remote is " +
                           std::to_string(schema_version_) + ")");
  }
}

PullResponse RemoteStore::Pull(const PullRequest& request) const {
  CheckSchema(request.schema_version());

  std::lock_guard lock(mutex_);
  const uint64_t  from  = std::min<uint64_t>(ParseCursor(request.cursor()), log_.size());
  const uint64_t  limit = request.max_changes() == 0 ? log_.size() : request.max_changes();
  const uint64_t  to    = std::min<uint64_t>(from + limit, log_.size());

  PullResponse response;
  response.set_schema_version(schema_version_);
  for (uint64_t i = from; i < to; ++i) {
    *response.add_changes() = log_[i];
  }
  response.set_new_cursor(std::to_string(to));
  response.set_has_more(to < log_.size());
  return response;
}

PushResponse RemoteStore::Push(const PushRequest& request) {
  CheckSchema(request.schema_version());

  const auto& op = request.operation();
  if (op.id().empty()) {
    throw util::ValidationError("push: operation id is required");
  }

  std::lock_guard lock(mutex_);
  PushResponse    response;
  response.set_schema_version(schema_version_);

  if (auto it = applied_.find(op.id()); it != applied_.end()) {
    response.mutable_ack()->set_version(it->second);
    return response;
  }

  if (op.target_key().empty()) {
    applied_[op.id()] = 0;
    response.mutable_ack()->set_version(0);
    return response;
  }

  auto     current         = current_.find(op.target_key());
  uint64_t current_version = current == current_.end() ? 0 : current->second.version();
  if (op.base_version() != current_version) {
    auto* remote = response.mutable_conflict()->mutable_remote();
    if (current != current_.end()) {
      *remote = current->second;
    } else {
      remote->set_key(op.target_key());
      remote->set_deleted(true);
    }
    return response;
  }

  Change change;
  change.set_key(op.target_key());
  change.set_value(op.payload());
  change.set_origin_role(op.origin_role());
  change.set_kind(op.kind());
  change.set_requires_review(op.requires_review());
  auto stored = AppendLocked(std::move(change));

  applied_[op.id()] = stored.version();
  response.mutable_ack()->set_version(stored.version());
  return response;
}

Change RemoteStore::Write(Change change) {
  std::lock_guard lock(mutex_);
  return AppendLocked(std::move(change));
}

// caller holds mutex_
Change RemoteStore::AppendLocked(Change change) {
  auto     it      = current_.find(change.key());
  uint64_t version = it == current_.end() ? 1 : it->second.version() + 1;
  change.set_version(version);
  if (change.timestamp_ms() == 0) {
    change.set_timestamp_ms(util::ToUnixMillis(util::Now()));
  }
  change.set_checksum(change.deleted() ? std::string() : cache::Sha256Hex(change.value()));

  log_.push_back(change);
  current_[change.key()] = change;
  return change;
}

std::optional<Change> RemoteStore::Current(const std::string& key) const {
  std::lock_guard lock(mutex_);
  auto            it = current_.find(key);
  if (it == current_.end()) return std::nullopt;
  return it->second;
}

size_t RemoteStore::LogSize() const {
  std::lock_guard lock(mutex_);
  return log_.size();
}

} // namespace syncore::remote
