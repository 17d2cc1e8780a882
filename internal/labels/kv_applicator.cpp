#include "kv_applicator.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/kv/errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "orchestrator/v1/types.pb.h"

namespace orchestrator::labels {

namespace {

Labels Decode(const std::string& key, const std::string& json) {
  orchestrator::v1::LabelSet set;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, &set, options);
  if (!status.ok()) {
    throw std::runtime_error("corrupt label document at " + key + ": " + std::string(status.message()));
  }
  return Labels(set.labels().begin(), set.labels().end());
}

std::string Encode(const Labels& labels) {
  orchestrator::v1::LabelSet set;
  for (const auto& [key, value] : labels) {
    (*set.mutable_labels())[key] = value;
  }

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(set, &json);
  if (!status.ok()) {
    throw std::runtime_error("encode label document: " + std::string(status.message()));
  }
  return json;
}

bool Retryable(kv::ErrorCode code) {
  return code == kv::ErrorCode::Conflict || code == kv::ErrorCode::Unavailable;
}

} // namespace

KvApplicator::KvApplicator(std::shared_ptr<kv::Store> store, int retries) : store_(std::move(store)), retries_(retries < 1 ? 1 : retries) {
}

std::string KvApplicator::TypePrefix(EntityType type) {
  return std::string("labels/") + EntityTypeName(type) + "/";
}

std::string KvApplicator::EntityKey(EntityType type, const std::string& id) {
  if (id.empty()) {
    throw util::InvalidArgument(std::string("empty ") + EntityTypeName(type) + " id");
  }
  return TypePrefix(type) + id;
}

void KvApplicator::Mutate(EntityType type, const std::string& id, const std::function<bool(Labels&)>& fn) {
  const auto key = EntityKey(type, id);

  kv::Result last;
  for (int attempt = 1; attempt <= retries_; ++attempt) {
    std::optional<kv::KVPair> current;
    try {
      current = store_->Get(key);
    } catch (const util::StoreUnavailable& e) {
      if (attempt == retries_) throw;
      last = kv::Result::Err(kv::ErrorCode::Unavailable, e.what());
      continue;
    }

    Labels labels = current ? Decode(key, current->value) : Labels{};
    if (!fn(labels)) return;

    if (labels.empty()) {
      if (!current) return;
      last = store_->DeleteCheckAndSet(key, current->modify_index);
    } else {
      kv::KVPair pair;
      pair.key          = key;
      pair.value        = Encode(labels);
      pair.modify_index = current ? current->modify_index : 0;
      last              = store_->CheckAndSet(pair);
    }

    if (last || !Retryable(last.code)) break;

    ORCHESTRATOR_LOG_DEBUG("label write retry", {observability::StringField("key", key), observability::IntField("attempt", attempt),
                                                 observability::StringField("error", last.message)});
  }

  kv::ThrowIfError(last, "update labels of " + key);
}

void KvApplicator::SetLabels(EntityType type, const std::string& id, const Labels& labels) {
  Mutate(type, id, [&](Labels& existing) {
    bool changed = false;
    for (const auto& [key, value] : labels) {
      auto it = existing.find(key);
      if (it != existing.end() && it->second == value) continue;
      existing[key] = value;
      changed       = true;
    }
    return changed;
  });
}

Labels KvApplicator::GetLabels(EntityType type, const std::string& id) {
  const auto key  = EntityKey(type, id);
  const auto pair = store_->Get(key);
  if (!pair) return {};
  return Decode(key, pair->value);
}

void KvApplicator::RemoveLabels(EntityType type, const std::string& id, const std::vector<std::string>& keys) {
  Mutate(type, id, [&](Labels& existing) {
    bool changed = false;
    for (const auto& key : keys) {
      changed |= existing.erase(key) > 0;
    }
    return changed;
  });
}

void KvApplicator::RemoveAllLabels(EntityType type, const std::string& id) {
  Mutate(type, id, [](Labels& existing) {
    if (existing.empty()) return false;
    existing.clear();
    return true;
  });
}

std::vector<Labeled> KvApplicator::GetMatches(const Selector& selector, EntityType type) {
  const auto prefix = TypePrefix(type);

  std::vector<Labeled> matches;
  for (const auto& pair : store_->List(prefix)) {
    auto labels = Decode(pair.key, pair.value);
    if (!selector.Matches(labels)) continue;
    matches.push_back({type, pair.key.substr(prefix.size()), std::move(labels)});
  }
  return matches;
}

uint64_t KvApplicator::WaitForChange(EntityType type, uint64_t after, std::chrono::milliseconds timeout) {
  return store_->WaitIndex(TypePrefix(type), after, timeout);
}

} // namespace orchestrator::labels
