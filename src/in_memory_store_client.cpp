#include <codemem/in_memory_store_client.h>

#include <codemem/errors.h>

namespace codemem {

namespace {
constexpr const char kWrongType[] =
    "operation against a key holding the wrong kind of value";
}

std::optional<std::string> InMemoryStoreClient::Get(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto found = values_.find(key);
  if (found == values_.end()) {
    return std::nullopt;
  }
  if (const auto *text = std::get_if<std::string>(&found->second)) {
    return *text;
  }
  throw StoreOperationError(key, kWrongType);
}

void InMemoryStoreClient::Set(const std::string &key,
                              const std::string &value) {
  std::lock_guard<std::mutex> lock(mutex_);
  values_[key] = value;
}

void InMemoryStoreClient::SetAdd(const std::string &key,
                                 const std::string &member) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto position =
      values_.try_emplace(key, std::set<std::string>{}).first;
  auto *members = std::get_if<std::set<std::string>>(&position->second);
  if (members == nullptr) {
    throw StoreOperationError(key, kWrongType);
  }
  members->insert(member);
}

void InMemoryStoreClient::SetRemove(const std::string &key,
                                    const std::string &member) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto found = values_.find(key);
  if (found == values_.end()) {
    return;
  }
  auto *members = std::get_if<std::set<std::string>>(&found->second);
  if (members == nullptr) {
    throw StoreOperationError(key, kWrongType);
  }
  members->erase(member);
  if (members->empty()) {
    values_.erase(found);
  }
}

std::vector<std::string>
InMemoryStoreClient::SetMembers(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto found = values_.find(key);
  if (found == values_.end()) {
    return {};
  }
  const auto *members = std::get_if<std::set<std::string>>(&found->second);
  if (members == nullptr) {
    throw StoreOperationError(key, kWrongType);
  }
  return {members->begin(), members->end()};
}

StoreValueType InMemoryStoreClient::TypeOf(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto found = values_.find(key);
  if (found == values_.end()) {
    return StoreValueType::kNone;
  }
  return std::holds_alternative<std::string>(found->second)
             ? StoreValueType::kString
             : StoreValueType::kSet;
}

bool InMemoryStoreClient::Delete(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  return values_.erase(key) > 0;
}

std::vector<std::string>
InMemoryStoreClient::ScanPrefix(const std::string &prefix) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> keys;
  for (auto it = values_.lower_bound(prefix);
       it != values_.end() && it->first.compare(0, prefix.size(), prefix) == 0;
       ++it) {
    keys.push_back(it->first);
  }
  return keys;
}

std::size_t InMemoryStoreClient::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return values_.size();
}

} // namespace codemem
