#pragma once

#include <codemem/interfaces.h>

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <variant>

namespace codemem {

// Process-local store with the same type rules as the Redis backend. Backs
// the `memory` store id and the tests.
class InMemoryStoreClient : public StoreClient {
public:
  std::optional<std::string> Get(const std::string &key) override;
  void Set(const std::string &key, const std::string &value) override;
  void SetAdd(const std::string &key, const std::string &member) override;
  void SetRemove(const std::string &key, const std::string &member) override;
  std::vector<std::string> SetMembers(const std::string &key) override;
  StoreValueType TypeOf(const std::string &key) override;
  bool Delete(const std::string &key) override;
  std::vector<std::string> ScanPrefix(const std::string &prefix) override;

  std::size_t Size() const;

private:
  using Value = std::variant<std::string, std::set<std::string>>;

  std::map<std::string, Value> values_;
  mutable std::mutex mutex_;
};

} // namespace codemem
