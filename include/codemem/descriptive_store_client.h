#pragma once

#include <codemem/interfaces.h>
#include <codemem/logging.h>

#include <iosfwd>
#include <memory>
#include <mutex>

namespace codemem {

// Reports mutations as JSON lines instead of performing them. Reads are
// answered by the wrapped client so planning sees the real store state.
class DescriptiveStoreClient : public StoreClient {
public:
  DescriptiveStoreClient(std::shared_ptr<StoreClient> inner,
                         std::ostream &output,
                         std::shared_ptr<Logger> logger = nullptr);

  std::optional<std::string> Get(const std::string &key) override;
  void Set(const std::string &key, const std::string &value) override;
  void SetAdd(const std::string &key, const std::string &member) override;
  void SetRemove(const std::string &key, const std::string &member) override;
  std::vector<std::string> SetMembers(const std::string &key) override;
  StoreValueType TypeOf(const std::string &key) override;
  bool Delete(const std::string &key) override;
  std::vector<std::string> ScanPrefix(const std::string &prefix) override;

  std::size_t MutationCount() const;

private:
  void Emit(const std::string &operation, const std::string &key,
            const std::string *value);

  std::shared_ptr<StoreClient> inner_;
  std::ostream *output_;
  std::shared_ptr<Logger> logger_;
  std::size_t mutations_ = 0;
  mutable std::mutex mutex_;
};

} // namespace codemem
