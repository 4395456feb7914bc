#include <codemem/descriptive_store_client.h>

#include <codemem/entity_codec.h>

#include <nlohmann/json.hpp>

#include <ostream>
#include <stdexcept>
#include <utility>

namespace codemem {

DescriptiveStoreClient::DescriptiveStoreClient(
    std::shared_ptr<StoreClient> inner, std::ostream &output,
    std::shared_ptr<Logger> logger)
    : inner_(std::move(inner)), output_(&output),
      logger_(EnsureLogger(std::move(logger))) {
  if (!inner_) {
    throw std::invalid_argument(
        "DescriptiveStoreClient requires a store to read from");
  }
}

void DescriptiveStoreClient::Emit(const std::string &operation,
                                  const std::string &key,
                                  const std::string *value) {
  nlohmann::json line = {{"op", operation}, {"key", key}};
  if (value != nullptr) {
    line["value"] = *value;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    (*output_) << DumpJson(line) << "\n";
    ++mutations_;
  }
  logger_->Log(LogLevel::kDebug, "store.mutation_described",
               {{"op", operation}, {"key", key}});
}

std::optional<std::string> DescriptiveStoreClient::Get(const std::string &key) {
  return inner_->Get(key);
}

void DescriptiveStoreClient::Set(const std::string &key,
                                 const std::string &value) {
  Emit("set", key, &value);
}

void DescriptiveStoreClient::SetAdd(const std::string &key,
                                    const std::string &member) {
  Emit("sadd", key, &member);
}

void DescriptiveStoreClient::SetRemove(const std::string &key,
                                       const std::string &member) {
  Emit("srem", key, &member);
}

std::vector<std::string>
DescriptiveStoreClient::SetMembers(const std::string &key) {
  return inner_->SetMembers(key);
}

StoreValueType DescriptiveStoreClient::TypeOf(const std::string &key) {
  return inner_->TypeOf(key);
}

bool DescriptiveStoreClient::Delete(const std::string &key) {
  Emit("del", key, nullptr);
  return inner_->TypeOf(key) != StoreValueType::kNone;
}

std::vector<std::string>
DescriptiveStoreClient::ScanPrefix(const std::string &prefix) {
  return inner_->ScanPrefix(prefix);
}

std::size_t DescriptiveStoreClient::MutationCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return mutations_;
}

} // namespace codemem
