#pragma once

#include <codemem/interfaces.h>
#include <codemem/logging.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct redisContext;
struct redisReply;

namespace codemem {

inline constexpr const char kDefaultRedisUrl[] = "redis://127.0.0.1:6379/0";

struct RedisEndpoint {
  std::string host = "127.0.0.1";
  int port = 6379;
  int database = 0;
  std::optional<std::string> username;
  std::optional<std::string> password;
};

// Accepts `redis://[[user]:password@]host[:port][/db]`.
RedisEndpoint ParseRedisUrl(const std::string &url);

class RedisStoreClient : public StoreClient {
public:
  RedisStoreClient(RedisEndpoint endpoint, std::shared_ptr<Logger> logger,
                   std::chrono::milliseconds timeout =
                       std::chrono::milliseconds(2000));
  ~RedisStoreClient() override;

  RedisStoreClient(const RedisStoreClient &) = delete;
  RedisStoreClient &operator=(const RedisStoreClient &) = delete;

  std::optional<std::string> Get(const std::string &key) override;
  void Set(const std::string &key, const std::string &value) override;
  void SetAdd(const std::string &key, const std::string &member) override;
  void SetRemove(const std::string &key, const std::string &member) override;
  std::vector<std::string> SetMembers(const std::string &key) override;
  StoreValueType TypeOf(const std::string &key) override;
  bool Delete(const std::string &key) override;
  std::vector<std::string> ScanPrefix(const std::string &prefix) override;

private:
  struct ReplyDeleter {
    void operator()(redisReply *reply) const;
  };
  using Reply = std::unique_ptr<redisReply, ReplyDeleter>;

  void ConnectLocked();
  void DisconnectLocked();
  Reply CommandLocked(const std::vector<std::string> &arguments,
                      const std::string &key);
  Reply Command(const std::vector<std::string> &arguments,
                const std::string &key);

  RedisEndpoint endpoint_;
  std::shared_ptr<Logger> logger_;
  std::chrono::milliseconds timeout_;
  redisContext *context_ = nullptr;
  std::mutex mutex_;
};

} // namespace codemem
