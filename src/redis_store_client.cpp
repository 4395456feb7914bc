#include <codemem/redis_store_client.h>

#include <codemem/errors.h>

#include <hiredis/hiredis.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace codemem {

namespace {
constexpr const char kScheme[] = "redis://";
constexpr const char kScanBatch[] = "500";

int ParsePositiveInteger(const std::string &text, const std::string &what,
                         const std::string &url) {
  try {
    std::size_t consumed = 0;
    const auto value = std::stoi(text, &consumed);
    if (consumed != text.size() || value < 0) {
      throw std::invalid_argument(text);
    }
    return value;
  } catch (const std::logic_error &) {
    throw ConfigurationError("Invalid " + what + " in redis url: " + url);
  }
}

std::string EscapeGlob(const std::string &prefix) {
  std::string escaped;
  for (const auto character : prefix) {
    if (character == '*' || character == '?' || character == '[' ||
        character == ']' || character == '\\') {
      escaped.push_back('\\');
    }
    escaped.push_back(character);
  }
  return escaped;
}

std::string ReplyText(const redisReply *reply) {
  if (reply == nullptr || reply->str == nullptr) {
    return {};
  }
  return std::string(reply->str, reply->len);
}
} // namespace

RedisEndpoint ParseRedisUrl(const std::string &url) {
  if (url.rfind(kScheme, 0) != 0) {
    throw ConfigurationError("Unsupported redis url (expected redis://): " +
                             url);
  }

  RedisEndpoint endpoint;
  auto remainder = url.substr(std::string(kScheme).size());

  if (const auto slash = remainder.find('/'); slash != std::string::npos) {
    const auto database = remainder.substr(slash + 1);
    if (!database.empty()) {
      endpoint.database = ParsePositiveInteger(database, "database", url);
    }
    remainder.erase(slash);
  }

  if (const auto at = remainder.rfind('@'); at != std::string::npos) {
    const auto credentials = remainder.substr(0, at);
    remainder.erase(0, at + 1);
    const auto colon = credentials.find(':');
    if (colon == std::string::npos) {
      endpoint.password = credentials;
    } else {
      if (colon > 0) {
        endpoint.username = credentials.substr(0, colon);
      }
      endpoint.password = credentials.substr(colon + 1);
    }
  }

  std::string host = remainder;
  std::string port;
  if (!remainder.empty() && remainder.front() == '[') {
    const auto close = remainder.find(']');
    if (close == std::string::npos) {
      throw ConfigurationError("Invalid host in redis url: " + url);
    }
    host = remainder.substr(1, close - 1);
    if (close + 1 < remainder.size() && remainder[close + 1] == ':') {
      port = remainder.substr(close + 2);
    }
  } else if (const auto colon = remainder.rfind(':');
             colon != std::string::npos) {
    host = remainder.substr(0, colon);
    port = remainder.substr(colon + 1);
  }

  if (!host.empty()) {
    endpoint.host = host;
  }
  if (!port.empty()) {
    endpoint.port = ParsePositiveInteger(port, "port", url);
  }
  return endpoint;
}

void RedisStoreClient::ReplyDeleter::operator()(redisReply *reply) const {
  if (reply != nullptr) {
    freeReplyObject(reply);
  }
}

RedisStoreClient::RedisStoreClient(RedisEndpoint endpoint,
                                   std::shared_ptr<Logger> logger,
                                   std::chrono::milliseconds timeout)
    : endpoint_(std::move(endpoint)), logger_(EnsureLogger(std::move(logger))),
      timeout_(timeout) {
  std::lock_guard<std::mutex> lock(mutex_);
  ConnectLocked();
}

RedisStoreClient::~RedisStoreClient() { DisconnectLocked(); }

void RedisStoreClient::ConnectLocked() {
  timeval timeout{};
  timeout.tv_sec =
      static_cast<decltype(timeout.tv_sec)>(timeout_.count() / 1000);
  timeout.tv_usec = static_cast<decltype(timeout.tv_usec)>(
      (timeout_.count() % 1000) * 1000);

  const auto address = endpoint_.host + ":" + std::to_string(endpoint_.port);
  context_ = redisConnectWithTimeout(endpoint_.host.c_str(), endpoint_.port,
                                     timeout);
  if (context_ == nullptr || context_->err != 0) {
    const std::string reason =
        context_ != nullptr ? context_->errstr : "cannot allocate context";
    DisconnectLocked();
    throw StoreConnectionError(address + ": " + reason);
  }
  redisSetTimeout(context_, timeout);

  try {
    if (endpoint_.password) {
      std::vector<std::string> auth = {"AUTH"};
      if (endpoint_.username) {
        auth.push_back(*endpoint_.username);
      }
      auth.push_back(*endpoint_.password);
      CommandLocked(auth, "AUTH");
    }
    if (endpoint_.database != 0) {
      CommandLocked({"SELECT", std::to_string(endpoint_.database)}, "SELECT");
    }
  } catch (const StoreOperationError &ex) {
    DisconnectLocked();
    throw StoreConnectionError(address + ": " + ex.what());
  }

  logger_->Log(LogLevel::kInfo, "store.connected",
               {{"address", address},
                {"database", std::to_string(endpoint_.database)}});
}

void RedisStoreClient::DisconnectLocked() {
  if (context_ != nullptr) {
    redisFree(context_);
    context_ = nullptr;
  }
}

RedisStoreClient::Reply
RedisStoreClient::CommandLocked(const std::vector<std::string> &arguments,
                                const std::string &key) {
  if (context_ == nullptr) {
    ConnectLocked();
  }

  std::vector<const char *> argv;
  std::vector<std::size_t> lengths;
  argv.reserve(arguments.size());
  lengths.reserve(arguments.size());
  for (const auto &argument : arguments) {
    argv.push_back(argument.data());
    lengths.push_back(argument.size());
  }

  auto *raw = static_cast<redisReply *>(redisCommandArgv(
      context_, static_cast<int>(argv.size()), argv.data(), lengths.data()));
  if (raw == nullptr) {
    const std::string reason = context_->errstr;
    DisconnectLocked();
    throw StoreConnectionError(reason);
  }

  Reply reply(raw);
  if (reply->type == REDIS_REPLY_ERROR) {
    throw StoreOperationError(key, ReplyText(reply.get()));
  }
  return reply;
}

RedisStoreClient::Reply
RedisStoreClient::Command(const std::vector<std::string> &arguments,
                          const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  return CommandLocked(arguments, key);
}

std::optional<std::string> RedisStoreClient::Get(const std::string &key) {
  const auto reply = Command({"GET", key}, key);
  if (reply->type == REDIS_REPLY_NIL) {
    return std::nullopt;
  }
  if (reply->type != REDIS_REPLY_STRING) {
    throw StoreOperationError(key, "unexpected reply to GET");
  }
  return ReplyText(reply.get());
}

void RedisStoreClient::Set(const std::string &key, const std::string &value) {
  Command({"SET", key, value}, key);
}

void RedisStoreClient::SetAdd(const std::string &key,
                              const std::string &member) {
  Command({"SADD", key, member}, key);
}

void RedisStoreClient::SetRemove(const std::string &key,
                                 const std::string &member) {
  Command({"SREM", key, member}, key);
}

std::vector<std::string>
RedisStoreClient::SetMembers(const std::string &key) {
  const auto reply = Command({"SMEMBERS", key}, key);
  std::vector<std::string> members;
  if (reply->type != REDIS_REPLY_ARRAY) {
    throw StoreOperationError(key, "unexpected reply to SMEMBERS");
  }
  members.reserve(reply->elements);
  for (std::size_t i = 0; i < reply->elements; ++i) {
    members.push_back(ReplyText(reply->element[i]));
  }
  std::sort(members.begin(), members.end());
  return members;
}

StoreValueType RedisStoreClient::TypeOf(const std::string &key) {
  const auto reply = Command({"TYPE", key}, key);
  const auto type = ReplyText(reply.get());
  if (type == "none") {
    return StoreValueType::kNone;
  }
  if (type == "string") {
    return StoreValueType::kString;
  }
  if (type == "set") {
    return StoreValueType::kSet;
  }
  return StoreValueType::kOther;
}

bool RedisStoreClient::Delete(const std::string &key) {
  const auto reply = Command({"DEL", key}, key);
  return reply->type == REDIS_REPLY_INTEGER && reply->integer > 0;
}

std::vector<std::string>
RedisStoreClient::ScanPrefix(const std::string &prefix) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto pattern = EscapeGlob(prefix) + "*";
  std::vector<std::string> keys;
  std::string cursor = "0";
  do {
    const auto reply = CommandLocked(
        {"SCAN", cursor, "MATCH", pattern, "COUNT", kScanBatch}, prefix);
    if (reply->type != REDIS_REPLY_ARRAY || reply->elements != 2) {
      throw StoreOperationError(prefix, "unexpected reply to SCAN");
    }
    cursor = ReplyText(reply->element[0]);
    const auto *batch = reply->element[1];
    for (std::size_t i = 0; i < batch->elements; ++i) {
      keys.push_back(ReplyText(batch->element[i]));
    }
  } while (cursor != "0");

  std::sort(keys.begin(), keys.end());
  keys.erase(std::unique(keys.begin(), keys.end()), keys.end());
  return keys;
}

} // namespace codemem
