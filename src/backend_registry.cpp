#include <codemem/backend_registry.h>

#include <codemem/errors.h>
#include <codemem/hashing_embedder.h>
#include <codemem/in_memory_store_client.h>
#include <codemem/redis_store_client.h>
#include <codemem/remote_embedders.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace {

constexpr const char kRedisStore[] = "redis";
constexpr const char kMemoryStore[] = "memory";
constexpr const char kOpenAiProvider[] = "openai";
constexpr const char kHuggingFaceProvider[] = "huggingface";
constexpr const char kHashingProvider[] = "hashing";

const codemem::CredentialSource &
CredentialsFrom(const codemem::BackendSettings &settings) {
  static const codemem::EnvironmentCredentialSource environment;
  return settings.credentials ? *settings.credentials : environment;
}

codemem::RemoteEmbedderOptions
RemoteOptionsFrom(const codemem::BackendSettings &settings) {
  codemem::RemoteEmbedderOptions options;
  options.model = settings.model;
  return options;
}

} // namespace

namespace codemem {

template <typename Factory>
std::vector<std::string>
BackendRegistry::RegisteredNames(const BackendSet<Factory> &set) {
  std::vector<std::string> names;
  names.reserve(set.factories.size());
  for (const auto &entry : set.factories) {
    names.push_back(entry.first);
  }
  std::sort(names.begin(), names.end());
  return names;
}

template <typename Factory>
std::string BackendRegistry::JoinNames(const BackendSet<Factory> &set) {
  const auto names = RegisteredNames(set);
  std::string message;
  for (std::size_t i = 0; i < names.size(); ++i) {
    message += names[i];
    if (i + 1 < names.size()) {
      message += ", ";
    }
  }
  return message;
}

template <typename Interface, typename Factory>
std::shared_ptr<Interface>
BackendRegistry::CreateBackend(const std::string &name,
                               const BackendSet<Factory> &set,
                               const std::string &kind,
                               const BackendSettings &settings) const {
  const auto target_name = name.empty() ? set.default_name : name;
  if (target_name.empty()) {
    throw ConfigurationError("No default " + kind + " registered");
  }
  const auto found = set.factories.find(target_name);
  if (found == set.factories.end()) {
    throw ConfigurationError("Unknown " + kind + " '" + target_name +
                             "'. Registered: " + JoinNames(set));
  }
  auto instance = found->second(settings);
  if (!instance) {
    throw std::runtime_error("Factory for " + kind + " '" + target_name +
                             "' returned null");
  }
  return instance;
}

template <typename Factory>
void BackendRegistry::RegisterBackend(const std::string &name, Factory factory,
                                      bool set_as_default,
                                      BackendSet<Factory> &set) {
  if (name.empty()) {
    throw std::invalid_argument("Backend name cannot be empty");
  }
  if (!factory) {
    throw std::invalid_argument("Factory for '" + name + "' cannot be null");
  }
  if (set.factories.count(name) != 0) {
    throw std::invalid_argument("Backend with name '" + name +
                                "' already registered");
  }
  set.factories.emplace(name, std::move(factory));
  if (set_as_default || set.default_name.empty()) {
    set.default_name = name;
  }
}

void BackendRegistry::RegisterStore(const std::string &name,
                                    StoreFactory factory, bool set_as_default) {
  RegisterBackend(name, std::move(factory), set_as_default, stores_);
}

void BackendRegistry::RegisterEmbedder(const std::string &name,
                                       EmbedderFactory factory,
                                       bool set_as_default) {
  RegisterBackend(name, std::move(factory), set_as_default, embedders_);
}

std::shared_ptr<StoreClient>
BackendRegistry::CreateStore(const std::string &name,
                             const BackendSettings &settings) const {
  return CreateBackend<StoreClient>(name, stores_, "store backend", settings);
}

std::shared_ptr<Embedder>
BackendRegistry::CreateEmbedder(const std::string &name,
                                const BackendSettings &settings) const {
  return CreateBackend<Embedder>(name, embedders_, "embedding provider",
                                 settings);
}

std::vector<std::string> BackendRegistry::StoreNames() const {
  return RegisteredNames(stores_);
}

std::vector<std::string> BackendRegistry::EmbedderNames() const {
  return RegisteredNames(embedders_);
}

const std::string &BackendRegistry::DefaultStoreName() const {
  return stores_.default_name;
}

const std::string &BackendRegistry::DefaultEmbedderName() const {
  return embedders_.default_name;
}

BackendRegistry MakeBackendRegistryWithDefaults() {
  BackendRegistry registry;
  registry.RegisterStore(
      kRedisStore,
      [](const BackendSettings &settings) -> std::shared_ptr<StoreClient> {
        const auto url =
            settings.redis_url.empty() ? kDefaultRedisUrl : settings.redis_url;
        return std::make_shared<RedisStoreClient>(ParseRedisUrl(url),
                                                  settings.logger);
      },
      true);
  registry.RegisterStore(kMemoryStore, [](const BackendSettings &) {
    return std::make_shared<InMemoryStoreClient>();
  });

  registry.RegisterEmbedder(
      kOpenAiProvider,
      [](const BackendSettings &settings) -> std::shared_ptr<Embedder> {
        return std::make_shared<OpenAiEmbedder>(
            CredentialsFrom(settings), settings.transport,
            RemoteOptionsFrom(settings), settings.logger);
      },
      true);
  registry.RegisterEmbedder(
      kHuggingFaceProvider,
      [](const BackendSettings &settings) -> std::shared_ptr<Embedder> {
        return std::make_shared<HuggingFaceEmbedder>(
            CredentialsFrom(settings), settings.transport,
            RemoteOptionsFrom(settings), settings.logger);
      });
  registry.RegisterEmbedder(
      kHashingProvider,
      [](const BackendSettings &settings) -> std::shared_ptr<Embedder> {
        return std::make_shared<HashingEmbedder>(
            settings.dimensions == 0 ? kDefaultHashingDimensions
                                     : settings.dimensions);
      });
  return registry;
}

const BackendRegistry &GlobalBackendRegistry() {
  static const BackendRegistry registry = MakeBackendRegistryWithDefaults();
  return registry;
}

} // namespace codemem
