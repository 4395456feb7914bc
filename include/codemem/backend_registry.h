#pragma once

#include <codemem/http_client.h>
#include <codemem/interfaces.h>
#include <codemem/logging.h>

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace codemem {

// Everything a backend factory may need. Built once per session.
struct BackendSettings {
  std::string redis_url;
  std::string model;
  std::size_t dimensions = 0;
  std::shared_ptr<Logger> logger;
  std::shared_ptr<const CredentialSource> credentials;
  std::shared_ptr<HttpTransport> transport;
};

class BackendRegistry {
public:
  using StoreFactory =
      std::function<std::shared_ptr<StoreClient>(const BackendSettings &)>;
  using EmbedderFactory =
      std::function<std::shared_ptr<Embedder>(const BackendSettings &)>;

  void RegisterStore(const std::string &name, StoreFactory factory,
                     bool set_as_default = false);
  void RegisterEmbedder(const std::string &name, EmbedderFactory factory,
                        bool set_as_default = false);

  std::shared_ptr<StoreClient> CreateStore(const std::string &name,
                                           const BackendSettings &settings) const;
  std::shared_ptr<Embedder>
  CreateEmbedder(const std::string &name,
                 const BackendSettings &settings) const;

  std::vector<std::string> StoreNames() const;
  std::vector<std::string> EmbedderNames() const;

  const std::string &DefaultStoreName() const;
  const std::string &DefaultEmbedderName() const;

  template <typename Factory> struct BackendSet {
    std::unordered_map<std::string, Factory> factories;
    std::string default_name;
  };

private:
  template <typename Factory>
  static std::vector<std::string> RegisteredNames(const BackendSet<Factory> &set);

  template <typename Factory>
  static std::string JoinNames(const BackendSet<Factory> &set);

  template <typename Interface, typename Factory>
  std::shared_ptr<Interface> CreateBackend(const std::string &name,
                                           const BackendSet<Factory> &set,
                                           const std::string &kind,
                                           const BackendSettings &settings) const;

  template <typename Factory>
  void RegisterBackend(const std::string &name, Factory factory,
                       bool set_as_default, BackendSet<Factory> &set);

  BackendSet<StoreFactory> stores_;
  BackendSet<EmbedderFactory> embedders_;
};

BackendRegistry MakeBackendRegistryWithDefaults();
const BackendRegistry &GlobalBackendRegistry();

} // namespace codemem
