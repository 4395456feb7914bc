#include <codemem/interfaces.h>

#include <cstdlib>

namespace codemem {

std::optional<std::string>
EnvironmentCredentialSource::Lookup(const std::string &name) const {
  const char *value = std::getenv(name.c_str());
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

} // namespace codemem
