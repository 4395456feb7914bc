#include <codemem/models.h>

namespace codemem {

std::string EntityTypeName(EntityType type) {
  switch (type) {
  case EntityType::kFunction:
    return "function";
  case EntityType::kClass:
    return "class";
  case EntityType::kMethod:
    return "method";
  case EntityType::kVariable:
    return "variable";
  }
  return "unknown";
}

std::optional<EntityType> ParseEntityType(const std::string &name) {
  for (const auto type : AllEntityTypes()) {
    if (EntityTypeName(type) == name) {
      return type;
    }
  }
  return std::nullopt;
}

const std::vector<EntityType> &AllEntityTypes() {
  static const std::vector<EntityType> types = {
      EntityType::kFunction, EntityType::kClass, EntityType::kMethod,
      EntityType::kVariable};
  return types;
}

} // namespace codemem
