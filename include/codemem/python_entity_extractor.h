#pragma once

#include <codemem/interfaces.h>
#include <codemem/logging.h>

#include <memory>
#include <string>

namespace codemem {

inline constexpr const char kComplexValueMarker[] = "<complex>";
inline constexpr const char kCollectionValueMarker[] = "[...]";
inline constexpr const char kMappingValueMarker[] = "{...}";
inline constexpr const char kComplexBaseMarker[] = "<complex_base>";

// Extracts module-level functions, classes (nested ones included), methods
// and module/class variables from Python source.
class PythonEntityExtractor : public EntityExtractor {
public:
  explicit PythonEntityExtractor(std::shared_ptr<Logger> logger = nullptr);

  ExtractionResult Extract(const std::string &content,
                           const std::string &file_path) override;

private:
  std::shared_ptr<Logger> logger_;
};

} // namespace codemem
