#pragma once

#include <codemem/interfaces.h>

#include <cstddef>
#include <string>
#include <vector>

namespace codemem {

inline constexpr std::size_t kDefaultHashingDimensions = 256;

// Offline provider: lowercased identifier tokens are feature-hashed into a
// fixed number of buckets and the result is L2-normalised. Identical text
// always yields the identical vector.
class HashingEmbedder : public Embedder {
public:
  explicit HashingEmbedder(std::size_t dimensions = kDefaultHashingDimensions);

  std::vector<std::vector<float>>
  Embed(const std::vector<std::string> &batch) override;
  std::string ProviderId() const override { return "hashing"; }
  std::string ModelId() const override;

  std::size_t dimensions() const { return dimensions_; }

private:
  std::vector<float> EmbedOne(const std::string &text) const;

  std::size_t dimensions_;
};

std::vector<std::string> TokenizeForEmbedding(const std::string &text);

} // namespace codemem
