#include <codemem/hashing_embedder.h>

#include <codemem/errors.h>

#include <cctype>
#include <cmath>
#include <cstdint>

namespace codemem {

namespace {
std::uint64_t Fnv1a(const std::string &token) {
  std::uint64_t hash = 1469598103934665603ULL;
  for (const auto character : token) {
    hash ^= static_cast<unsigned char>(character);
    hash *= 1099511628211ULL;
  }
  return hash;
}

void Accumulate(std::vector<float> &vector, const std::string &feature,
                float weight) {
  const auto hash = Fnv1a(feature);
  const auto bucket = static_cast<std::size_t>(hash % vector.size());
  const float sign = (hash >> 63) != 0 ? -1.0F : 1.0F;
  vector[bucket] += sign * weight;
}
} // namespace

std::vector<std::string> TokenizeForEmbedding(const std::string &text) {
  std::vector<std::string> tokens;
  std::string current;
  auto flush = [&]() {
    if (!current.empty()) {
      tokens.push_back(current);
      current.clear();
    }
  };

  for (std::size_t i = 0; i < text.size(); ++i) {
    const auto character = static_cast<unsigned char>(text[i]);
    if (!std::isalnum(character)) {
      flush();
      continue;
    }
    // camelCase boundary
    if (std::isupper(character) && i > 0 &&
        std::islower(static_cast<unsigned char>(text[i - 1]))) {
      flush();
    }
    current.push_back(static_cast<char>(std::tolower(character)));
  }
  flush();
  return tokens;
}

HashingEmbedder::HashingEmbedder(std::size_t dimensions)
    : dimensions_(dimensions) {
  if (dimensions_ == 0) {
    throw ConfigurationError("Hashing embedder dimensions must be positive");
  }
}

std::string HashingEmbedder::ModelId() const {
  return "feature-hash-" + std::to_string(dimensions_);
}

std::vector<std::vector<float>>
HashingEmbedder::Embed(const std::vector<std::string> &batch) {
  std::vector<std::vector<float>> vectors;
  vectors.reserve(batch.size());
  for (const auto &text : batch) {
    vectors.push_back(EmbedOne(text));
  }
  return vectors;
}

std::vector<float> HashingEmbedder::EmbedOne(const std::string &text) const {
  std::vector<float> vector(dimensions_, 0.0F);
  const auto tokens = TokenizeForEmbedding(text);
  for (std::size_t i = 0; i < tokens.size(); ++i) {
    Accumulate(vector, tokens[i], 1.0F);
    if (i + 1 < tokens.size()) {
      Accumulate(vector, tokens[i] + " " + tokens[i + 1], 0.5F);
    }
  }

  double norm = 0.0;
  for (const auto value : vector) {
    norm += static_cast<double>(value) * value;
  }
  if (norm > 0.0) {
    const auto scale = static_cast<float>(1.0 / std::sqrt(norm));
    for (auto &value : vector) {
      value *= scale;
    }
  }
  return vector;
}

} // namespace codemem
