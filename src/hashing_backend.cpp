#include "embedder.hpp"
#include "hashing.hpp"
#include <cctype>
#include <cmath>

std::vector<float> HashingBackend::embed_one(const std::string& text) const {
  std::vector<float> v(dim_, 0.0f);
  std::string tok;
  auto flush = [&] {
    if (tok.empty()) return;
    v[fnv1a64(tok.data(), tok.size()) % (uint64_t)dim_] = 1.0f;
    tok.clear();
  };
  for (unsigned char c : text) {
    if (std::isalnum(c)) tok.push_back((char)std::tolower(c));
    else flush();
  }
  flush();

  double s = 0.0;
  for (float x : v) s += (double)x * x;
  if (s > 0.0) {
    float norm = (float)std::sqrt(s);
    for (auto& x : v) x /= norm;
  }
  return v;
}

std::vector<std::vector<float>> HashingBackend::embed_batch(const std::vector<std::string>& texts) {
  std::vector<std::vector<float>> out;
  out.reserve(texts.size());
  for (const auto& t : texts) out.push_back(embed_one(t));
  return out;
}
