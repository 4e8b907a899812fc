#include "embedder.hpp"
#include "errors.hpp"
#include <llama.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

struct LlamaBackend::Impl {
  llama_model* model = nullptr;
  llama_context* ctx = nullptr;
  const llama_vocab* vocab = nullptr;
  int n_ctx = 1024;
  int dim = 0;
  std::mutex mu;  // one context, one decode at a time

  explicit Impl(const std::string& model_path) {
    if (!std::filesystem::is_regular_file(model_path))
      throw ConfigurationError("embedder.model: no such model file: " + model_path);

    llama_backend_init();

    llama_model_params mp = llama_model_default_params();
    mp.n_gpu_layers = 0; // CPU
    model = llama_model_load_from_file(model_path.c_str(), mp);
    if (!model) {
      llama_backend_free();
      throw ConfigurationError("embedder.model: failed to load " + model_path);
    }

    llama_context_params cp = llama_context_default_params();
    cp.n_ctx = n_ctx;
    cp.n_batch = n_ctx;
    cp.n_ubatch = n_ctx;
    cp.embeddings = true;
    cp.pooling_type = LLAMA_POOLING_TYPE_MEAN;
    ctx = llama_init_from_model(model, cp);
    if (!ctx) {
      llama_model_free(model);
      llama_backend_free();
      throw ConfigurationError("embedder.model: failed to create context for " + model_path);
    }

    vocab = llama_model_get_vocab(model);
    dim = llama_model_n_embd(model);
    if (dim <= 0) {
      llama_free(ctx);
      llama_model_free(model);
      llama_backend_free();
      throw ConfigurationError("embedder.model: invalid embedding dim in " + model_path);
    }
  }

  ~Impl() {
    if (ctx) llama_free(ctx);
    if (model) llama_model_free(model);
    llama_backend_free();
  }

  std::vector<llama_token> tokenize(const std::string& text) {
    // first pass for length; a negative count is the required size
    int32_t needed = -llama_tokenize(vocab, text.c_str(), (int32_t)text.size(),
                                     nullptr, 0, /*add_special=*/true, /*parse_special=*/false);
    if (needed <= 0) throw EmbeddingBackendError("llama: tokenize failed (len)", false);
    std::vector<llama_token> toks(needed);
    int32_t n = llama_tokenize(vocab, text.c_str(), (int32_t)text.size(),
                               toks.data(), (int32_t)toks.size(),
                               /*add_special=*/true, /*parse_special=*/false);
    if (n != needed) throw EmbeddingBackendError("llama: tokenize failed", false);
    // long chunks are embedded by their head
    if ((int)toks.size() > n_ctx) toks.resize(n_ctx);
    return toks;
  }

  std::vector<float> encode_text(const std::string& text) {
    auto toks = tokenize(text);

    llama_memory_clear(llama_get_memory(ctx), true);

    llama_batch batch = llama_batch_init((int)toks.size(), /*embd*/ 0, /*n_seq*/ 1);
    for (int i = 0; i < (int)toks.size(); ++i) {
      batch.token[i] = toks[i];
      batch.pos[i] = i;
      batch.n_seq_id[i] = 1;
      batch.seq_id[i][0] = 0;
      batch.logits[i] = true;
    }
    batch.n_tokens = (int)toks.size();

    if (llama_decode(ctx, batch) != 0) {
      llama_batch_free(batch);
      throw EmbeddingBackendError("llama: decode failed", false);
    }
    llama_batch_free(batch);

    const float* emb = llama_get_embeddings_seq(ctx, 0);
    if (!emb) throw EmbeddingBackendError("llama: embeddings null", false);

    std::vector<float> v(emb, emb + dim);
    // L2 normalize
    double s = 0.0; for (float x : v) s += (double)x * (double)x;
    float norm = (float)std::sqrt(std::max(s, 1e-12));
    for (auto& x : v) x /= norm;
    return v;
  }
};

LlamaBackend::LlamaBackend(const std::string& embed_model_path)
  : impl_(new Impl(embed_model_path)) {
  model_id_ = "llama/" + std::filesystem::path(embed_model_path).filename().string();
  dim_ = impl_->dim;
  spdlog::info("loaded {} (dim {})", model_id_, dim_);
}

LlamaBackend::~LlamaBackend() = default;

std::vector<std::vector<float>> LlamaBackend::embed_batch(const std::vector<std::string>& texts) {
  std::lock_guard<std::mutex> lock(impl_->mu);
  std::vector<std::vector<float>> out;
  out.reserve(texts.size());
  for (const auto& t : texts) out.push_back(impl_->encode_text(t.empty() ? std::string(" ") : t));
  return out;
}
