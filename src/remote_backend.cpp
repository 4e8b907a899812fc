#include "embedder.hpp"
#include "errors.hpp"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <mutex>

using json = nlohmann::json;

namespace {

struct CurlHandle {
  CurlHandle() : curl_(curl_easy_init()) {}
  ~CurlHandle() {
    if (curl_) curl_easy_cleanup(curl_);
  }
  CurlHandle(const CurlHandle&) = delete;
  CurlHandle& operator=(const CurlHandle&) = delete;
  CURL* get() const { return curl_; }

private:
  CURL* curl_;
};

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
  static_cast<std::string*>(userdata)->append(ptr, size * nmemb);
  return size * nmemb;
}

std::once_flag g_curl_init;

} // namespace

RemoteBackend::RemoteBackend(const std::string& model, const EmbedderConfig& cfg)
  : model_(model), timeout_s_(cfg.timeout_seconds), dim_(cfg.dimensions) {
  std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });

  endpoint_ = cfg.api_base;
  while (!endpoint_.empty() && endpoint_.back() == '/') endpoint_.pop_back();
  endpoint_ += "/embeddings";

  const char* key = std::getenv(cfg.api_key_env.c_str());
  if (!key || !*key)
    throw ConfigurationError("embedder: environment variable " + cfg.api_key_env + " is not set");
  api_key_ = key;
  spdlog::info("remote embeddings at {} (model {})", endpoint_, model_);
}

RemoteBackend::~RemoteBackend() = default;

int RemoteBackend::dim() {
  if (dim_.load() <= 0) embed_batch({"dimension probe"});
  return dim_.load();
}

std::vector<std::vector<float>> RemoteBackend::embed_batch(const std::vector<std::string>& texts) {
  json req = {{"model", model_}, {"input", texts}};
  if (dim_.load() > 0) req["dimensions"] = dim_.load();
  const std::string body = req.dump();

  CurlHandle curl;
  if (!curl.get()) throw EmbeddingBackendError("curl_easy_init failed", true);

  std::string response;
  const std::string auth = "Authorization: Bearer " + api_key_;
  struct curl_slist* headers = nullptr;
  headers = curl_slist_append(headers, "Content-Type: application/json");
  headers = curl_slist_append(headers, auth.c_str());

  curl_easy_setopt(curl.get(), CURLOPT_URL, endpoint_.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, (long)body.size());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_cb);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_s_);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

  CURLcode res = curl_easy_perform(curl.get());
  curl_slist_free_all(headers);
  if (res != CURLE_OK) {
    // timeouts and transport failures are worth another try
    throw EmbeddingBackendError(std::string("request failed: ") + curl_easy_strerror(res), true);
  }

  long code = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
  if (code != 200) {
    bool retry = code == 429 || code >= 500;
    throw EmbeddingBackendError("HTTP " + std::to_string(code) + ": " + response.substr(0, 200), retry);
  }

  std::vector<std::vector<float>> out(texts.size());
  try {
    json doc = json::parse(response);
    const auto& data = doc.at("data");
    if (!data.is_array() || data.size() != texts.size())
      throw EmbeddingBackendError("response has " + std::to_string(data.size()) + " embeddings for " +
                                  std::to_string(texts.size()) + " inputs", false);
    for (std::size_t i = 0; i < data.size(); ++i) {
      const auto& item = data[i];
      std::size_t idx = item.value("index", i);
      if (idx >= out.size()) throw EmbeddingBackendError("response index out of range", false);
      out[idx] = item.at("embedding").get<std::vector<float>>();
    }
  } catch (const json::exception& e) {
    throw EmbeddingBackendError(std::string("malformed response: ") + e.what(), false);
  }

  if (dim_.load() <= 0 && !out.empty()) dim_.store((int)out.front().size());
  return out;
}
