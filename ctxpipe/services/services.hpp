/*
 * services.hpp  Andrew Belles  Nov 22nd, 2025
 *
 * Optional model services used by extraction and retrieval. Each port
 * reports whether it is usable once, when it is built, and callers compose
 * around that answer instead of probing per call
 *
 */

#ifndef __CTXPIPE_SERVICES_HPP
#define __CTXPIPE_SERVICES_HPP

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <boost/json.hpp>

#include "ctxpipe/crawler/http.hpp"

namespace svc {

using millis = std::chrono::milliseconds;

class ServiceError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct ServiceConfig {
  bool enabled{false};
  std::string endpoint{};
  std::string model{};
  std::string api_key{};
  millis timeout{30000};
};

struct ServicesConfig {
  ServiceConfig embedding{false, "http://localhost:11434", "nomic-embed-text"};
  ServiceConfig rerank{false, "http://localhost:8080", ""};
  ServiceConfig assist{false, "http://localhost:11434", "llama3"};
};

/************ ports ***************************************/

class EmbeddingService {
public:
  virtual ~EmbeddingService() = default;

  virtual bool available() const noexcept = 0;
  // Throws ServiceError
  virtual std::vector<float> embed(const std::string& text) = 0;
};

class RerankService {
public:
  virtual ~RerankService() = default;

  virtual bool available() const noexcept = 0;
  // One score per text, same order. Throws ServiceError
  virtual std::vector<double> rerank(const std::string& query,
                                     const std::vector<std::string>& texts) = 0;
};

class AssistService {
public:
  virtual ~AssistService() = default;

  virtual bool available() const noexcept = 0;
  // Throws ServiceError
  virtual std::string complete(const std::string& prompt) = 0;
};

/************ HTTP implementations ************************/

// Ollama /api/embeddings
class OllamaEmbedding final : public EmbeddingService {
public:
  explicit OllamaEmbedding(ServiceConfig cfg);

  bool available() const noexcept override { return available_; }
  std::vector<float> embed(const std::string& text) override;

private:
  ServiceConfig cfg_;
  htc::Url base_;
  bool available_{false};
};

// Text Embeddings Inference style /rerank
class TeiRerank final : public RerankService {
public:
  explicit TeiRerank(ServiceConfig cfg);

  bool available() const noexcept override { return available_; }
  std::vector<double> rerank(const std::string& query,
                             const std::vector<std::string>& texts) override;

private:
  ServiceConfig cfg_;
  htc::Url base_;
  bool available_{false};
};

// Ollama /api/generate, non-streaming, deterministic options
class OllamaAssist final : public AssistService {
public:
  explicit OllamaAssist(ServiceConfig cfg);

  bool available() const noexcept override { return available_; }
  std::string complete(const std::string& prompt) override;

private:
  ServiceConfig cfg_;
  htc::Url base_;
  bool available_{false};
};

/************ factories ***********************************/
/* Return nullptr when the service is disabled in configuration. A built
 * service may still report available() == false if its health check failed
 */
std::unique_ptr<EmbeddingService> make_embedding(const ServiceConfig& cfg);
std::unique_ptr<RerankService> make_rerank(const ServiceConfig& cfg);
std::unique_ptr<AssistService> make_assist(const ServiceConfig& cfg);

/************ parse_rerank_reply() ************************/
/* TEI answers [{"index": i, "score": s}, ...] sorted by score.
 *
 * We return:
 *   the n scores in input order
 *
 * Throws:
 *   svc::ServiceError for a non array reply, a non integral or out of
 *   range index, a missing or non finite score, or an unscored text
 */
std::vector<double> parse_rerank_reply(const boost::json::value& reply, size_t n);

// Pulls the first JSON object out of a model reply, markdown fences and
// surrounding prose included. Returns "" when there is none
std::string strip_json_reply(std::string_view reply);

} // end namespace svc

#endif // !__CTXPIPE_SERVICES_HPP
