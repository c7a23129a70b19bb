#pragma once
#include <string>

namespace safesar {

// External text-generation step. Receives a complete prompt and returns the
// model's raw text; callers normalize it. Implementations throw
// std::runtime_error on transport errors.
class NarrativeGenerator {
public:
  virtual ~NarrativeGenerator() = default;
  virtual std::string generate(const std::string& prompt) = 0;
  virtual std::string modelName() const = 0;
};

// Embeds safePayload verbatim into the SAR-writing instructions.
std::string buildSarPrompt(const std::string& safePayload);

// Single paragraph: newlines become spaces, '*' is dropped, ends trimmed.
std::string normalizeNarrative(const std::string& text);

struct ModelEndpoint {
  std::string baseUrl;   // scheme://host[:port]
  std::string path = "/generate";
  std::string modelId;   // sent as "model" when non-empty
  std::string apiKey;    // bearer token when non-empty
  int         maxGenLen = 512;
  double      temperature = 0.25;
  double      topP = 0.9;
  int         readTimeoutSec = 300;
};

// POSTs {"prompt", "max_gen_len", "temperature", "top_p"} as JSON and reads
// "generation" from the reply.
class HttpNarrativeGenerator : public NarrativeGenerator {
public:
  explicit HttpNarrativeGenerator(ModelEndpoint endpoint);

  std::string generate(const std::string& prompt) override;
  std::string modelName() const override;

private:
  ModelEndpoint endpoint_;
};

} // namespace safesar
