#include "NarrativeGenerator.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

using nlohmann::json;

namespace safesar {

std::string buildSarPrompt(const std::string& safePayload) {
  std::string p;
  p += "<|begin_of_text|><|start_header_id|>system<|end_header_id|>\n";
  p += "You are an AML compliance analyst writing lawful SAR summaries. "
       "Write plain English with no markdown and no line breaks, as one continuous paragraph. "
       "Bracketed placeholders such as [EMAIL:1a2b3c] stand for withheld values; "
       "copy them exactly and never guess what they hide.\n";
  p += "<|eot_id|><|start_header_id|>user<|end_header_id|>\n";
  p += "Write a concise SAR narrative (<=300 words) from this JSON. "
       "Include who, what, when, where, how, why, detection source, and amounts. "
       "End with one sentence stating the report date, amount (if any), and main entity.\n";
  p += "JSON Input:\n";
  p += safePayload;
  p += "\n<|eot_id|><|start_header_id|>assistant<|end_header_id|>";
  return p;
}

std::string normalizeNarrative(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    if (c == '*') continue;
    out += (c == '\n') ? ' ' : c;
  }
  const char* ws = " \t\r\n\f\v";
  const auto b = out.find_first_not_of(ws);
  if (b == std::string::npos) return {};
  const auto e = out.find_last_not_of(ws);
  return out.substr(b, e - b + 1);
}

HttpNarrativeGenerator::HttpNarrativeGenerator(ModelEndpoint endpoint)
  : endpoint_(std::move(endpoint)) {
  if (endpoint_.baseUrl.empty()) throw std::invalid_argument("model endpoint URL is empty");
}

std::string HttpNarrativeGenerator::modelName() const {
  return endpoint_.modelId.empty() ? endpoint_.baseUrl : endpoint_.modelId;
}

std::string HttpNarrativeGenerator::generate(const std::string& prompt) {
  httplib::Client cli(endpoint_.baseUrl);
  cli.set_connection_timeout(10, 0);
  cli.set_read_timeout(endpoint_.readTimeoutSec, 0);
  if (!endpoint_.apiKey.empty()) cli.set_bearer_token_auth(endpoint_.apiKey.c_str());

  json body = {
    {"prompt", prompt},
    {"max_gen_len", endpoint_.maxGenLen},
    {"temperature", endpoint_.temperature},
    {"top_p", endpoint_.topP}
  };
  if (!endpoint_.modelId.empty()) body["model"] = endpoint_.modelId;

  auto res = cli.Post(endpoint_.path.c_str(), body.dump(), "application/json");
  if (!res) {
    throw std::runtime_error("model request failed (httplib error " +
                             std::to_string(static_cast<int>(res.error())) + ")");
  }
  if (res->status != 200) {
    throw std::runtime_error("model returned HTTP " + std::to_string(res->status));
  }

  json reply = json::parse(res->body, nullptr, false);
  if (reply.is_discarded() || !reply.is_object()) {
    throw std::runtime_error("model reply is not a JSON object");
  }
  auto it = reply.find("generation");
  if (it == reply.end() || !it->is_string()) {
    spdlog::warn("model reply has no string 'generation' field");
    return {};
  }
  return it->get<std::string>();
}

} // namespace safesar
