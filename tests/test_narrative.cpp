#include <catch2/catch.hpp>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <thread>

#include "services/narrative/NarrativeGenerator.hpp"

using namespace safesar;
using nlohmann::json;

TEST_CASE("Prompt embeds the payload verbatim", "[narrative]") {
  const std::string payload = R"({"case_id":"C-1","summary":"[EMAIL:aa5361]"})";
  const std::string prompt = buildSarPrompt(payload);
  CHECK(prompt.find("JSON Input:\n" + payload + "\n") != std::string::npos);
  CHECK(prompt.find("SAR narrative") != std::string::npos);
}

TEST_CASE("Narrative normalization", "[narrative]") {
  CHECK(normalizeNarrative("  **Summary**\nLine two\n\n") == "Summary Line two");
  CHECK(normalizeNarrative("\n\n  ") == "");
  CHECK(normalizeNarrative("plain") == "plain");
}

namespace {

// Minimal model endpoint on a loopback port.
struct FakeModelServer {
  httplib::Server svr;
  std::thread thread;
  int port = -1;
  json lastRequest;
  std::string lastAuth;
  int status = 200;
  std::string reply = R"({"generation": "A *short*\nnarrative."})";

  FakeModelServer() {
    svr.Post("/generate", [this](const httplib::Request& req, httplib::Response& res) {
      lastRequest = json::parse(req.body, nullptr, false);
      lastAuth = req.get_header_value("Authorization");
      res.status = status;
      res.set_content(reply, "application/json");
    });
    port = svr.bind_to_any_port("127.0.0.1");
    thread = std::thread([this] { svr.listen_after_bind(); });
    for (int i = 0; i < 200 && !svr.is_running(); ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
  }
  ~FakeModelServer() {
    svr.stop();
    if (thread.joinable()) thread.join();
  }
  std::string url() const { return "http://127.0.0.1:" + std::to_string(port); }
};

} // namespace

TEST_CASE("HTTP generator talks to the model endpoint", "[narrative][http]") {
  FakeModelServer server;
  REQUIRE(server.port > 0);

  ModelEndpoint ep;
  ep.baseUrl = server.url();
  ep.modelId = "test-model";
  ep.apiKey = "tok";
  HttpNarrativeGenerator gen(ep);
  CHECK(gen.modelName() == "test-model");

  SECTION("Successful generation returns the raw text") {
    CHECK(gen.generate("PROMPT") == "A *short*\nnarrative.");
    CHECK(server.lastRequest["prompt"] == "PROMPT");
    CHECK(server.lastRequest["max_gen_len"] == 512);
    CHECK(server.lastRequest["model"] == "test-model");
    CHECK(server.lastAuth == "Bearer tok");
  }
  SECTION("Missing generation yields empty text") {
    server.reply = R"({"generation": null})";
    CHECK(gen.generate("PROMPT").empty());
  }
  SECTION("HTTP errors throw") {
    server.status = 500;
    CHECK_THROWS_AS(gen.generate("PROMPT"), std::runtime_error);
  }
  SECTION("Non-JSON replies throw") {
    server.reply = "<html>";
    CHECK_THROWS_AS(gen.generate("PROMPT"), std::runtime_error);
  }
}

TEST_CASE("HTTP generator needs an endpoint", "[narrative]") {
  CHECK_THROWS_AS(HttpNarrativeGenerator(ModelEndpoint{}), std::invalid_argument);
}
