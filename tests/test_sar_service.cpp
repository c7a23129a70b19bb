#include <catch2/catch.hpp>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <stdexcept>

#include "core/crypto/Digest.hpp"
#include "core/metadata/InitDb.hpp"
#include "core/metadata/MetadataStore.hpp"
#include "core/storage/LocalFSBackend.hpp"
#include "services/api/SarService.hpp"
#include "services/narrative/NarrativeGenerator.hpp"
#include "TestSupport.hpp"

using namespace safesar;
using nlohmann::json;

namespace {

class FakeGenerator : public NarrativeGenerator {
public:
  std::string lastPrompt;
  std::string output = "Narrative **text**\nfor the case.";
  bool fail = false;
  int calls = 0;

  std::string generate(const std::string& prompt) override {
    ++calls;
    lastPrompt = prompt;
    if (fail) throw std::runtime_error("model unreachable");
    return output;
  }
  std::string modelName() const override { return "fake-model"; }
};

struct Fixture {
  test::TempDir tmp;
  RedactionEngine engine{test::makeConfig()};
  FakeGenerator generator;
  LocalFSBackend storage{(tmp.path / "out").string()};
  std::string dbPath = (tmp.path / "meta.db").string();
  bool dbReady = initDatabase(dbPath, SAFESAR_SCHEMA_PATH);
  MetadataStore store{dbPath};
  // 2024-03-05 06:07:08 UTC
  SarService service{engine, generator, storage, store, [] { return std::time_t(1709618828); }};
};

// Storage key a narrative with this id gets under the fixed clock.
std::string expectedKey(const std::string& caseId, const json& body) {
  return "sar-output/" + caseId + "/20240305T060708Z-" + body["id"].get<std::string>() + ".json";
}

std::string readFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

} // namespace

TEST_CASE("Timestamp and case id helpers", "[service]") {
  CHECK(utc_timestamp(1709618828) == "20240305T060708Z");
  CHECK(storage_case_id(Record{{"case_id", "C-1"}}) == "C-1");
  CHECK(storage_case_id(Record{{"case_id", 42}}) == "42");
  CHECK(storage_case_id(Record{{"case_id", "[ACCT:abc123]"}}) == "_ACCT_abc123_");
  CHECK(storage_case_id(Record{{"case_id", "../../etc"}}) == ".._.._etc");
  CHECK(storage_case_id(Record{{"case_id", ".."}}) == "NA");
  CHECK(storage_case_id(Record{{"case_id", ""}}) == "NA");
  CHECK(storage_case_id(Record{{"case_id", true}}) == "NA");
  CHECK(storage_case_id(Record::object()) == "NA");

  SECTION("Long ids are shortened to a stable path component") {
    const std::string longId(400, 'x');
    const std::string stored = storage_case_id(Record{{"case_id", longId}});
    CHECK(stored.size() == 128);
    CHECK(stored.substr(0, 111) == longId.substr(0, 111));
    CHECK(stored == storage_case_id(Record{{"case_id", longId}}));
    CHECK(stored != storage_case_id(Record{{"case_id", longId + "y"}}));
    CHECK(storage_case_id(Record{{"case_id", std::string(128, 'x')}}) == std::string(128, 'x'));
  }
}

TEST_CASE("SAR request end to end", "[service]") {
  Fixture f;
  REQUIRE(f.dbReady);

  const json request = {
    {"security_detail_json", {
      {"case_id", "C-1"},
      {"summary", "Contact jane.doe@example.com, card 4111111111111111"},
      {"customer_ssn", "123-45-6789"}
    }}
  };

  const SarResponse r = f.service.handle(request.dump());
  REQUIRE(r.status == 200);
  CHECK(r.body["storage_key"] == expectedKey("C-1", r.body));
  CHECK(r.body["narrative"] == "Narrative text for the case.");

  SECTION("The model only sees the safe payload") {
    CHECK(f.generator.lastPrompt.find(
            R"({"case_id":"C-1","summary":"Contact [EMAIL:aa5361], card [CARD:15e0d5]"})") !=
          std::string::npos);
    CHECK(f.generator.lastPrompt.find("jane.doe@example.com") == std::string::npos);
    CHECK(f.generator.lastPrompt.find("customer_ssn") == std::string::npos);
    CHECK(f.generator.lastPrompt.find("123-45-6789") == std::string::npos);
  }

  SECTION("The stored document and index agree") {
    auto list = f.store.listByCase("C-1");
    REQUIRE(list.size() == 1);
    const auto& rec = list[0];
    CHECK(rec.id == r.body["id"]);
    CHECK(rec.storage_key == r.body["storage_key"]);
    CHECK(rec.model == "fake-model");
    CHECK(rec.created_at == 1709618828);

    const std::string bytes = readFile(rec.storage_path);
    CHECK(static_cast<int64_t>(bytes.size()) == rec.bytes);
    const json doc = json::parse(bytes);
    CHECK(doc["case_id"] == "C-1");
    CHECK(doc["timestamp"] == "20240305T060708Z");
    CHECK(doc["model"] == "fake-model");
    CHECK(doc["narrative"] == "Narrative text for the case.");
    CHECK(doc["redacted_input"].get<std::string>().find("[EMAIL:aa5361]") != std::string::npos);
    CHECK(bytes.find("jane.doe@example.com") == std::string::npos);
    CHECK(bytes.rfind(R"({"case_id":"C-1","timestamp":"20240305T060708Z","model":"fake-model",)", 0) == 0);

    auto described = f.service.describe(rec.id);
    REQUIRE(described.status == 200);
    REQUIRE(described.body["history"].size() == 1);
    CHECK(described.body["history"][0]["event"] == "CREATED");
    CHECK(described.body["history"][0]["details"]["redactions"] == 2);
  }

  SECTION("Case listing") {
    auto listed = f.service.listCase("C-1");
    REQUIRE(listed.status == 200);
    CHECK(listed.body["narratives"].size() == 1);
    CHECK(f.service.listCase("C-404").body["narratives"].empty());
    CHECK(f.service.describe("00000000-0000-4000-8000-000000000000").status == 404);
  }
}

TEST_CASE("Case data may arrive as JSON text", "[service]") {
  Fixture f;
  const json request = {
    {"security_detail_json", R"({"case_id": "C-2", "summary": "ip 10.0.0.1"})"}
  };
  const SarResponse r = f.service.handle(request.dump());
  REQUIRE(r.status == 200);
  CHECK(r.body["storage_key"] == expectedKey("C-2", r.body));
  CHECK(f.generator.lastPrompt.find("10.0.0.1") == std::string::npos);
}

TEST_CASE("Sensitive case ids are tokenized before they reach storage", "[service]") {
  Fixture f;
  const json request = {{"security_detail_json", {{"case_id", "ops@bank.com"}}}};
  const SarResponse r = f.service.handle(request.dump());
  REQUIRE(r.status == 200);
  CHECK(r.body["storage_key"] == expectedKey("_EMAIL_514647_", r.body));
}

TEST_CASE("Repeated requests in the same second keep every narrative", "[service]") {
  Fixture f;
  REQUIRE(f.dbReady);

  f.generator.output = "narrative 1";
  const SarResponse r1 = f.service.handle(R"({"security_detail_json": {"case_id": "C-1"}})");
  f.generator.output = "narrative 2";
  const SarResponse r2 = f.service.handle(R"({"security_detail_json": {"case_id": "C-1"}})");
  // Different raw ids that map to the same path component.
  f.generator.output = "narrative 3";
  const SarResponse r3 = f.service.handle(R"({"security_detail_json": {"case_id": "C_1"}})");
  const SarResponse r4 = f.service.handle(R"({"security_detail_json": {"case_id": "C/1"}})");

  REQUIRE(r1.status == 200);
  REQUIRE(r2.status == 200);
  REQUIRE(r3.status == 200);
  REQUIRE(r4.status == 200);
  CHECK(r1.body["storage_key"] != r2.body["storage_key"]);
  CHECK(r3.body["storage_key"] != r4.body["storage_key"]);

  const auto c1 = f.store.listByCase("C-1");
  REQUIRE(c1.size() == 2);
  CHECK(f.store.listByCase("C_1").size() == 2);

  for (const auto& rec : c1) {
    const std::string bytes = readFile(rec.storage_path);
    CHECK(sha256_hex(bytes) == rec.sha256);
    CHECK(static_cast<int64_t>(bytes.size()) == rec.bytes);
    const std::string expected = rec.id == r1.body["id"] ? "narrative 1" : "narrative 2";
    CHECK(json::parse(bytes)["narrative"] == expected);
  }
}

TEST_CASE("SAR request failures", "[service]") {
  Fixture f;

  SECTION("Missing field is a 400") {
    const SarResponse r = f.service.handle(R"({"something_else": 1})");
    CHECK(r.status == 400);
    CHECK(r.body["error"] == "missing field: security_detail_json");
    CHECK(f.generator.calls == 0);
  }
  SECTION("Unparseable body is a 400, not a crash") {
    CHECK(f.service.handle("not json at all").status == 400);
    CHECK(f.service.handle("[1,2,3]").status == 400);
  }
  SECTION("Unparseable case text still reaches the model as {}") {
    const SarResponse r = f.service.handle(R"({"security_detail_json": "jane.doe@example.com"})");
    CHECK(r.status == 200);
    CHECK(r.body["storage_key"] == expectedKey("NA", r.body));
    CHECK(f.generator.lastPrompt.find("JSON Input:\n{}\n") != std::string::npos);
  }
  SECTION("Empty generation is a 502") {
    f.generator.output = " ** \n ";
    const SarResponse r = f.service.handle(R"({"security_detail_json": {"case_id": "C-1"}})");
    CHECK(r.status == 502);
    CHECK(r.body["error"] == "model returned empty generation");
    CHECK(f.store.listByCase("C-1").empty());
  }
  SECTION("Model failure is an opaque 502") {
    f.generator.fail = true;
    const SarResponse r = f.service.handle(
      R"({"security_detail_json": {"case_id": "C-1", "summary": "ops@bank.com"}})");
    CHECK(r.status == 502);
    CHECK(r.body["error"] == "internal");
    CHECK(r.body.dump().find("ops@bank.com") == std::string::npos);
  }
}

TEST_CASE("Redact preview matches what the model would receive", "[service]") {
  Fixture f;
  CHECK(f.service.redact(R"({"case_id": "C-1", "ip": "10.0.0.1"})") == R"({"case_id":"C-1"})");
  CHECK(f.service.redact("garbage") == "{}");
}
