#include "SarService.hpp"

#include <spdlog/spdlog.h>
#include <cstddef>
#include <cstdint>
#include <random>

#include "core/crypto/Digest.hpp"
#include "core/metadata/MetadataStore.hpp"
#include "core/storage/LocalFSBackend.hpp"
#include "services/narrative/NarrativeGenerator.hpp"

using nlohmann::json;

namespace safesar {

// Path components longer than this are shortened and suffixed with a digest.
static constexpr std::size_t kMaxCaseIdLength = 128;

static std::string uuid4() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  auto rnd64 = [&]() { return static_cast<uint64_t>(rng()); };
  auto hexn = [](uint64_t v, int n) {
    static const char* k = "0123456789abcdef";
    std::string s(n, '0');
    for (int i = n - 1; i >= 0; --i) { s[i] = k[v & 0xf]; v >>= 4; }
    return s;
  };
  uint64_t a = rnd64(), b = rnd64();
  // version 4
  a = (a & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;
  // variant 10xx
  b = (b & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;
  return hexn(a >> 32, 8) + "-" + hexn((a >> 16) & 0xffffULL, 4) + "-" +
         hexn(a & 0xffffULL, 4) + "-" + hexn(b >> 48, 4) + "-" +
         hexn(b & 0xffffffffffffULL, 12);
}

std::string utc_timestamp(std::time_t t) {
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm);
  return buf;
}

std::string storage_case_id(const Record& safeRecord) {
  std::string id;
  if (safeRecord.is_object()) {
    auto it = safeRecord.find("case_id");
    if (it != safeRecord.end()) {
      if (it->is_string()) id = it->get<std::string>();
      else if (it->is_number_integer()) id = it->dump();
    }
  }
  if (id.empty()) return "NA";
  for (char& c : id) {
    const bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                    (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
    if (!ok) c = '_';
  }
  if (id == "." || id == "..") return "NA";
  if (id.size() > kMaxCaseIdLength) {
    id = id.substr(0, kMaxCaseIdLength - 17) + "-" + sha256_hex(id).substr(0, 16);
  }
  return id;
}

SarService::SarService(const RedactionEngine& engine,
                       NarrativeGenerator& generator,
                       LocalFSBackend& storage,
                       MetadataStore& store,
                       Clock clock)
  : engine_(engine), generator_(generator), storage_(storage), store_(store),
    clock_(std::move(clock)) {}

std::string SarService::redact(const std::string& rawCase) const {
  return engine_.buildSafePayload(rawCase);
}

SarResponse SarService::handle(const std::string& requestBody) {
  try {
    Record payload = RedactionEngine::parseOrEmpty(requestBody);
    if (!payload.is_object()) payload = Record::object();

    auto sec = payload.find("security_detail_json");
    if (sec == payload.end()) {
      return {400, {{"error", "missing field: security_detail_json"}}};
    }

    // The field is either JSON text or an already-structured object.
    const Record raw = sec->is_string()
      ? RedactionEngine::parseOrEmpty(sec->get_ref<const std::string&>())
      : *sec;

    ScrubStats stats;
    const Record safe = engine_.sanitize(raw, &stats);
    const std::string safeJson = RedactionEngine::serialize(safe);

    const std::string narrative =
      normalizeNarrative(generator_.generate(buildSarPrompt(safeJson)));
    if (narrative.empty()) {
      spdlog::warn("status=error reason=empty-generation redactions={}", stats.summary());
      return {502, {{"error", "model returned empty generation"}}};
    }

    const std::time_t now = clock_();
    const std::string ts = utc_timestamp(now);
    const std::string caseId = storage_case_id(safe);
    const std::string id = uuid4();
    // One document per narrative, even for repeated requests within a second.
    const std::string key = "sar-output/" + caseId + "/" + ts + "-" + id + ".json";

    Record doc = Record::object();
    doc["case_id"] = caseId;
    doc["timestamp"] = ts;
    doc["model"] = generator_.modelName();
    doc["narrative"] = narrative;
    doc["redacted_input"] = safeJson;
    const std::string bytes = RedactionEngine::serialize(doc);
    const std::string path = storage_.put(key, bytes);

    NarrativeRecord rec {
      /*id*/           id,
      /*case_id*/      caseId,
      /*storage_key*/  key,
      /*storage_path*/ path,
      /*bytes*/        static_cast<int64_t>(bytes.size()),
      /*sha256*/       sha256_hex(bytes),
      /*model*/        generator_.modelName(),
      /*created_at*/   static_cast<int64_t>(now)
    };
    store_.insertNarrative(rec);
    store_.appendHistory(rec.id, "CREATED",
                         json({{"source", "/sar"}, {"redactions", stats.total()}}).dump(),
                         rec.created_at, "api");

    // metadata only
    spdlog::info("case={} status=ok key={} redactions={}", caseId, key, stats.summary());
    return {200, {{"id", rec.id}, {"storage_key", key}, {"narrative", narrative}}};
  } catch (const std::exception& e) {
    spdlog::error("status=error err={}", e.what());
    return {502, {{"error", "internal"}}};
  }
}

static json to_json(const NarrativeRecord& r) {
  return {
    {"id", r.id},
    {"case_id", r.case_id},
    {"storage_key", r.storage_key},
    {"bytes", r.bytes},
    {"sha256", r.sha256},
    {"model", r.model},
    {"created_at", r.created_at}
  };
}

SarResponse SarService::listCase(const std::string& caseId) {
  try {
    json items = json::array();
    for (const auto& r : store_.listByCase(caseId)) items.push_back(to_json(r));
    return {200, {{"case_id", caseId}, {"narratives", items}}};
  } catch (const std::exception& e) {
    spdlog::error("status=error op=list err={}", e.what());
    return {500, {{"error", "internal"}}};
  }
}

SarResponse SarService::describe(const std::string& narrativeId) {
  try {
    auto rec = store_.findNarrative(narrativeId);
    if (!rec) return {404, {{"error", "not found"}}};
    json out = to_json(*rec);
    json hist = json::array();
    for (const auto& h : store_.history(narrativeId)) {
      hist.push_back({
        {"event", h.event},
        {"details", json::parse(h.details_json, nullptr, false, false)},
        {"at", h.at},
        {"actor", h.actor}
      });
    }
    out["history"] = hist;
    return {200, out};
  } catch (const std::exception& e) {
    spdlog::error("status=error op=describe err={}", e.what());
    return {500, {{"error", "internal"}}};
  }
}

} // namespace safesar
