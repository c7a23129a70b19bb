#pragma once
#include <ctime>
#include <functional>
#include <string>

#include <nlohmann/json.hpp>

#include "core/redaction/RedactionEngine.hpp"

namespace safesar {

class LocalFSBackend;
class MetadataStore;
class NarrativeGenerator;

struct SarResponse {
  int            status;
  nlohmann::json body;
};

// Request flow behind POST /sar: parse, redact, generate, persist.
class SarService {
public:
  using Clock = std::function<std::time_t()>;

  SarService(const RedactionEngine& engine,
             NarrativeGenerator& generator,
             LocalFSBackend& storage,
             MetadataStore& store,
             Clock clock = [] { return std::time(nullptr); });

  // Never throws. body carries either the result or {"error": ...}.
  SarResponse handle(const std::string& requestBody);

  // Stored narratives for a (path-safe) case id, newest first.
  SarResponse listCase(const std::string& caseId);
  // One stored narrative with its history; 404 when unknown.
  SarResponse describe(const std::string& narrativeId);

  // Preview of what would be sent to the model for rawCase.
  std::string redact(const std::string& rawCase) const;

private:
  const RedactionEngine& engine_;
  NarrativeGenerator&    generator_;
  LocalFSBackend&        storage_;
  MetadataStore&         store_;
  Clock                  clock_;
};

// "YYYYMMDDTHHMMSSZ" in UTC.
std::string utc_timestamp(std::time_t t);

// case_id of a sanitized record as a path-safe string, or "NA". Long ids
// are cut and suffixed with a digest of the full id.
std::string storage_case_id(const Record& safeRecord);

} // namespace safesar
