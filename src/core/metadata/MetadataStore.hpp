#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace safesar {

struct NarrativeRecord {
  std::string id;
  std::string case_id;
  std::string storage_key;
  std::string storage_path;
  int64_t     bytes;
  std::string sha256;
  std::string model;
  int64_t     created_at;
};

struct HistoryEntry {
  std::string event;
  std::string details_json;
  int64_t     at;
  std::string actor;
};

class MetadataStore {
public:
  explicit MetadataStore(const std::string& dbPath);
  ~MetadataStore();
  MetadataStore(const MetadataStore&) = delete;
  MetadataStore& operator=(const MetadataStore&) = delete;

  void insertNarrative(const NarrativeRecord& r);
  void appendHistory(const std::string& narrative_id,
                     const std::string& event,
                     const std::string& details_json,
                     int64_t at,
                     const std::string& actor);

  std::optional<NarrativeRecord> findNarrative(const std::string& id);
  // Newest first.
  std::vector<NarrativeRecord> listByCase(const std::string& case_id);
  std::vector<HistoryEntry> history(const std::string& narrative_id);

private:
  void* db_; // sqlite3*
  std::mutex mu_;
};

} // namespace safesar
