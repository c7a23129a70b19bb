#include "MetadataStore.hpp"
#include <stdexcept>
#include <sqlite3.h>

namespace safesar {

namespace {

// Finalizes the statement on scope exit.
struct Stmt {
  sqlite3_stmt* st = nullptr;
  ~Stmt() { sqlite3_finalize(st); }
};

void prepare(sqlite3* db, const char* sql, Stmt& s) {
  if (sqlite3_prepare_v2(db, sql, -1, &s.st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("prepare failed: ") + sqlite3_errmsg(db));
  }
}

std::string column_text(sqlite3_stmt* st, int col) {
  const unsigned char* p = sqlite3_column_text(st, col);
  return p ? reinterpret_cast<const char*>(p) : std::string();
}

NarrativeRecord read_narrative(sqlite3_stmt* st) {
  int i = 0;
  NarrativeRecord r;
  r.id           = column_text(st, i++);
  r.case_id      = column_text(st, i++);
  r.storage_key  = column_text(st, i++);
  r.storage_path = column_text(st, i++);
  r.bytes        = sqlite3_column_int64(st, i++);
  r.sha256       = column_text(st, i++);
  r.model        = column_text(st, i++);
  r.created_at   = sqlite3_column_int64(st, i++);
  return r;
}

const char* kSelectNarrative =
  "SELECT id, case_id, storage_key, storage_path, bytes, sha256, model, created_at "
  "FROM narratives ";

} // namespace

MetadataStore::MetadataStore(const std::string& dbPath) : db_(nullptr) {
  sqlite3* db=nullptr;
  if (sqlite3_open_v2(dbPath.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX, nullptr)!=SQLITE_OK) {
    sqlite3_close(db);
    throw std::runtime_error("failed to open db: " + dbPath);
  }
  if (sqlite3_exec(db, "PRAGMA foreign_keys=ON;", nullptr, nullptr, nullptr) != SQLITE_OK ||
      sqlite3_busy_timeout(db, 5000) != SQLITE_OK) {
    std::string err = sqlite3_errmsg(db);
    sqlite3_close(db);
    throw std::runtime_error("failed to configure db: " + err);
  }
  db_ = db;
}

MetadataStore::~MetadataStore() {
  sqlite3_close(static_cast<sqlite3*>(db_));
}

void MetadataStore::insertNarrative(const NarrativeRecord& r) {
  auto* db = static_cast<sqlite3*>(db_);
  std::lock_guard<std::mutex> lock(mu_);
  const char* sql = R"SQL(
    INSERT INTO narratives
      (id, case_id, storage_key, storage_path, bytes, sha256, model, created_at)
    VALUES (?,?,?,?,?,?,?,?)
  )SQL";
  Stmt s;
  prepare(db, sql, s);
  int i=1;
  sqlite3_bind_text(s.st, i++, r.id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(s.st, i++, r.case_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(s.st, i++, r.storage_key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(s.st, i++, r.storage_path.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(s.st, i++, r.bytes);
  sqlite3_bind_text(s.st, i++, r.sha256.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(s.st, i++, r.model.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(s.st, i++, r.created_at);

  if (sqlite3_step(s.st) != SQLITE_DONE) {
    throw std::runtime_error(std::string("insertNarrative failed: ") + sqlite3_errmsg(db));
  }
}

void MetadataStore::appendHistory(const std::string& narrative_id,
                                  const std::string& event,
                                  const std::string& details_json,
                                  int64_t at,
                                  const std::string& actor) {
  auto* db = static_cast<sqlite3*>(db_);
  std::lock_guard<std::mutex> lock(mu_);
  const char* sql = R"SQL(
    INSERT INTO narrative_history (narrative_id, event, details, at, actor)
    VALUES (?,?,?,?,?)
  )SQL";
  Stmt s;
  prepare(db, sql, s);
  sqlite3_bind_text(s.st, 1, narrative_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(s.st, 2, event.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(s.st, 3, details_json.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(s.st, 4, at);
  sqlite3_bind_text(s.st, 5, actor.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(s.st) != SQLITE_DONE) {
    throw std::runtime_error(std::string("appendHistory failed: ") + sqlite3_errmsg(db));
  }
}

std::optional<NarrativeRecord> MetadataStore::findNarrative(const std::string& id) {
  auto* db = static_cast<sqlite3*>(db_);
  std::lock_guard<std::mutex> lock(mu_);
  Stmt s;
  prepare(db, (std::string(kSelectNarrative) + "WHERE id = ?").c_str(), s);
  sqlite3_bind_text(s.st, 1, id.c_str(), -1, SQLITE_TRANSIENT);
  const int rc = sqlite3_step(s.st);
  if (rc == SQLITE_ROW) return read_narrative(s.st);
  if (rc != SQLITE_DONE) throw std::runtime_error(std::string("findNarrative failed: ") + sqlite3_errmsg(db));
  return std::nullopt;
}

std::vector<NarrativeRecord> MetadataStore::listByCase(const std::string& case_id) {
  auto* db = static_cast<sqlite3*>(db_);
  std::lock_guard<std::mutex> lock(mu_);
  Stmt s;
  prepare(db, (std::string(kSelectNarrative) + "WHERE case_id = ? ORDER BY created_at DESC, storage_key DESC").c_str(), s);
  sqlite3_bind_text(s.st, 1, case_id.c_str(), -1, SQLITE_TRANSIENT);
  std::vector<NarrativeRecord> out;
  int rc;
  while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) out.push_back(read_narrative(s.st));
  if (rc != SQLITE_DONE) throw std::runtime_error(std::string("listByCase failed: ") + sqlite3_errmsg(db));
  return out;
}

std::vector<HistoryEntry> MetadataStore::history(const std::string& narrative_id) {
  auto* db = static_cast<sqlite3*>(db_);
  std::lock_guard<std::mutex> lock(mu_);
  Stmt s;
  prepare(db, "SELECT event, details, at, actor FROM narrative_history WHERE narrative_id = ? ORDER BY seq", s);
  sqlite3_bind_text(s.st, 1, narrative_id.c_str(), -1, SQLITE_TRANSIENT);
  std::vector<HistoryEntry> out;
  int rc;
  while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) {
    out.push_back(HistoryEntry{column_text(s.st, 0), column_text(s.st, 1),
                               sqlite3_column_int64(s.st, 2), column_text(s.st, 3)});
  }
  if (rc != SQLITE_DONE) throw std::runtime_error(std::string("history failed: ") + sqlite3_errmsg(db));
  return out;
}

} // namespace safesar
