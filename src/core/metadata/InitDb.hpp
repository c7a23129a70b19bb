#pragma once
#include <string>

namespace safesar {
  // Opens (creating if needed) the SQLite file at dbPath and applies the
  // schema at schemaPath. Safe to run on every start. Throws on failure.
  bool initDatabase(const std::string& dbPath, const std::string& schemaPath);
}
