#include "LocalFSBackend.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace safesar {

static bool escapes_root(const std::filesystem::path& rel) {
  if (rel.empty() || rel.is_absolute() || rel.has_root_name()) return true;
  for (const auto& part : rel) {
    if (part == "..") return true;
  }
  return false;
}

std::string LocalFSBackend::put(const std::string& key, std::string_view bytes) {
  namespace fs = std::filesystem;
  const fs::path rel(key);
  if (escapes_root(rel)) throw std::invalid_argument("storage key outside root: " + key);

  fs::path file = fs::path(root_) / rel;
  fs::create_directories(file.parent_path());
  if (fs::exists(file)) throw std::runtime_error("refusing to overwrite: " + key);
  std::ofstream os(file, std::ios::binary);
  if (!os) throw std::runtime_error("cannot open for write: " + file.string());
  os.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  os.flush();
  if (!os) throw std::runtime_error("write failed: " + file.string());
  return fs::weakly_canonical(file).string();
}

} // namespace safesar
