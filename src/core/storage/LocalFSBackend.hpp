#pragma once
#include <string>
#include <string_view>

namespace safesar {

class LocalFSBackend {
public:
  explicit LocalFSBackend(std::string root)
    : root_(std::move(root)) {}

  // Writes bytes to <root>/<key>, creating parent directories; returns the
  // full path. Throws std::invalid_argument for keys that would leave root
  // and std::runtime_error when the key already exists or the write fails.
  std::string put(const std::string& key, std::string_view bytes);

private:
  std::string root_;
};

} // namespace safesar
