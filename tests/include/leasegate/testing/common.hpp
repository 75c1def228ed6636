#pragma once

#include <leasegate/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace leasegate::testing {

inline leasegate::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = leasegate::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline leasegate::schema::ed25519_signer_id make_ed25519_signer(
    const uint8_t seed) {
  auto signer = leasegate::schema::ed25519_signer_id{};
  for (std::size_t i = 0; i < signer.public_key.size(); ++i) {
    signer.public_key[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return signer;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Temporary database directory removed on destruction. Declare it before the
/// storage that lives in it.
class scoped_db_path final {
 public:
  explicit scoped_db_path(const std::string_view prefix)
      : path_{make_db_path(prefix)} {}

  scoped_db_path(const scoped_db_path&) = delete;
  scoped_db_path& operator=(const scoped_db_path&) = delete;

  ~scoped_db_path() { remove_path(path_); }

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

}  // namespace leasegate::testing
