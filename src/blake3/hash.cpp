#include <blake3.h>
#include <leasegate/blake3/hash.hpp>

namespace leasegate::blake3 {

namespace {

class hasher final {
 public:
  hasher() { blake3_hasher_init(&state_); }

  explicit hasher(const std::string_view& context) {
    blake3_hasher_init_derive_key_raw(&state_, context.data(), context.size());
  }

  hasher& update(const void* data, const std::size_t size) {
    blake3_hasher_update(&state_, data, size);
    return *this;
  }

  leasegate::schema::hash32_t finalize() const {
    static_assert(BLAKE3_OUT_LEN == 32);
    auto output = leasegate::schema::hash32_t{};
    blake3_hasher_finalize(&state_, output.data(), output.size());
    return output;
  }

 private:
  blake3_hasher state_{};
};

}  // namespace

leasegate::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str.data(), str.size()).finalize();
}

leasegate::schema::hash32_t hash(const leasegate::schema::bytes_view_t& bytes) {
  return hasher{}.update(bytes.data(), bytes.size()).finalize();
}

leasegate::schema::hash32_t derive(
    const std::string_view& context,
    const leasegate::schema::bytes_view_t& bytes) {
  return hasher{context}.update(bytes.data(), bytes.size()).finalize();
}

}  // namespace leasegate::blake3
