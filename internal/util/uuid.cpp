#include "uuid.hpp"

#include <random>

namespace artifact::util {

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID id{};
  for (std::size_t i = 0; i < id.size(); i += 8) {
    auto bits = rng();
    for (std::size_t j = 0; j < 8; ++j, bits >>= 8) id[i + j] = static_cast<uint8_t>(bits);
  }

  // RFC4122 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

std::string ToString(const UUID& id) {
  static constexpr char kHex[] = "0123456789abcdef";

  std::string out;
  out.reserve(36);
  for (std::size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
    out.push_back(kHex[id[i] >> 4]);
    out.push_back(kHex[id[i] & 0x0F]);
  }
  return out;
}

} // namespace artifact::util
