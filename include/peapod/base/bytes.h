#ifndef PEAPOD_BASE_BYTES_H
#define PEAPOD_BASE_BYTES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace peapod {

using Bytes = std::vector<uint8_t>;

// Lowercase hex of a byte range
std::string to_hex(const uint8_t* data, size_t size);

template <size_t N>
std::string to_hex(const std::array<uint8_t, N>& bytes) {
    return to_hex(bytes.data(), bytes.size());
}

inline std::string to_hex(const Bytes& bytes) {
    return to_hex(bytes.data(), bytes.size());
}

// Parse hex (either case, no separators). Returns nullopt on odd length or bad digit.
std::optional<Bytes> from_hex(const std::string& text);

// Short form used in log lines
template <size_t N>
std::string short_hex(const std::array<uint8_t, N>& bytes) {
    return to_hex(bytes.data(), N < 4 ? N : 4);
}

} // namespace peapod

#endif // PEAPOD_BASE_BYTES_H
