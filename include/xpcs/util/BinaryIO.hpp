#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <limits>
#include <ostream>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace xpcs::util {

// Native-endian POD stream writer for checkpoint files.
class BinaryWriter {
public:
  explicit BinaryWriter(std::ostream& os) : os_(os) {
    if (!os_) throw std::runtime_error("BinaryWriter: output stream is in a failed state");
  }

  void bytes(const void* data, std::size_t n) {
    os_.write(static_cast<const char*>(data), static_cast<std::streamsize>(n));
    if (!os_) throw std::runtime_error("BinaryWriter: write failed");
  }

  template <typename T>
  void pod(const T& v) {
    static_assert(std::is_trivially_copyable_v<T>, "BinaryWriter::pod requires a trivially copyable type");
    bytes(&v, sizeof(T));
  }

  void u8(std::uint8_t v) { pod(v); }
  void u64(std::uint64_t v) { pod(v); }
  void f64(double v) { pod(v); }

  // Length-prefixed array.
  template <typename T>
  void array(std::span<const T> v) {
    static_assert(std::is_trivially_copyable_v<T>, "BinaryWriter::array requires a trivially copyable type");
    u64(static_cast<std::uint64_t>(v.size()));
    if (!v.empty()) bytes(v.data(), sizeof(T) * v.size());
  }

  template <typename T>
  void array(const std::vector<T>& v) { array(std::span<const T>(v.data(), v.size())); }

private:
  std::ostream& os_;
};

class BinaryReader {
public:
  explicit BinaryReader(std::istream& is) : is_(is) {
    if (!is_) throw std::runtime_error("BinaryReader: input stream is in a failed state");
  }

  void bytes(void* data, std::size_t n) {
    is_.read(static_cast<char*>(data), static_cast<std::streamsize>(n));
    if (!is_) throw std::runtime_error("BinaryReader: unexpected end of data (truncated checkpoint?)");
  }

  template <typename T>
  T pod() {
    static_assert(std::is_trivially_copyable_v<T>, "BinaryReader::pod requires a trivially copyable type");
    T v{};
    bytes(&v, sizeof(T));
    return v;
  }

  std::uint8_t u8() { return pod<std::uint8_t>(); }
  std::uint64_t u64() { return pod<std::uint64_t>(); }
  double f64() { return pod<double>(); }

  // Reads a length-prefixed array; the stored length must equal `expected`
  // unless expected == npos.
  template <typename T>
  void array(std::vector<T>& v, std::size_t expected = npos) {
    static_assert(std::is_trivially_copyable_v<T>, "BinaryReader::array requires a trivially copyable type");
    const std::size_t n = size_();
    if (expected != npos && n != expected) {
      throw std::runtime_error("BinaryReader: array length " + std::to_string(n) +
                               " does not match expected " + std::to_string(expected));
    }
    v.resize(n);
    if (n > 0) bytes(v.data(), sizeof(T) * n);
  }

  static constexpr std::size_t npos = std::numeric_limits<std::size_t>::max();

private:
  std::istream& is_;

  std::size_t size_() {
    const std::uint64_t n = u64();
    if (n > static_cast<std::uint64_t>(std::numeric_limits<std::size_t>::max() / 8)) {
      throw std::runtime_error("BinaryReader: length field out of range (corrupt checkpoint?)");
    }
    return static_cast<std::size_t>(n);
  }
};

inline void write_magic(std::ostream& os, std::string_view magic) {
  os.write(magic.data(), static_cast<std::streamsize>(magic.size()));
  if (!os) throw std::runtime_error("BinaryWriter: failed to write magic '" + std::string(magic) + "'");
}

inline void expect_magic(std::istream& is, std::string_view magic) {
  std::string got(magic.size(), '\0');
  is.read(got.data(), static_cast<std::streamsize>(magic.size()));
  if (!is || got != magic) {
    throw std::runtime_error("BinaryReader: expected magic '" + std::string(magic) + "' (not an xpcscorr checkpoint?)");
  }
}

} // namespace xpcs::util
