#pragma once

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>

namespace xpcs::util {
namespace fs = std::filesystem;

// Replace `target` with `tmp`. Falls back to remove+rename on filesystems
// where rename does not overwrite.
inline void replace_file(const fs::path& tmp, const fs::path& target) {
  std::error_code ec;
  fs::rename(tmp, target, ec);
  if (!ec) return;

  fs::remove(target, ec);
  ec.clear();
  fs::rename(tmp, target, ec);
  if (ec) {
    throw std::runtime_error("replace_file: cannot move '" + tmp.string() + "' to '" + target.string() + "': " + ec.message());
  }
}

// Write through `<target>.tmp` and rename, so readers never see a half-written file.
template <typename WriteFn>
inline void atomic_write(const fs::path& target, WriteFn&& fn, bool binary = false) {
  fs::path tmp = target;
  tmp += ".tmp";
  {
    std::ofstream ofs(tmp, binary ? std::ios::out | std::ios::binary : std::ios::out);
    if (!ofs) throw std::runtime_error("atomic_write: cannot open '" + tmp.string() + "'");
    fn(ofs);
    ofs.flush();
    if (!ofs) throw std::runtime_error("atomic_write: write failed for '" + tmp.string() + "'");
  }
  replace_file(tmp, target);
}

} // namespace xpcs::util
