/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <system_error>

#include <qtils/bytes.hpp>

#include "outcome/outcome.hpp"

namespace vigil {

  inline outcome::result<qtils::Bytes> readFile(
      const std::filesystem::path &path) {
    std::ifstream file{path, std::ios::binary | std::ios::ate};
    if (not file.good()) {
      return std::errc{errno};
    }
    qtils::Bytes out(static_cast<size_t>(file.tellg()));
    file.seekg(0);
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    file.read(reinterpret_cast<char *>(out.data()),
              static_cast<std::streamsize>(out.size()));
    if (not file.good()) {
      return std::errc{errno};
    }
    return out;
  }

  inline outcome::result<void> writeFile(const std::filesystem::path &path,
                                         qtils::BytesIn data) {
    std::ofstream file{path, std::ios::binary | std::ios::trunc};
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    if (file
        and file.write(reinterpret_cast<const char *>(data.data()),
                       static_cast<std::streamsize>(data.size()))
        and file.flush()) {
      return outcome::success();
    }
    return std::errc{errno};
  }

  /**
   * Writes `data` next to `path` and renames it over `path`, so a reader
   * sees either the previous content or the new one, never a torn file.
   */
  inline outcome::result<void> writeFileTmp(const std::filesystem::path &path,
                                            qtils::BytesIn data) {
    auto tmp = path;
    tmp += ".tmp";
    OUTCOME_TRY(writeFile(tmp, data));
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
      return ec;
    }
    return outcome::success();
  }

}  // namespace vigil
