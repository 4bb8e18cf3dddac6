/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <fstream>
#include <system_error>

#include <qtils/outcome.hpp>

namespace lapphost {

  /**
   * Reads a whole file into `out`, a `std::string` or a byte vector.
   * `out` is left empty on failure.
   */
  template <typename Out>
    requires(sizeof(typename Out::value_type) == 1)
  outcome::result<void> readFile(Out &out, const std::filesystem::path &path) {
    out.clear();
    std::ifstream file{path, std::ios::binary | std::ios::ate};
    if (not file) {
      return std::errc::no_such_file_or_directory;
    }
    out.resize(static_cast<size_t>(file.tellg()));
    file.seekg(0);
    if (not file.read(reinterpret_cast<char *>(out.data()),
                      static_cast<std::streamsize>(out.size()))) {
      out.clear();
      return std::errc::io_error;
    }
    return outcome::success();
  }

}  // namespace lapphost
