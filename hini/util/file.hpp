#pragma once
#include "fs.hpp"

#include <string>
#include <string_view>

namespace hini::util
{
  /// Reads a file from disk into a string.  Throws on error.
  std::string
  file_to_string(const fs::path& filename);

  /// Dumps string contents to disk. The file is overwritten if it already exists.  Throws on
  /// error.
  void
  buffer_to_file(const fs::path& filename, std::string_view contents);

}  // namespace hini::util
