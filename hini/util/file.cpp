#include "file.hpp"

#include "logging.hpp"

#include <fmt/std.h>

#include <fstream>
#include <ios>

namespace hini::util
{
  static auto logcat = log::Cat("file");

  static std::streampos
  slurp_file_open(const fs::path& filename, fs::ifstream& in)
  {
    in.exceptions(std::ifstream::failbit | std::ifstream::badbit);
    in.open(filename, std::ios::binary | std::ios::in);
    in.seekg(0, std::ios::end);
    auto size = in.tellg();
    in.seekg(0, std::ios::beg);
    return size;
  }

  std::string
  file_to_string(const fs::path& filename)
  {
    fs::ifstream in;
    std::string contents;
    auto size = slurp_file_open(filename, in);
    contents.resize(size);
    in.read(contents.data(), size);
    log::debug(logcat, "read {} bytes from {}", contents.size(), filename);
    return contents;
  }

  void
  buffer_to_file(const fs::path& filename, std::string_view contents)
  {
    fs::ofstream out;
    out.exceptions(std::ifstream::failbit | std::ifstream::badbit);
    out.open(filename, std::ios::binary | std::ios::out | std::ios::trunc);
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    log::debug(logcat, "wrote {} bytes to {}", contents.size(), filename);
  }

}  // namespace hini::util
