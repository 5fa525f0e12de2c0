#include <hini.hpp>
#include <hini/util/logging.hpp>
#include <hini/util/str.hpp>

#include <fmt/core.h>

#include <CLI/App.hpp>
#include <CLI/Config.hpp>
#include <CLI/Formatter.hpp>

#include <algorithm>
#include <cstdio>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace
{
  auto logcat = hini::log::Cat("main");

  struct command_line_options
  {
    // bool options
    bool version = false;
    bool verbose = false;
    bool no_lookups = false;
    bool plain = false;
    bool dump = false;

    // string options
    std::string config_path;
    std::vector<std::string> get;
    std::optional<std::string> section;
    std::optional<std::string> output;
    std::string log_level = "warning";
  };

  // Takes a code, prints a message, and returns the code.  Intended use is:
  //     return exit_error(1, "blah: {}", 42);
  // from within main().
  template <typename... T>
  [[nodiscard]] int
  exit_error(int code, const std::string& format, T&&... args)
  {
    fmt::print(stderr, fmt::runtime(format), std::forward<T>(args)...);
    fmt::print(stderr, "\n");
    return code;
  }

  /// Prints the value at a dotted "section.key" path; "key" and ".key" name keys of the root.
  void
  print_value(hini::Document& doc, std::string_view path, const hini::Format& format)
  {
    path = hini::strip_prefix(path, std::string_view{&format.path_separator, 1});
    auto section = doc.root();
    auto name = path;
    if (auto pos = path.rfind(format.path_separator); pos != std::string_view::npos)
    {
      section = section.resolve_section(path.substr(0, pos), format.path_separator);
      name = path.substr(pos + 1);
    }
    fmt::print("{}\n", section.get_key(name));
  }

  void
  print_section(hini::Document& doc, std::string_view path, const hini::Format& format)
  {
    auto section = doc.root().resolve_section(path, format.path_separator);
    std::vector<std::pair<std::string, std::string>> keys{
        section.keys().begin(), section.keys().end()};
    std::sort(keys.begin(), keys.end());
    for (const auto& [key, value] : keys)
      fmt::print("{} {} {}\n", key, format.assignment, value);
  }

}  // namespace

int
main(int argc, char* argv[])
{
  CLI::App cli{"Reads hierarchical ini files, resolving inheritance and %lookups%", "hini"};
  command_line_options options{};

  // flags: boolean values in command_line_options struct
  cli.add_flag("--version", options.version, "Print the version and exit");
  cli.add_flag("-v,--verbose", options.verbose, "Log at debug level");
  cli.add_flag("--no-lookups", options.no_lookups, "Leave %path% references unresolved");
  cli.add_flag("--plain", options.plain, "No escapes, multi-line quotes or line continuations");
  cli.add_flag("--dump", options.dump, "Print the whole document (the default)");

  // options: string values in command_line_options struct
  cli.add_option("config", options.config_path, "File to read")->type_name("FILE");
  cli.add_option("-g,--get", options.get, "Print the value at section.key (repeatable)")
      ->type_name("PATH");
  cli.add_option("-s,--section", options.section, "Print the keys of a section")
      ->type_name("PATH");
  cli.add_option("-o,--output", options.output, "Write the document to a file")
      ->type_name("FILE");
  cli.add_option(
         "--log-level", options.log_level, "Log verbosity level, see log levels for accepted values")
      ->type_name("LEVEL")
      ->capture_default_str();

  try
  {
    cli.parse(argc, argv);
  }
  catch (const CLI::ParseError& e)
  {
    return cli.exit(e);
  }

  if (options.version)
  {
    fmt::print("hini {}.{}.{}\n", HINI_VERSION_MAJOR, HINI_VERSION_MINOR, HINI_VERSION_PATCH);
    return 0;
  }

  if (options.config_path.empty())
    return exit_error(3, "No config file given, see --help");

  hini::log::add_sink(hini::log::Type::Print, "stderr");
  try
  {
    hini::log::reset_level(
        options.verbose ? hini::log::Level::debug
                        : hini::log::level_from_string(options.log_level));
  }
  catch (const std::invalid_argument& e)
  {
    return exit_error(3, "Invalid --log-level: {}", e.what());
  }

  const auto format = options.plain ? hini::Format::plain() : hini::Format{};

  try
  {
    auto doc = hini::Document::from_file(options.config_path, not options.no_lookups, format);

    for (const auto& path : options.get)
      print_value(doc, path, format);
    if (options.section)
      print_section(doc, *options.section, format);
    if (options.output)
      doc.save(*options.output, format);

    if (options.dump or (options.get.empty() and not options.section and not options.output))
      fmt::print("{}", doc.to_string(format));
  }
  catch (const hini::ini_error& e)
  {
    hini::log::error(logcat, "{}: {}", options.config_path, e.what());
    return 1;
  }
  catch (const std::invalid_argument& e)
  {
    hini::log::error(logcat, "{}: {}", options.config_path, e.what());
    return 1;
  }
  catch (const std::system_error& e)
  {
    hini::log::error(logcat, "{}: {}", options.config_path, e.what());
    return 2;
  }

  return 0;
}
