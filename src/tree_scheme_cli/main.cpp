
#include <CLI/CLI.hpp>
#include <cstdio>
#include <cstdlib>
#include <format>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>

#include <tree_scheme/reader.hpp>
#include <tree_scheme/tree_scheme.hpp>
#include <tree_scheme/utility.hpp>

#include <internal_use_only/config.hpp>

namespace {
std::string slurp(std::istream &input)
{
  return { std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>() };
}
}// namespace


int main(int argc, const char **argv)
{
  try {
    CLI::App app{ std::format(
      "{} version {}", tree_scheme::cmake::project_name, tree_scheme::cmake::project_version) };

    std::optional<std::string> script;
    std::optional<std::string> file;
    bool show_version = false;
    bool annotate = false;
    std::string log_level = "info";

    app.add_flag("--version", show_version, "Show version information");
    auto *exec_option = app.add_option("--exec", script, "Script to execute");
    app.add_option("--file", file, "Script file to execute")->check(CLI::ExistingFile)->excludes(exec_option);
    app.add_flag("--annotate", annotate, "Print the result with type annotations");
    app.add_option("--log-level", log_level, "Logging level")
      ->check(CLI::IsMember({ "trace", "debug", "info", "warning", "error", "critical", "off" }));

    CLI11_PARSE(app, argc, argv);

    spdlog::set_level(spdlog::level::from_str(log_level));

    if (show_version) {
      std::puts(std::format("{}", tree_scheme::cmake::project_version).c_str());
      return EXIT_SUCCESS;
    }

    std::string source;
    if (script) {
      source = *script;
    } else if (file) {
      std::ifstream stream(*file);
      if (!stream) {
        spdlog::error("Unable to open script file '{}'", *file);
        return EXIT_FAILURE;
      }
      source = slurp(stream);
    } else {
      spdlog::debug("No script given, reading from standard input");
      source = slurp(std::cin);
    }

    const auto nodes = tree_scheme::read(source);
    if (!nodes) {
      spdlog::error("{}", tree_scheme::to_string(nodes.error()));
      return EXIT_FAILURE;
    }

    spdlog::debug("Evaluating {} top-level expressions", nodes->size());

    const auto result = tree_scheme::interpret(*nodes);
    if (!result) {
      spdlog::error("{}", tree_scheme::to_string(result.error()));
      return EXIT_FAILURE;
    }

    std::cout << tree_scheme::to_string(*result, annotate) << '\n';
  } catch (const std::exception &e) {
    spdlog::error("Unhandled exception in main: {}", e.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
