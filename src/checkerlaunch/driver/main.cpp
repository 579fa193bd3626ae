#include <argparse/argparse.hpp>
#include <exception>
#include <filesystem>
#include <format>
#include <iostream>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "commands.hpp"
#include "print.hpp"

namespace {

// Split the attached processor option form: -Akey=value -> -A key=value
auto PreprocessArgs(std::span<char*> argv) -> std::vector<std::string> {
  std::vector<std::string> result;
  for (char* raw_arg : argv) {
    std::string_view arg = raw_arg;
    if (arg.size() > 2 && arg.starts_with("-A")) {
      result.emplace_back(arg.substr(0, 2));
      result.emplace_back(arg.substr(2));
    } else {
      result.emplace_back(arg);
    }
  }
  return result;
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  namespace driver = checkerlaunch::driver;
  auto args = PreprocessArgs(std::span<char*>(argv, static_cast<size_t>(argc)));

  argparse::ArgumentParser program("checkerlaunch", "0.1.0");
  program.add_description(
      "Run Checker Framework type checkers over a Java project");
  program.add_argument("-C").help("Run as if started in <dir>").metavar("dir");

  // Subcommand: check
  argparse::ArgumentParser check_cmd("check");
  check_cmd.add_description("Run the configured checkers");
  driver::AddProjectFlags(check_cmd);

  // Subcommand: plan
  argparse::ArgumentParser plan_cmd("plan");
  plan_cmd.add_description("Print the checker command line without running it");
  driver::AddProjectFlags(plan_cmd);

  // Subcommand: versions
  argparse::ArgumentParser versions_cmd("versions");
  versions_cmd.add_description(
      "Show detected Java versions and compatibility decisions");
  driver::AddProjectFlags(versions_cmd);

  program.add_subparser(check_cmd);
  program.add_subparser(plan_cmd);
  program.add_subparser(versions_cmd);

  try {
    program.parse_args(args);
  } catch (const std::exception& err) {
    driver::PrintError(err.what());
    std::cerr << program;
    return driver::kExitError;
  }

  // Handle -C before dispatching subcommands
  if (auto dir = program.present("-C")) {
    std::error_code ec;
    std::filesystem::current_path(*dir, ec);
    if (ec) {
      driver::PrintError(
          std::format("cannot change to '{}': {}", *dir, ec.message()));
      return driver::kExitError;
    }
  }

  try {
    if (program.is_subcommand_used("check")) {
      return driver::CheckCommand(check_cmd);
    }
    if (program.is_subcommand_used("plan")) {
      return driver::PlanCommand(plan_cmd);
    }
    if (program.is_subcommand_used("versions")) {
      return driver::VersionsCommand(versions_cmd);
    }
  } catch (const std::exception& e) {
    driver::PrintError(e.what());
    return driver::kExitError;
  }

  // No subcommand provided
  std::cout << program;
  return driver::kExitSuccess;
}
