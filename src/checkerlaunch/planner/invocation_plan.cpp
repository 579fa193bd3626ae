#include "checkerlaunch/planner/invocation_plan.hpp"

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "checkerlaunch/common/diagnostic.hpp"
#include "checkerlaunch/common/string_utils.hpp"
#include "checkerlaunch/planner/argument_file.hpp"

namespace checkerlaunch::planner {

auto SectionName(Section section) -> std::string_view {
  switch (section) {
    case Section::kExecutable:
      return "executable";
    case Section::kModuleVisibility:
      return "module visibility";
    case Section::kAlternateFrontend:
      return "alternate frontend";
    case Section::kJvmClasspath:
      return "jvm classpath";
    case Section::kMainEntry:
      return "main entry";
    case Section::kAnnotatedStdlib:
      return "annotated stdlib";
    case Section::kClasspathReference:
      return "classpath reference";
    case Section::kProcessorPath:
      return "processor path";
    case Section::kProcessor:
      return "processor";
    case Section::kProcessingMode:
      return "processing mode";
    case Section::kExtraArgs:
      return "extra arguments";
    case Section::kSourceReference:
      return "source reference";
  }
  return "unknown";
}

auto InvocationPlan::SectionTokens(Section section) const
    -> std::vector<std::string> {
  auto [begin, end] = ranges_[static_cast<size_t>(section)];
  return {
      arguments_.begin() + static_cast<std::ptrdiff_t>(begin),
      arguments_.begin() + static_cast<std::ptrdiff_t>(end)};
}

auto InvocationPlan::ToShellString() const -> std::string {
  std::string result;
  for (size_t i = 0; i < arguments_.size(); ++i) {
    if (i > 0) {
      result += " \\\n  ";
    }
    result += common::ShellQuote(arguments_[i]);
  }
  return result;
}

auto InvocationPlanBuilder::Slot(Section section) -> std::vector<std::string>& {
  return sections_[static_cast<size_t>(section)];
}

auto InvocationPlanBuilder::Executable(std::string path)
    -> InvocationPlanBuilder& {
  Slot(Section::kExecutable) = {std::move(path)};
  return *this;
}

auto InvocationPlanBuilder::ModuleVisibility(std::vector<std::string> flags)
    -> InvocationPlanBuilder& {
  Slot(Section::kModuleVisibility) = std::move(flags);
  return *this;
}

auto InvocationPlanBuilder::AlternateFrontend(std::string token)
    -> InvocationPlanBuilder& {
  Slot(Section::kAlternateFrontend) = {std::move(token)};
  return *this;
}

auto InvocationPlanBuilder::JvmClasspath(std::string classpath)
    -> InvocationPlanBuilder& {
  Slot(Section::kJvmClasspath) = {"-cp", std::move(classpath)};
  return *this;
}

auto InvocationPlanBuilder::MainEntry(std::string main_class)
    -> InvocationPlanBuilder& {
  Slot(Section::kMainEntry) = {std::move(main_class)};
  return *this;
}

auto InvocationPlanBuilder::AnnotatedStdlib(std::string token)
    -> InvocationPlanBuilder& {
  Slot(Section::kAnnotatedStdlib) = {std::move(token)};
  return *this;
}

auto InvocationPlanBuilder::ClasspathReference(ArgumentFile file)
    -> InvocationPlanBuilder& {
  Slot(Section::kClasspathReference) = {file.Reference()};
  reference_files_.push_back(std::move(file));
  return *this;
}

auto InvocationPlanBuilder::ProcessorPath(std::string path)
    -> InvocationPlanBuilder& {
  Slot(Section::kProcessorPath) = {"-processorpath", std::move(path)};
  return *this;
}

auto InvocationPlanBuilder::Processors(
    const std::vector<std::string>& processors) -> InvocationPlanBuilder& {
  Slot(Section::kProcessor) = {"-processor", common::Join(processors, ",")};
  return *this;
}

auto InvocationPlanBuilder::ProcessingMode(std::string flag)
    -> InvocationPlanBuilder& {
  Slot(Section::kProcessingMode) = {std::move(flag)};
  return *this;
}

auto InvocationPlanBuilder::ExtraArgs(std::vector<std::string> args)
    -> InvocationPlanBuilder& {
  Slot(Section::kExtraArgs) = std::move(args);
  return *this;
}

auto InvocationPlanBuilder::SourceReference(ArgumentFile file)
    -> InvocationPlanBuilder& {
  Slot(Section::kSourceReference) = {file.Reference()};
  reference_files_.push_back(std::move(file));
  return *this;
}

auto InvocationPlanBuilder::Build() && -> Result<InvocationPlan> {
  if (Slot(Section::kExecutable).empty()) {
    return std::unexpected(
        Diagnostic::ConfigError("invocation has no executable"));
  }
  if (Slot(Section::kSourceReference).empty()) {
    return std::unexpected(
        Diagnostic::ConfigError("invocation has no source files"));
  }

  InvocationPlan plan;
  for (size_t i = 0; i < kSectionCount; ++i) {
    size_t begin = plan.arguments_.size();
    for (auto& token : sections_[i]) {
      plan.arguments_.push_back(std::move(token));
    }
    plan.ranges_[i] = {begin, plan.arguments_.size()};
  }
  plan.reference_files_ = std::move(reference_files_);
  return plan;
}

}  // namespace checkerlaunch::planner
