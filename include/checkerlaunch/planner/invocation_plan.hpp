#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "checkerlaunch/common/diagnostic.hpp"
#include "checkerlaunch/planner/argument_file.hpp"

namespace checkerlaunch::planner {

// Segments of a compiler invocation, in the order they appear on the
// command line. javac reads JVM-level flags and bootstrap overrides at
// startup, so everything before kProcessorPath must precede the processor
// arguments.
enum class Section : uint8_t {
  kExecutable,
  kModuleVisibility,
  kAlternateFrontend,
  kJvmClasspath,
  kMainEntry,
  kAnnotatedStdlib,
  kClasspathReference,
  kProcessorPath,
  kProcessor,
  kProcessingMode,
  kExtraArgs,
  kSourceReference,
};

inline constexpr size_t kSectionCount =
    static_cast<size_t>(Section::kSourceReference) + 1;

auto SectionName(Section section) -> std::string_view;

// An assembled command line plus the argument files it references. The
// files live exactly as long as the plan.
class InvocationPlan {
 public:
  [[nodiscard]] auto Arguments() const -> const std::vector<std::string>& {
    return arguments_;
  }

  // Tokens contributed by one section.
  [[nodiscard]] auto SectionTokens(Section section) const
      -> std::vector<std::string>;

  [[nodiscard]] auto ReferenceFiles() const
      -> const std::vector<ArgumentFile>& {
    return reference_files_;
  }

  // Shell-pasteable rendering, one token per line joined by " \" line
  // continuations.
  [[nodiscard]] auto ToShellString() const -> std::string;

 private:
  friend class InvocationPlanBuilder;

  std::vector<std::string> arguments_;
  std::array<std::pair<size_t, size_t>, kSectionCount> ranges_{};
  std::vector<ArgumentFile> reference_files_;
};

// Collects named sections in any call order; Build() emits them in
// Section order. Setting a section twice replaces its tokens.
class InvocationPlanBuilder {
 public:
  auto Executable(std::string path) -> InvocationPlanBuilder&;
  auto ModuleVisibility(std::vector<std::string> flags)
      -> InvocationPlanBuilder&;
  auto AlternateFrontend(std::string token) -> InvocationPlanBuilder&;
  auto JvmClasspath(std::string classpath) -> InvocationPlanBuilder&;
  auto MainEntry(std::string main_class) -> InvocationPlanBuilder&;
  auto AnnotatedStdlib(std::string token) -> InvocationPlanBuilder&;
  auto ClasspathReference(ArgumentFile file) -> InvocationPlanBuilder&;
  auto ProcessorPath(std::string path) -> InvocationPlanBuilder&;
  auto Processors(const std::vector<std::string>& processors)
      -> InvocationPlanBuilder&;
  auto ProcessingMode(std::string flag) -> InvocationPlanBuilder&;
  auto ExtraArgs(std::vector<std::string> args) -> InvocationPlanBuilder&;
  auto SourceReference(ArgumentFile file) -> InvocationPlanBuilder&;

  // Requires the executable and source reference sections.
  [[nodiscard]] auto Build() && -> Result<InvocationPlan>;

 private:
  auto Slot(Section section) -> std::vector<std::string>&;

  std::array<std::vector<std::string>, kSectionCount> sections_;
  std::vector<ArgumentFile> reference_files_;
};

}  // namespace checkerlaunch::planner
