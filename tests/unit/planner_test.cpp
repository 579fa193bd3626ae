#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "checkerlaunch/artifact/artifact.hpp"
#include "checkerlaunch/artifact/resolution_tier.hpp"
#include "checkerlaunch/artifact/resolver.hpp"
#include "checkerlaunch/common/diagnostic.hpp"
#include "checkerlaunch/config/build_context.hpp"
#include "checkerlaunch/config/project_config.hpp"
#include "checkerlaunch/lombok/lombok.hpp"
#include "checkerlaunch/planner/invocation_plan.hpp"
#include "checkerlaunch/planner/planner.hpp"
#include "checkerlaunch/version/version.hpp"
#include "tests/unit/test_support.hpp"

namespace checkerlaunch::planner {
namespace {

namespace fs = std::filesystem;

using Tokens = std::vector<std::string>;

auto ReadLines(const fs::path& path) -> Tokens {
  Tokens lines;
  std::ifstream in(path);
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }
  return lines;
}

class PlannerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    repo_ = dir_.MakeDir("m2");
    checker_jar_ = AddToRepository(artifact::kCheckerName, "3.53.0");
    qual_jar_ = AddToRepository(artifact::kCheckerQualName, "3.53.0");

    source_a_ = dir_.Touch("project/src/main/java/com/example/A.java");
    source_b_ = dir_.Touch("project/src/main/java/com/example/B.java");
    dir_.Touch("project/src/test/java/com/example/ATest.java");

    build_.name = "demo";
    build_.base_dir = dir_.Path() / "project";
    build_.build_dir = build_.base_dir / "target";
    build_.source_roots = {
        {.path = build_.base_dir / "src/main/java",
         .scope = config::SourceScope::kMain,
         .enabled = true},
        {.path = build_.base_dir / "src/test/java",
         .scope = config::SourceScope::kTest,
         .enabled = true},
    };
    build_.properties[version::kSourceProperty] = "11";
    build_.classpath = {"/opt/libs/guava.jar"};

    options_.processors = {
        "org.checkerframework.checker.nullness.NullnessChecker"};
    options_.executable = WriteFakeCompiler("javac", 0).string();
  }

  auto AddToRepository(const std::string& name, const std::string& version,
                       const std::string& group = artifact::kCheckerGroup)
      -> fs::path {
    auto path = artifact::RepositoryPath(
        repo_, {.group = group, .name = name, .version = version});
    fs::create_directories(path.parent_path());
    std::ofstream(path) << "jar";
    return path;
  }

  // A compiler stand-in: records its argv and the contents of every @file
  // it was given, prints one error and one warning line, exits with `status`.
  auto WriteFakeCompiler(const std::string& name, int status) -> fs::path {
    auto record = (dir_.Path() / "invocation.txt").string();
    auto argfiles = (dir_.Path() / "argfiles.txt").string();
    return test::WriteScript(
        dir_, fs::path("bin") / name,
        std::format(
            ": > '{0}'\n"
            ": > '{1}'\n"
            "for a in \"$@\"; do\n"
            "  echo \"$a\" >> '{0}'\n"
            "  case \"$a\" in @*) cat \"${{a#@}}\" >> '{1}' ;; esac\n"
            "done\n"
            "echo 'A.java:3: error: [assignment] incompatible types'\n"
            "echo 'A.java:5: warning: [cast] redundant cast'\n"
            "echo 'Note: 1 error'\n"
            "exit {2}\n",
            record, argfiles, status));
  }

  auto MakeResolver() -> std::unique_ptr<artifact::ArtifactResolver> {
    std::vector<std::unique_ptr<artifact::ResolutionTier>> tiers;
    tiers.push_back(std::make_unique<artifact::DeclaredDependencyTier>(build_));
    tiers.push_back(std::make_unique<artifact::LocalCacheTier>(repo_));
    return std::make_unique<artifact::ArtifactResolver>(
        std::move(tiers), log_.Logger());
  }

  auto Plan(const std::string& runtime = "17.0.1") -> Result<PlanOutcome> {
    host_ = std::make_unique<test::FakeHostRuntime>(runtime);
    resolver_ = MakeResolver();
    InvocationPlanner planner(
        build_, options_, *resolver_, *host_, log_.Logger());
    return planner.Plan();
  }

  auto Run(const std::string& runtime = "17.0.1") -> Result<RunOutcome> {
    host_ = std::make_unique<test::FakeHostRuntime>(runtime);
    resolver_ = MakeResolver();
    InvocationPlanner planner(
        build_, options_, *resolver_, *host_, log_.Logger());
    return RunCheck(planner, options_, build_.base_dir, *log_.Logger());
  }

  test::TempDir dir_;
  test::CapturedLog log_;
  fs::path repo_;
  fs::path checker_jar_;
  fs::path qual_jar_;
  fs::path source_a_;
  fs::path source_b_;
  config::BuildContext build_;
  config::CheckerOptions options_;
  std::unique_ptr<test::FakeHostRuntime> host_;
  std::unique_ptr<artifact::ArtifactResolver> resolver_;
};

// =============================================================================
// Plan assembly
// =============================================================================

TEST_F(PlannerTest, ModernRuntimeArgumentOrder) {
  auto outcome = Plan();
  ASSERT_TRUE(outcome.has_value()) << outcome.error().primary.message;
  ASSERT_TRUE(std::holds_alternative<InvocationPlan>(*outcome));
  const auto& plan = std::get<InvocationPlan>(*outcome);
  const auto& args = plan.Arguments();

  EXPECT_EQ(args.front(), options_.executable);

  auto modules = plan.SectionTokens(Section::kModuleVisibility);
  ASSERT_EQ(modules.size(), 10U);
  EXPECT_EQ(
      modules.front(),
      "-J--add-exports=jdk.compiler/com.sun.tools.javac.api=ALL-UNNAMED");
  EXPECT_EQ(
      modules.back(),
      "-J--add-opens=jdk.compiler/com.sun.tools.javac.comp=ALL-UNNAMED");

  EXPECT_TRUE(plan.SectionTokens(Section::kAlternateFrontend).empty());
  EXPECT_TRUE(plan.SectionTokens(Section::kAnnotatedStdlib).empty());
  EXPECT_TRUE(plan.SectionTokens(Section::kMainEntry).empty());

  EXPECT_EQ(
      plan.SectionTokens(Section::kProcessorPath),
      (Tokens{
          "-processorpath",
          checker_jar_.string() + ":" + qual_jar_.string()}));
  EXPECT_EQ(
      plan.SectionTokens(Section::kProcessor),
      (Tokens{"-processor",
              "org.checkerframework.checker.nullness.NullnessChecker"}));
  EXPECT_EQ(
      plan.SectionTokens(Section::kProcessingMode),
      (Tokens{"-proc:only"}));

  // executable, 10 module flags, @classpath, processor path (2),
  // processor (2), -proc:only, @sources
  ASSERT_EQ(args.size(), 18U);
  EXPECT_TRUE(args[11].starts_with("@"));
  EXPECT_EQ(args[12], "-processorpath");
  EXPECT_EQ(args[14], "-processor");
  EXPECT_EQ(args[16], "-proc:only");
  EXPECT_TRUE(args[17].starts_with("@"));

  ASSERT_EQ(plan.ReferenceFiles().size(), 2U);
  EXPECT_EQ(
      ReadLines(plan.ReferenceFiles()[0].Path()),
      (Tokens{"-cp /opt/libs/guava.jar"}));
  EXPECT_EQ(
      ReadLines(plan.ReferenceFiles()[1].Path()),
      (Tokens{source_a_.string(), source_b_.string()}));
}

TEST_F(PlannerTest, Java8OnJava8WithOldChecker) {
  build_.properties[version::kSourceProperty] = "1.8";
  options_.checker_version = "3.0.0";
  AddToRepository(artifact::kCheckerName, "3.0.0");
  AddToRepository(artifact::kCheckerQualName, "3.0.0");
  auto jdk8 = AddToRepository(artifact::kAnnotatedJdkName, "3.0.0");
  auto frontend = AddToRepository(
      artifact::kAlternateFrontendName, artifact::kAlternateFrontendVersion,
      artifact::kAlternateFrontendGroup);

  auto outcome = Plan("1.8.0_292");
  ASSERT_TRUE(outcome.has_value()) << outcome.error().primary.message;
  const auto& plan = std::get<InvocationPlan>(*outcome);
  const auto& args = plan.Arguments();

  EXPECT_TRUE(plan.SectionTokens(Section::kModuleVisibility).empty());
  EXPECT_EQ(args[1], "-J-Xbootclasspath/p:" + frontend.string());
  EXPECT_EQ(args[2], "-Xbootclasspath/p:" + jdk8.string());
  EXPECT_TRUE(args[3].starts_with("@"));
  EXPECT_EQ(args[4], "-processorpath");
}

TEST_F(PlannerTest, MissingOverlayIsWarnedAndOmitted) {
  build_.properties[version::kSourceProperty] = "8";
  options_.checker_version = "3.53.0";

  auto outcome = Plan("1.8");
  ASSERT_TRUE(outcome.has_value());
  const auto& plan = std::get<InvocationPlan>(*outcome);
  EXPECT_TRUE(plan.SectionTokens(Section::kAlternateFrontend).empty());
  EXPECT_TRUE(log_.Contains("com.google.errorprone:javac:9+181-r4173-1"));
  EXPECT_TRUE(log_.Contains("[warning]"));
}

TEST_F(PlannerTest, LauncherModeDropsJPrefixAndAddsMainEntry) {
  options_.executable = WriteFakeCompiler("java", 0).string();

  auto outcome = Plan();
  ASSERT_TRUE(outcome.has_value());
  const auto& plan = std::get<InvocationPlan>(*outcome);
  const auto& args = plan.Arguments();

  EXPECT_EQ(
      args[1],
      "--add-exports=jdk.compiler/com.sun.tools.javac.api=ALL-UNNAMED");
  EXPECT_EQ(
      args[10],
      "--add-opens=jdk.compiler/com.sun.tools.javac.comp=ALL-UNNAMED");
  EXPECT_EQ(args[11], "-cp");
  EXPECT_EQ(args[12], checker_jar_.string() + ":" + qual_jar_.string());
  EXPECT_EQ(args[13], kJavacMainClass);
}

TEST_F(PlannerTest, LauncherModeWithoutCheckerHasNoJvmClasspath) {
  options_.executable = WriteFakeCompiler("java", 0).string();
  fs::remove(checker_jar_);

  auto outcome = Plan();
  ASSERT_TRUE(outcome.has_value());
  const auto& plan = std::get<InvocationPlan>(*outcome);
  EXPECT_TRUE(plan.SectionTokens(Section::kJvmClasspath).empty());
  EXPECT_EQ(
      plan.SectionTokens(Section::kMainEntry), (Tokens{kJavacMainClass}));
}

TEST_F(PlannerTest, DegradedProcessorPathWarns) {
  fs::remove(qual_jar_);

  auto outcome = Plan();
  ASSERT_TRUE(outcome.has_value());
  const auto& plan = std::get<InvocationPlan>(*outcome);
  EXPECT_EQ(
      plan.SectionTokens(Section::kProcessorPath),
      (Tokens{"-processorpath", checker_jar_.string()}));
  EXPECT_TRUE(log_.Contains("processor path is incomplete"));
}

TEST_F(PlannerTest, QualifiersWithoutCheckerFallBackToClasspath) {
  fs::remove(checker_jar_);
  build_.classpath.push_back(checker_jar_.string());

  auto outcome = Plan();
  ASSERT_TRUE(outcome.has_value());
  const auto& plan = std::get<InvocationPlan>(*outcome);
  EXPECT_TRUE(plan.SectionTokens(Section::kProcessorPath).empty());
  EXPECT_FALSE(plan.SectionTokens(Section::kClasspathReference).empty());
  EXPECT_TRUE(log_.Contains("relying on the compile classpath"));
  EXPECT_FALSE(log_.Contains("processor path is incomplete"));
}

TEST_F(PlannerTest, NoCheckerJarsOmitsProcessorPath) {
  fs::remove(qual_jar_);
  fs::remove(checker_jar_);

  auto outcome = Plan();
  ASSERT_TRUE(outcome.has_value());
  const auto& plan = std::get<InvocationPlan>(*outcome);
  EXPECT_TRUE(plan.SectionTokens(Section::kProcessorPath).empty());
  EXPECT_FALSE(plan.SectionTokens(Section::kProcessor).empty());
  EXPECT_TRUE(log_.Contains("relying on the compile classpath"));
}

TEST_F(PlannerTest, LombokSuppressionAndDelombokSources) {
  build_.dependencies.push_back(
      {.group = lombok::kLombokGroup, .name = lombok::kLombokName,
       .version = "1.18.30", .file = std::nullopt});
  build_.plugins.push_back(
      {.group = lombok::kLombokGroup,
       .name = lombok::kLombokPluginName,
       .configuration = {{"outputDirectory", "target/delombok"}},
       .executions = {}});
  auto delomboked = dir_.Touch("project/target/delombok/com/example/A.java");
  options_.extra_args = {"-AsuppressWarnings=nullness"};

  auto outcome = Plan();
  ASSERT_TRUE(outcome.has_value());
  const auto& plan = std::get<InvocationPlan>(*outcome);
  EXPECT_EQ(
      plan.SectionTokens(Section::kExtraArgs),
      (Tokens{"-AsuppressWarnings=nullness,type.anno.before.modifier"}));
  EXPECT_EQ(
      ReadLines(plan.ReferenceFiles().back().Path()),
      (Tokens{delomboked.string()}));
}

TEST_F(PlannerTest, LombokSuppressionCanBeDisabled) {
  build_.dependencies.push_back(
      {.group = lombok::kLombokGroup, .name = lombok::kLombokName,
       .version = "1.18.30", .file = std::nullopt});
  options_.suppress_lombok_warnings = false;

  auto outcome = Plan();
  ASSERT_TRUE(outcome.has_value());
  const auto& plan = std::get<InvocationPlan>(*outcome);
  EXPECT_TRUE(plan.SectionTokens(Section::kExtraArgs).empty());
}

TEST_F(PlannerTest, TestSourcesIncludedOnRequest) {
  options_.exclude_tests = false;
  options_.proc_only = false;

  auto outcome = Plan();
  ASSERT_TRUE(outcome.has_value());
  const auto& plan = std::get<InvocationPlan>(*outcome);
  EXPECT_EQ(ReadLines(plan.ReferenceFiles().back().Path()).size(), 3U);
  EXPECT_TRUE(plan.SectionTokens(Section::kProcessingMode).empty());
}

TEST_F(PlannerTest, EmptyClasspathHasNoReference) {
  build_.classpath.clear();
  auto outcome = Plan();
  ASSERT_TRUE(outcome.has_value());
  const auto& plan = std::get<InvocationPlan>(*outcome);
  EXPECT_TRUE(plan.SectionTokens(Section::kClasspathReference).empty());
  EXPECT_EQ(plan.ReferenceFiles().size(), 1U);
}

// =============================================================================
// Skips and failures before execution
// =============================================================================

TEST_F(PlannerTest, SkipFlag) {
  options_.skip = true;
  auto outcome = Plan();
  ASSERT_TRUE(outcome.has_value());
  EXPECT_TRUE(std::holds_alternative<SkippedRun>(*outcome));
}

TEST_F(PlannerTest, AggregatorPackagingSkipped) {
  build_.packaging = "pom";
  auto outcome = Plan();
  ASSERT_TRUE(outcome.has_value());
  ASSERT_TRUE(std::holds_alternative<SkippedRun>(*outcome));
  EXPECT_NE(
      std::get<SkippedRun>(*outcome).reason.find("pom"), std::string::npos);
}

TEST_F(PlannerTest, NoProcessorsSkippedWithWarning) {
  options_.processors.clear();
  auto outcome = Plan();
  ASSERT_TRUE(outcome.has_value());
  EXPECT_TRUE(std::holds_alternative<SkippedRun>(*outcome));
  EXPECT_TRUE(log_.Contains("[warning] no checkers configured"));
}

TEST_F(PlannerTest, NoSourcesSkipped) {
  fs::remove_all(build_.base_dir / "src");
  auto outcome = Plan();
  ASSERT_TRUE(outcome.has_value());
  ASSERT_TRUE(std::holds_alternative<SkippedRun>(*outcome));
  EXPECT_TRUE(log_.Contains("no source files found"));
}

TEST_F(PlannerTest, UnknownRuntimeIsConfigError) {
  host_ = std::make_unique<test::FakeHostRuntime>(std::nullopt);
  resolver_ = MakeResolver();
  InvocationPlanner planner(
      build_, options_, *resolver_, *host_, log_.Logger());
  auto outcome = planner.Plan();
  ASSERT_FALSE(outcome.has_value());
  EXPECT_EQ(outcome.error().primary.kind, DiagKind::kConfigError);
}

// =============================================================================
// Execution
// =============================================================================

TEST_F(PlannerTest, SuccessfulRunPasses) {
  auto outcome = Run();
  ASSERT_TRUE(outcome.has_value()) << outcome.error().primary.message;
  EXPECT_EQ(*outcome, RunOutcome::kPassed);

  auto recorded = ReadLines(dir_.Path() / "invocation.txt");
  ASSERT_EQ(recorded.size(), 17U);
  EXPECT_EQ(recorded[0].front(), '-');
  EXPECT_EQ(recorded[15], "-proc:only");

  auto argfiles = ReadLines(dir_.Path() / "argfiles.txt");
  EXPECT_NE(
      std::ranges::find(argfiles, source_a_.string()), argfiles.end());

  // Output lines are classified by marker
  EXPECT_TRUE(log_.Contains("[error] A.java:3: error: [assignment]"));
  EXPECT_TRUE(log_.Contains("[warning] A.java:5: warning: [cast]"));
  EXPECT_TRUE(log_.Contains("[info] Note: 1 error"));
}

TEST_F(PlannerTest, ReferenceFilesRemovedAfterRun) {
  ASSERT_TRUE(Run().has_value());
  auto recorded = ReadLines(dir_.Path() / "invocation.txt");
  for (const auto& arg : recorded) {
    if (arg.starts_with("@")) {
      EXPECT_FALSE(fs::exists(arg.substr(1))) << arg;
    }
  }
}

TEST_F(PlannerTest, NonZeroExitFailsRun) {
  options_.executable = WriteFakeCompiler("javac", 1).string();
  auto outcome = Run();
  ASSERT_FALSE(outcome.has_value());
  EXPECT_EQ(outcome.error().primary.kind, DiagKind::kCheckerFailure);
  EXPECT_NE(
      outcome.error().primary.message.find("exit status 1"), std::string::npos);
}

TEST_F(PlannerTest, NonZeroExitReportedWhenFailOnErrorDisabled) {
  options_.executable = WriteFakeCompiler("javac", 1).string();
  options_.fail_on_error = false;
  auto outcome = Run();
  ASSERT_TRUE(outcome.has_value());
  EXPECT_EQ(*outcome, RunOutcome::kFailedReported);
}

TEST_F(PlannerTest, SkippedRunDoesNotSpawn) {
  options_.skip = true;
  auto outcome = Run();
  ASSERT_TRUE(outcome.has_value());
  EXPECT_EQ(*outcome, RunOutcome::kSkipped);
  EXPECT_FALSE(fs::exists(dir_.Path() / "invocation.txt"));
}

TEST_F(PlannerTest, UnstartableExecutableIsHostError) {
  options_.executable = (dir_.Path() / "bin" / "not-executable").string();
  dir_.Write("bin/not-executable", "plain text");
  auto outcome = Run();
  ASSERT_FALSE(outcome.has_value());
  EXPECT_EQ(outcome.error().primary.kind, DiagKind::kHostError);
}

// =============================================================================
// Helpers
// =============================================================================

TEST_F(PlannerTest, CheckerVersionPriority) {
  EXPECT_EQ(
      SelectCheckerVersion(build_, options_),
      artifact::kDefaultCheckerVersion);

  build_.dependencies.push_back(
      {.group = artifact::kCheckerGroup, .name = artifact::kCheckerQualName,
       .version = "3.42.0", .file = std::nullopt});
  EXPECT_EQ(SelectCheckerVersion(build_, options_), "3.42.0");

  options_.checker_version = "3.49.1";
  EXPECT_EQ(SelectCheckerVersion(build_, options_), "3.49.1");
}

TEST_F(PlannerTest, ExecutableResolution) {
  EXPECT_EQ(
      ResolveExecutable(options_.executable, build_), options_.executable);
  EXPECT_EQ(ResolveExecutable("javac-that-does-not-exist", build_),
            "javac-that-does-not-exist");

  auto jdk_javac = test::WriteScript(dir_, "jdk/bin/javac", "exit 0\n");
  build_.toolchain =
      std::make_shared<config::JdkToolchain>(dir_.Path() / "jdk", std::nullopt);
  EXPECT_EQ(ResolveExecutable("javac", build_), jdk_javac.string());
}

TEST(IsLauncherTest, ByExecutableStem) {
  EXPECT_TRUE(IsLauncher("java"));
  EXPECT_TRUE(IsLauncher("/opt/jdk/bin/java"));
  EXPECT_TRUE(IsLauncher("java.exe"));
  EXPECT_FALSE(IsLauncher("javac"));
  EXPECT_FALSE(IsLauncher("/opt/jdk/bin/javac"));
}

}  // namespace
}  // namespace checkerlaunch::planner
