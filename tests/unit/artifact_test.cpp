#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "checkerlaunch/artifact/artifact.hpp"
#include "checkerlaunch/common/string_utils.hpp"

namespace checkerlaunch::artifact {
namespace {

namespace fs = std::filesystem;

TEST(ArtifactCoordinateTest, ToStringUsesColons) {
  ArtifactCoordinate coordinate{
      .group = "org.checkerframework", .name = "checker", .version = "3.53.0"};
  EXPECT_EQ(coordinate.ToString(), "org.checkerframework:checker:3.53.0");
}

TEST(RepositoryPathTest, MavenLayout) {
  ArtifactCoordinate coordinate{
      .group = "org.checkerframework", .name = "checker-qual",
      .version = "3.53.0"};
  EXPECT_EQ(
      RepositoryPath("/repo", coordinate),
      fs::path(
          "/repo/org/checkerframework/checker-qual/3.53.0/"
          "checker-qual-3.53.0.jar"));
}

TEST(RepositoryPathTest, VersionWithPlus) {
  ArtifactCoordinate coordinate{
      .group = kAlternateFrontendGroup, .name = kAlternateFrontendName,
      .version = kAlternateFrontendVersion};
  EXPECT_EQ(
      RepositoryPath("/repo", coordinate),
      fs::path(
          "/repo/com/google/errorprone/javac/9+181-r4173-1/"
          "javac-9+181-r4173-1.jar"));
}

TEST(LocationToPathTest, PlainPath) {
  EXPECT_EQ(LocationToPath("/opt/checker.jar"), fs::path("/opt/checker.jar"));
}

TEST(LocationToPathTest, FileUrl) {
  EXPECT_EQ(
      LocationToPath("file:/opt/checker.jar"), fs::path("/opt/checker.jar"));
  EXPECT_EQ(
      LocationToPath("file:///opt/checker.jar"), fs::path("/opt/checker.jar"));
}

TEST(LocationToPathTest, LocalhostAuthority) {
  EXPECT_EQ(
      LocationToPath("file://localhost/opt/checker.jar"),
      fs::path("/opt/checker.jar"));
  EXPECT_EQ(
      LocationToPath("jar:file://localhost/opt/checker.jar!/A.class"),
      fs::path("/opt/checker.jar"));
}

TEST(LocationToPathTest, RemoteAuthorityIsNotALocalPath) {
  EXPECT_FALSE(LocationToPath("file://buildhost/opt/checker.jar").has_value());
  EXPECT_FALSE(LocationToPath("file://localhost").has_value());
}

TEST(LocationToPathTest, JarUrlDropsEntry) {
  EXPECT_EQ(
      LocationToPath(
          "jar:file:/opt/lib/checker.jar!/org/checkerframework/Marker.class"),
      fs::path("/opt/lib/checker.jar"));
}

TEST(LocationToPathTest, DecodesPercentEscapes) {
  EXPECT_EQ(
      LocationToPath("file:/home/my%20user/lib%2Bx/checker.jar"),
      fs::path("/home/my user/lib+x/checker.jar"));
}

TEST(LocationToPathTest, KeepsLiteralPlus) {
  EXPECT_EQ(
      LocationToPath("file:/repo/javac/9+181/javac.jar"),
      fs::path("/repo/javac/9+181/javac.jar"));
}

TEST(LocationToPathTest, EmptyLocation) {
  EXPECT_FALSE(LocationToPath("").has_value());
  EXPECT_FALSE(LocationToPath("file:").has_value());
}

TEST(UrlDecodeTest, IncompleteEscapeKept) {
  EXPECT_EQ(common::UrlDecode("a%2"), "a%2");
  EXPECT_EQ(common::UrlDecode("a%zz"), "a%zz");
  EXPECT_EQ(common::UrlDecode("%41%42"), "AB");
}

}  // namespace
}  // namespace checkerlaunch::artifact
