#include "dirimg/duplicator.hpp"

#include "../test_image.hpp"
#include "../test_logger.hpp"

#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace {

using dirimg::tests::PatternBytes;
using dirimg::tests::ReadFile;
using dirimg::tests::ScopedDir;
using dirimg::tests::WriteFile;

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

void RunScenarioCloneFileCopiesAndReplaces() {
  dirimg::tests::Log("scenario: CloneFile produces an identical copy and replaces existing content");
  ScopedDir scratch("dup_file");
  const auto content = PatternBytes(300000, 3);
  const auto src = scratch.path() / "src.bin";
  const auto dst = scratch.path() / "dst.bin";
  WriteFile(src, content);
  WriteFile(dst, PatternBytes(10, 9));

  dirimg::duplicator::CloneFile(src, dst);
  Require(ReadFile(dst) == content, "clone must be byte identical");

  WriteFile(dst, PatternBytes(400000, 5));
  dirimg::duplicator::CloneFile(src, dst);
  Require(ReadFile(dst) == content, "clone over a longer file must truncate it");
  Require(ReadFile(src) == content, "source must be untouched");
}

void RunScenarioCloneFileErrors() {
  dirimg::tests::Log("scenario: CloneFile rejects missing sources and tolerates same-path clones");
  ScopedDir scratch("dup_errors");
  bool threw = false;
  try {
    dirimg::duplicator::CloneFile(scratch.path() / "missing", scratch.path() / "dst");
  } catch (const std::filesystem::filesystem_error&) {
    threw = true;
  }
  Require(threw, "missing source must throw filesystem_error");
  Require(!std::filesystem::exists(scratch.path() / "dst"), "failed clone must not create the destination");

  const auto content = PatternBytes(128, 4);
  const auto path = scratch.path() / "same.bin";
  WriteFile(path, content);
  dirimg::duplicator::CloneFile(path, path);
  Require(ReadFile(path) == content, "same-path clone must leave the file intact");
}

void RunScenarioCloneDirectoryRecurses() {
  dirimg::tests::Log("scenario: CloneDirectory reproduces a nested tree");
  ScopedDir scratch("dup_dir");
  const auto src = scratch.path() / "src";
  WriteFile(src / "top.bin", PatternBytes(10, 1));
  WriteFile(src / "a" / "mid.bin", PatternBytes(20, 2));
  WriteFile(src / "a" / "b" / "leaf.bin", PatternBytes(30, 3));
  std::filesystem::create_directories(src / "empty");

  const auto dst = scratch.path() / "dst";
  dirimg::duplicator::CloneDirectory(src, dst);
  Require(ReadFile(dst / "top.bin") == PatternBytes(10, 1), "top-level file must be cloned");
  Require(ReadFile(dst / "a" / "mid.bin") == PatternBytes(20, 2), "nested file must be cloned");
  Require(ReadFile(dst / "a" / "b" / "leaf.bin") == PatternBytes(30, 3), "deep file must be cloned");
  Require(std::filesystem::is_directory(dst / "empty"), "empty directories must be cloned");
}

}  // namespace

int main() {
  try {
    dirimg::tests::Log("duplicator_test: start");
    RunScenarioCloneFileCopiesAndReplaces();
    RunScenarioCloneFileErrors();
    RunScenarioCloneDirectoryRecurses();
    dirimg::tests::Log("duplicator_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    dirimg::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
