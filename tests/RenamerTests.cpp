#include <gtest/gtest.h>

#include <algorithm>

#include "../RenameExecutor.hpp"
#include "../Renamer.hpp"
#include "../SchemeCompiler.hpp"
#include "TestHelpers.hpp"

namespace {
const RenameEntry* find_entry(const RenamePlan& plan, const fs::path& from) {
  auto it = std::find_if(plan.begin(), plan.end(),
                         [&](const RenameEntry& e) { return e.from == from; });
  return it == plan.end() ? nullptr : &*it;
}

json date_scheme() {
  return json::parse(R"(["Test-", {"key": "date_time"}])");
}
}  // namespace

class RenamerTest : public MediaFilesTest {};

TEST_F(RenamerTest, DefaultSchemeAndSubstitutionChar) {
  Renamer renamer(provider);

  EXPECT_EQ(SchemeCompiler::describe(renamer.naming_scheme()),
            "Renamed-default-");
  EXPECT_EQ(renamer.substitution_char(), '_');
}

TEST_F(RenamerTest, EndToEndRenamesAfterCaptureDate) {
  // 1. Arrange
  fs::path file = CreateDummyFile("hs-2003-24-a-full.tif");
  fake->set("hs-2003-24-a-full.tif",
            {{"date_time", "2003-09-03 12:52:43 -0400"}});
  Renamer renamer(provider);
  renamer.set_naming_scheme(date_scheme());

  // 2. Act
  RenamePlan plan = renamer.generate({file});
  renamer.overwrite(plan);

  // 3. Assert
  ASSERT_EQ(plan.size(), 1);
  EXPECT_EQ(plan[0].from, file);
  EXPECT_EQ(plan[0].to, "Test-2003-09-03 12_52_43 -0400.tif");
  EXPECT_FALSE(fs::exists(file));
  EXPECT_TRUE(fs::exists(test_dir / "Test-2003-09-03 12_52_43 -0400.tif"));
}

TEST_F(RenamerTest, FileMissingAKeyIsLeftOutAndOthersAreKept) {
  fs::path a = CreateDummyFile("a.jpg");
  fs::path b = CreateDummyFile("b.jpg");
  fs::path c = CreateDummyFile("c.mp3");
  fake->set("a.jpg", {{"date_time", "2020-01-01 10:00:00"}});
  fake->set("b.jpg", {{"make", "Canon"}});
  fake->set("c.mp3", {{"date_time", "2021-02-02 11:11:11"}});
  Renamer renamer(provider);

  RenamePlan plan = renamer.generate({a, b, c}, date_scheme());

  ASSERT_EQ(plan.size(), 2);
  EXPECT_EQ(plan[0].from, a);
  EXPECT_EQ(plan[0].to, "Test-2020-01-01 10_00_00.jpg");
  EXPECT_EQ(plan[1].from, c);
  EXPECT_EQ(plan[1].to, "Test-2021-02-02 11_11_11.mp3");
  EXPECT_EQ(find_entry(plan, b), nullptr);
}

TEST_F(RenamerTest, InvalidAndUnsupportedFilesAreSkipped) {
  fs::path good = CreateDummyFile("good.jpg");
  fs::path text = CreateDummyFile("notes.txt");
  fake->set("good.jpg", {});
  Renamer renamer(provider);
  renamer.set_naming_scheme(json::array({"Holiday"}));

  RenamePlan plan =
      renamer.generate({test_dir / "gone.jpg", text, good, fs::path{}});

  ASSERT_EQ(plan.size(), 1);
  EXPECT_EQ(plan[0].from, good);
  EXPECT_EQ(plan[0].to, "Holiday.jpg");
}

TEST_F(RenamerTest, SchemeOverrideDoesNotReplaceTheDefault) {
  fs::path file = CreateDummyFile("a.jpg");
  fake->set("a.jpg", {});
  Renamer renamer(provider);
  renamer.set_naming_scheme(json::array({"Default-"}));

  RenamePlan overridden = renamer.generate({file}, json::array({"Other-"}));
  RenamePlan plain = renamer.generate({file});

  ASSERT_EQ(overridden.size(), 1);
  EXPECT_EQ(overridden[0].to, "Other-.jpg");
  ASSERT_EQ(plain.size(), 1);
  EXPECT_EQ(plain[0].to, "Default-.jpg");
  EXPECT_EQ(SchemeCompiler::describe(renamer.naming_scheme()), "Default-");
}

TEST_F(RenamerTest, EmptyOrNonArrayOverrideFallsBackToDefault) {
  fs::path file = CreateDummyFile("a.jpg");
  fake->set("a.jpg", {});
  Renamer renamer(provider);
  renamer.set_naming_scheme(json::array({"Default-"}));

  EXPECT_EQ(renamer.generate({file}, json::array())[0].to, "Default-.jpg");
  EXPECT_EQ(renamer.generate({file}, json("Other-"))[0].to, "Default-.jpg");
}

TEST_F(RenamerTest, SubstitutionCharIsConfigurable) {
  fs::path file = CreateDummyFile("a.jpg");
  fake->set("a.jpg", {{"model", "EOS 5D: Mark II"}});
  Renamer renamer(provider);
  renamer.set_naming_scheme(json::parse(R"([{"key": "model"}])"));
  renamer.set_substitution_char('~');

  RenamePlan plan = renamer.generate({file});

  ASSERT_EQ(plan.size(), 1);
  EXPECT_EQ(plan[0].to, "EOS 5D~ Mark II.jpg");
}

TEST_F(RenamerTest, ConfigSuppliesSchemeAndSubstitutionChar) {
  fs::path file = CreateDummyFile("a.jpg");
  fake->set("a.jpg", {{"make", "A/B"}});
  Config config;
  config.naming_scheme = json::parse(R"(["Cam-", {"key": "make"}])");
  config.substitution_char = '+';
  Renamer renamer(config, provider);

  RenamePlan plan = renamer.generate({file});

  ASSERT_EQ(plan.size(), 1);
  EXPECT_EQ(plan[0].to, "Cam-A+B.jpg");
}

TEST_F(RenamerTest, RepeatedPathIsPlannedOnce) {
  fs::path file = CreateDummyFile("a.jpg");
  fake->set("a.jpg", {});
  Renamer renamer(provider);

  RenamePlan plan = renamer.generate({file, file});

  EXPECT_EQ(plan.size(), 1);
}

TEST_F(RenamerTest, RepeatedFailingPathIsResolvedOnce) {
  // No canned metadata, so every lookup of this file fails.
  fs::path file = CreateDummyFile("broken.jpg");
  Renamer renamer(provider);

  RenamePlan plan = renamer.generate({file, file, file});

  EXPECT_TRUE(plan.empty());
  EXPECT_EQ(fake->calls(), 1);
}

TEST_F(RenamerTest, JsonPathListMustBeAnArray) {
  Renamer renamer(provider);

  EXPECT_THROW(renamer.generate_from_json(json("a.jpg")), InvalidArgumentError);
  EXPECT_THROW(renamer.generate_from_json(json(nullptr)), InvalidArgumentError);
  EXPECT_THROW(renamer.generate_from_json(json::object()),
               InvalidArgumentError);
}

TEST_F(RenamerTest, JsonPathListSkipsNonStringEntries) {
  fs::path file = CreateDummyFile("a.jpg");
  fake->set("a.jpg", {});
  Renamer renamer(provider);
  json list = json::array({42, file.string(), nullptr});

  RenamePlan plan = renamer.generate_from_json(list, json::array({"X"}));

  ASSERT_EQ(plan.size(), 1);
  EXPECT_EQ(plan[0].from, file);
  EXPECT_EQ(plan[0].to, "X.jpg");
}

TEST_F(RenamerTest, OverwriteRenamesExistingAndSkipsMissing) {
  fs::path existing = CreateDummyFile("keep.jpg");
  Renamer renamer(provider);
  RenamePlan plan = {{test_dir / "missing.jpg", "never.jpg"},
                     {existing, "renamed.jpg"}};

  EXPECT_NO_THROW(renamer.overwrite(plan));

  EXPECT_FALSE(fs::exists(existing));
  EXPECT_TRUE(fs::exists(test_dir / "renamed.jpg"));
  EXPECT_FALSE(fs::exists(test_dir / "never.jpg"));
}

TEST_F(RenamerTest, OverwriteKeepsFilesInTheirOwnDirectory) {
  fs::path nested = CreateDummyFile("album/disc1/track.mp3");
  Renamer renamer(provider);

  renamer.overwrite({{nested, "01 - Intro.mp3"}});

  EXPECT_TRUE(fs::exists(test_dir / "album/disc1/01 - Intro.mp3"));
  EXPECT_FALSE(fs::exists(nested));
}

TEST_F(RenamerTest, OverwriteRejectsNamesWithDirectories) {
  fs::path file = CreateDummyFile("a.jpg");
  fs::create_directories(test_dir / "sub");
  Renamer renamer(provider);

  renamer.overwrite({{file, "sub/a.jpg"}, {file, ""}, {file, ".."}});

  EXPECT_TRUE(fs::exists(file));
  EXPECT_FALSE(fs::exists(test_dir / "sub/a.jpg"));
}

TEST_F(RenamerTest, OverwriteNeverReplacesAnExistingFile) {
  // 1. Arrange: a literal-only scheme gives both files the same name.
  fs::path a = CreateDummyFile("a.jpg");
  fs::path b = CreateDummyFile("b.jpg");
  fake->set("a.jpg", {});
  fake->set("b.jpg", {});
  Renamer renamer(provider);
  renamer.set_naming_scheme(json::array({"Holiday"}));
  RenamePlan plan = renamer.generate({a, b});
  ASSERT_EQ(plan.size(), 2);

  // 2. Act
  renamer.overwrite(plan);

  // 3. Assert: the first rename wins, the second is skipped.
  EXPECT_FALSE(fs::exists(a));
  EXPECT_TRUE(fs::exists(b));
  EXPECT_TRUE(fs::exists(test_dir / "Holiday.jpg"));
  size_t files_left = 0;
  for (const auto& entry : fs::directory_iterator(test_dir)) {
    if (entry.is_regular_file()) ++files_left;
  }
  EXPECT_EQ(files_left, 2);
}

TEST_F(RenamerTest, OverwriteSkipsPreexistingDestination) {
  fs::path file = CreateDummyFile("a.jpg");
  fs::path other = CreateDummyFile("taken.jpg");
  Renamer renamer(provider);

  renamer.overwrite({{file, "taken.jpg"}});

  EXPECT_TRUE(fs::exists(file));
  EXPECT_TRUE(fs::exists(other));
  auto failure = RenameExecutor::validate({file, "taken.jpg"});
  ASSERT_TRUE(failure.has_value());
  EXPECT_EQ(failure->kind, ErrorKind::FileNotValid);
}

TEST_F(RenamerTest, OverwriteAllowsRenamingOntoItself) {
  fs::path file = CreateDummyFile("a.jpg");
  EXPECT_FALSE(RenameExecutor::validate({file, "a.jpg"}).has_value());
}

TEST_F(RenamerTest, OverwriteSkipsDirectories) {
  fs::create_directories(test_dir / "album");
  Renamer renamer(provider);

  renamer.overwrite({{test_dir / "album", "renamed"}});

  EXPECT_TRUE(fs::is_directory(test_dir / "album"));
  EXPECT_FALSE(fs::exists(test_dir / "renamed"));
}

TEST_F(RenamerTest, OverwriteContinuesPastAFailingRename) {
  fs::path a = CreateDummyFile("a.jpg");
  fs::path b = CreateDummyFile("b.jpg");
  // An existing directory blocks the first rename.
  CreateDummyFile("taken/inner.txt");
  Renamer renamer(provider);

  renamer.overwrite({{a, "taken"}, {b, "b2.jpg"}});

  EXPECT_TRUE(fs::exists(a));
  EXPECT_TRUE(fs::exists(test_dir / "b2.jpg"));
}

TEST(RenameExecutorTest, ValidateReportsFileNotValid) {
  auto failure = RenameExecutor::validate({"/no/such/file.jpg", "x.jpg"});
  ASSERT_TRUE(failure.has_value());
  EXPECT_EQ(failure->kind, ErrorKind::FileNotValid);
}
