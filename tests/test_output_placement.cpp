#include <gtest/gtest.h>

#include "peel/format_classifier.hpp"
#include "peel/output_placement.hpp"
#include "testing.hpp"

#include <sys/stat.h>

#include <memory>

namespace {

using peel::ArchiveSpec;
using peel::ContentType;
using peel::Destination;
using peel::InteractionController;
using peel::Layer;
using peel::Mode;
using peel::OneEntryPolicy;
using peel::OutputPlacement;
using peel::PlacementOptions;
using peel::ScopedTempDir;

ArchiveSpec Spec(const std::string& path, std::vector<Layer> layers, Mode mode = Mode::Extract) {
    ArchiveSpec spec;
    spec.path = path;
    spec.display_name = path;
    spec.layers = std::move(layers);
    spec.mode = mode;
    return spec;
}

class AnswerPrompter final : public InteractionController::IPrompter {
  public:
    explicit AnswerPrompter(std::string answer) : answer_(std::move(answer)) {}
    std::optional<std::string> Ask(const std::vector<std::string>&, std::string_view) override {
        ++asked;
        return answer_;
    }
    int asked = 0;

  private:
    std::string answer_;
};

TEST(OutputPlacementNames, StripKnownSuffixes) {
    EXPECT_EQ(OutputPlacement::StripArchiveSuffix("src.tar.gz"), "src");
    EXPECT_EQ(OutputPlacement::StripArchiveSuffix("src.TGZ"), "src");
    EXPECT_EQ(OutputPlacement::StripArchiveSuffix("notes.txt.gz"), "notes.txt");
    EXPECT_EQ(OutputPlacement::StripArchiveSuffix("old.tar.Z"), "old");
    EXPECT_EQ(OutputPlacement::StripArchiveSuffix("bundle.zip"), "bundle");
}

TEST(OutputPlacementNames, StripUnknownShortExtension) {
    EXPECT_EQ(OutputPlacement::StripArchiveSuffix("photo.jpeg"), "photo");
    EXPECT_EQ(OutputPlacement::StripArchiveSuffix("data.backup"), "data.backup");
    EXPECT_EQ(OutputPlacement::StripArchiveSuffix("noext"), "noext");
    EXPECT_EQ(OutputPlacement::StripArchiveSuffix(".hidden"), ".hidden");
}

TEST(OutputPlacementNames, EverySuffixRuleStripsToStem) {
    for (const auto& rule : peel::FormatClassifier::SuffixRules()) {
        const std::string name = "stem" + rule.suffix;
        EXPECT_EQ(OutputPlacement::StripArchiveSuffix(name), "stem") << name;
    }
}

TEST(OutputPlacementNames, PackageConventions) {
    EXPECT_EQ(OutputPlacement::BaseName(Spec("/in/hello_1.0-2_amd64.deb", {Layer::Deb})),
              "hello_1.0-2");
    EXPECT_EQ(OutputPlacement::BaseName(Spec("/in/hello.deb", {Layer::Deb})), "hello");
    EXPECT_EQ(OutputPlacement::BaseName(
                  Spec("/in/bash-5.1-2.fc36.x86_64.rpm", {Layer::Rpm, Layer::Cpio})),
              "bash-5.1-2.fc36");
    EXPECT_EQ(OutputPlacement::BaseName(
                  Spec("/in/rake-13.0.gem", {Layer::Gem, Layer::Gzip, Layer::Tar}, Mode::Metadata)),
              "rake-13.0.gem-metadata.txt");
    EXPECT_EQ(OutputPlacement::BaseName(
                  Spec("/in/rake-13.0.gem", {Layer::Gem, Layer::Gzip, Layer::Tar})),
              "rake-13.0");
}

TEST(OutputPlacementRelocate, MapsStagedPathsThroughMoves) {
    Destination dest;
    dest.moved = {{"/w/.peel-ab12/docs", "/w/docs"}, {"/w/.peel-ab12/top.tar", "/w/top-1.tar"}};

    EXPECT_EQ(OutputPlacement::Relocate(dest, "/w/.peel-ab12/docs/sub/in.zip"), "/w/docs/sub/in.zip");
    EXPECT_EQ(OutputPlacement::Relocate(dest, "/w/.peel-ab12/top.tar"), "/w/top-1.tar");
    EXPECT_EQ(OutputPlacement::Relocate(dest, "/w/.peel-ab12/docsx/in.zip"), "");
    EXPECT_EQ(OutputPlacement::Relocate(dest, "/w/docs/mine.zip"), "");
}

class OutputPlacementTests : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
    InteractionController quiet{false, std::nullopt};

    // Stages `entries` (name -> contents, trailing '/' for directories).
    void Stage(ScopedTempDir& staging, const std::vector<std::pair<std::string, std::string>>& entries) {
        for (const auto& [name, contents] : entries) {
            if (!name.empty() && name.back() == '/') {
                ASSERT_EQ(::mkdir((staging.Path() + "/" + name).c_str(), 0755), 0);
            } else {
                testutil::WriteFile(staging.Path() + "/" + name, contents);
            }
        }
    }

    peel::Result Extract(const OutputPlacement& placement, const ArchiveSpec& spec,
                         const std::vector<std::pair<std::string, std::string>>& entries,
                         Destination& dest, InteractionController& ui) {
        ScopedTempDir staging;
        auto r = placement.Prepare(spec, tmp.Path(), dest, staging);
        if (!r.ok) return r;
        Stage(staging, entries);
        r = placement.Place(spec, dest, staging, ui);
        if (r.ok) EXPECT_FALSE(testutil::Exists(staging.Path())) << "staging directory left behind";
        return r;
    }
};

TEST_F(OutputPlacementTests, InspectClassifiesStagedTrees) {
    ScopedTempDir dir;
    ASSERT_TRUE(ScopedTempDir::Create(tmp.Path(), "inspect-", dir).ok);
    EXPECT_EQ(OutputPlacement::Inspect(dir.Path(), "x").type, ContentType::Empty);

    ASSERT_EQ(::mkdir((dir.Path() + "/x").c_str(), 0755), 0);
    auto c = OutputPlacement::Inspect(dir.Path(), "x");
    EXPECT_EQ(c.type, ContentType::Matching);
    EXPECT_TRUE(c.entry_is_directory);
    EXPECT_EQ(OutputPlacement::Inspect(dir.Path(), "y").type, ContentType::OneEntry);

    testutil::WriteFile(dir.Path() + "/b.txt", "b");
    c = OutputPlacement::Inspect(dir.Path(), "x");
    EXPECT_EQ(c.type, ContentType::Bomb);
    EXPECT_EQ(c.entries, (std::vector<std::string>{"b.txt", "x"}));
}

TEST_F(OutputPlacementTests, ClaimNameCountsUp) {
    std::string path;
    ASSERT_TRUE(OutputPlacement::ClaimName(tmp.Path(), "out", true, path).ok);
    EXPECT_EQ(path, tmp / "out");
    ASSERT_TRUE(OutputPlacement::ClaimName(tmp.Path(), "out", true, path).ok);
    EXPECT_EQ(path, tmp / "out-1");
    ASSERT_TRUE(OutputPlacement::ClaimName(tmp.Path(), "out", false, path).ok);
    EXPECT_EQ(path, tmp / "out-2");
    EXPECT_TRUE(testutil::IsDir(tmp / "out-1"));
    EXPECT_FALSE(testutil::IsDir(tmp / "out-2"));
}

TEST_F(OutputPlacementTests, MoveOverMergesDirectories) {
    ASSERT_EQ(::mkdir((tmp / "src").c_str(), 0755), 0);
    ASSERT_EQ(::mkdir((tmp / "src/sub").c_str(), 0755), 0);
    testutil::WriteFile(tmp / "src/sub/new.txt", "new");
    testutil::WriteFile(tmp / "src/same.txt", "replaced");
    ASSERT_EQ(::mkdir((tmp / "dst").c_str(), 0755), 0);
    ASSERT_EQ(::mkdir((tmp / "dst/sub").c_str(), 0755), 0);
    testutil::WriteFile(tmp / "dst/sub/old.txt", "old");
    testutil::WriteFile(tmp / "dst/same.txt", "original");

    ASSERT_TRUE(OutputPlacement::MoveOver(tmp / "src", tmp / "dst").ok);
    EXPECT_FALSE(testutil::Exists(tmp / "src"));
    EXPECT_EQ(testutil::ReadFile(tmp / "dst/sub/old.txt"), "old");
    EXPECT_EQ(testutil::ReadFile(tmp / "dst/sub/new.txt"), "new");
    EXPECT_EQ(testutil::ReadFile(tmp / "dst/same.txt"), "replaced");
}

TEST_F(OutputPlacementTests, BombIsWrappedInBaseDirectory) {
    OutputPlacement placement(PlacementOptions{});
    Destination dest;
    auto spec = Spec(tmp / "report.tar.gz", {Layer::Gzip, Layer::Tar});

    ASSERT_TRUE(Extract(placement, spec, {{"a.txt", "a"}, {"b.txt", "b"}}, dest, quiet).ok);
    ASSERT_EQ(dest.produced, (std::vector<std::string>{tmp / "report"}));
    EXPECT_EQ(testutil::ReadFile(tmp / "report/a.txt"), "a");
    EXPECT_EQ(testutil::ReadFile(tmp / "report/b.txt"), "b");

    struct stat st {};
    ASSERT_EQ(::stat((tmp / "report").c_str(), &st), 0);
    EXPECT_NE(st.st_mode & S_IRGRP, 0u) << "staging mode was not relaxed";
}

TEST_F(OutputPlacementTests, MatchingDirectoryIsMovedUp) {
    OutputPlacement placement(PlacementOptions{});
    Destination dest;
    auto spec = Spec(tmp / "project.zip", {Layer::Zip});

    ASSERT_TRUE(Extract(placement, spec, {{"project/", ""}, {"project/x", "x"}}, dest, quiet).ok);
    EXPECT_EQ(testutil::ReadFile(tmp / "project/x"), "x");
    EXPECT_FALSE(testutil::Exists(tmp / "project/project"));
}

TEST_F(OutputPlacementTests, CollisionPicksNextFreeName) {
    ASSERT_EQ(::mkdir((tmp / "bundle").c_str(), 0755), 0);
    testutil::WriteFile(tmp / "bundle/keep.txt", "keep");

    OutputPlacement placement(PlacementOptions{});
    Destination dest;
    auto spec = Spec(tmp / "bundle.zip", {Layer::Zip});

    ASSERT_TRUE(Extract(placement, spec, {{"a", "1"}, {"b", "2"}}, dest, quiet).ok);
    EXPECT_EQ(dest.produced, (std::vector<std::string>{tmp / "bundle-1"}));
    EXPECT_EQ(testutil::ReadFile(tmp / "bundle/keep.txt"), "keep");
    EXPECT_FALSE(testutil::Exists(tmp / "bundle/a"));
}

TEST_F(OutputPlacementTests, OverwriteMergesIntoExistingPath) {
    ASSERT_EQ(::mkdir((tmp / "bundle").c_str(), 0755), 0);
    testutil::WriteFile(tmp / "bundle/a", "stale");
    testutil::WriteFile(tmp / "bundle/keep.txt", "keep");

    OutputPlacement placement(PlacementOptions{.overwrite = true});
    Destination dest;
    auto spec = Spec(tmp / "bundle.zip", {Layer::Zip});

    ASSERT_TRUE(Extract(placement, spec, {{"a", "1"}, {"b", "2"}}, dest, quiet).ok);
    EXPECT_EQ(dest.produced, (std::vector<std::string>{tmp / "bundle"}));
    EXPECT_EQ(testutil::ReadFile(tmp / "bundle/a"), "1");
    EXPECT_EQ(testutil::ReadFile(tmp / "bundle/keep.txt"), "keep");
    EXPECT_FALSE(testutil::Exists(tmp / "bundle-1"));
}

TEST_F(OutputPlacementTests, SingleEntryPolicies) {
    auto spec = Spec(tmp / "data.zip", {Layer::Zip});
    OutputPlacement placement(PlacementOptions{});

    Destination dest;
    ASSERT_TRUE(Extract(placement, spec, {{"data.csv", "1,2"}}, dest, quiet).ok);
    EXPECT_EQ(testutil::ReadFile(tmp / "data/data.csv"), "1,2");

    InteractionController rename(false, OneEntryPolicy::Rename);
    ASSERT_TRUE(Extract(placement, spec, {{"data.csv", "1,2"}}, dest, rename).ok);
    EXPECT_EQ(dest.produced, (std::vector<std::string>{tmp / "data-1"}));
    EXPECT_FALSE(testutil::IsDir(tmp / "data-1"));

    InteractionController here(false, OneEntryPolicy::Here);
    ASSERT_TRUE(Extract(placement, spec, {{"data.csv", "1,2"}}, dest, here).ok);
    EXPECT_EQ(dest.produced, (std::vector<std::string>{tmp / "data.csv"}));
}

TEST_F(OutputPlacementTests, InteractiveSkipLeavesExistingAlone) {
    ASSERT_EQ(::mkdir((tmp / "bundle").c_str(), 0755), 0);
    auto prompter = std::make_shared<AnswerPrompter>("s");
    InteractionController ui(true, std::nullopt, prompter);

    OutputPlacement placement(PlacementOptions{});
    Destination dest;
    auto r = Extract(placement, Spec(tmp / "bundle.zip", {Layer::Zip}), {{"a", "1"}, {"b", "2"}},
                     dest, ui);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, peel::ErrorKind::DestinationCollision);
    EXPECT_EQ(prompter->asked, 1);
    EXPECT_FALSE(testutil::Exists(tmp / "bundle-1"));
}

TEST_F(OutputPlacementTests, EmptyArchiveProducesNothing) {
    OutputPlacement placement(PlacementOptions{});
    Destination dest;
    ASSERT_TRUE(Extract(placement, Spec(tmp / "empty.tar", {Layer::Tar}), {}, dest, quiet).ok);
    EXPECT_TRUE(dest.produced.empty());
    EXPECT_FALSE(testutil::Exists(tmp / "empty"));
}

TEST_F(OutputPlacementTests, FlatModeMergesIntoParentButSparesArchive) {
    testutil::WriteFile(tmp / "pkg.zip", "archive bytes");
    testutil::WriteFile(tmp / "a", "old");

    OutputPlacement placement(PlacementOptions{.flat = true});
    Destination dest;
    auto spec = Spec(tmp / "pkg.zip", {Layer::Zip});
    ASSERT_TRUE(Extract(placement, spec, {{"a", "new"}, {"pkg.zip", "inner"}}, dest, quiet).ok);

    EXPECT_EQ(testutil::ReadFile(tmp / "a"), "new");
    EXPECT_EQ(testutil::ReadFile(tmp / "pkg.zip"), "archive bytes");
    EXPECT_EQ(testutil::ReadFile(tmp / "pkg.zip-1"), "inner");
}

TEST_F(OutputPlacementTests, PartialOutputKeptUnderBaseName) {
    OutputPlacement placement(PlacementOptions{});
    Destination dest;
    ScopedTempDir staging;
    auto spec = Spec(tmp / "broken.tar", {Layer::Tar});
    ASSERT_TRUE(placement.Prepare(spec, tmp.Path(), dest, staging).ok);
    testutil::WriteFile(staging.Path() + "/first.txt", "ok");

    ASSERT_TRUE(placement.PlacePartial(dest, staging).ok);
    EXPECT_EQ(dest.produced, (std::vector<std::string>{tmp / "broken"}));
    EXPECT_EQ(testutil::ReadFile(tmp / "broken/first.txt"), "ok");
}

} // namespace
