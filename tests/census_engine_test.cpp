// census_engine_test.cpp - Sort policy and navigation engine tests
#include "test_helpers.h"

#include <gtest/gtest.h>

#include <clocale>
#include <unistd.h>

namespace {

DirectoryEntry dir_entry(const std::string& name, std::optional<size_t> count) {
    DirectoryEntry entry;
    entry.name = name;
    entry.path = fs::path("/listing") / name;
    entry.is_dir = true;
    entry.file_count = count;
    return entry;
}

DirectoryEntry file_entry(const std::string& name) {
    DirectoryEntry entry;
    entry.name = name;
    entry.path = fs::path("/listing") / name;
    return entry;
}

std::vector<std::string> names_of(const std::vector<DirectoryEntry>& entries) {
    std::vector<std::string> names;
    for (const auto& entry : entries) {
        names.push_back(entry.name);
    }
    return names;
}

} // namespace

TEST(SortPolicy, CountDescendingThenNameThenFiles) {
    std::vector<DirectoryEntry> entries = {
        dir_entry("A", 5), file_entry("d.txt"), dir_entry("B", 5), dir_entry("C", 10)
    };
    sort_entries(entries);
    EXPECT_EQ(names_of(entries), (std::vector<std::string>{"C", "A", "B", "d.txt"}));
}

TEST(SortPolicy, UnknownCountsFollowKnownCounts) {
    std::vector<DirectoryEntry> entries = {dir_entry("Z", std::nullopt), dir_entry("A", 0)};
    sort_entries(entries);
    EXPECT_EQ(names_of(entries), (std::vector<std::string>{"A", "Z"}));

    std::vector<DirectoryEntry> unknown = {dir_entry("beta", std::nullopt), dir_entry("Alpha", std::nullopt)};
    sort_entries(unknown);
    EXPECT_EQ(names_of(unknown), (std::vector<std::string>{"Alpha", "beta"}));
}

TEST(SortPolicy, FilesIgnoreCaseAndNeverCompareCounts) {
    std::vector<DirectoryEntry> entries = {file_entry("b.txt"), file_entry("A.txt"), file_entry("c.txt")};
    entries[0].file_count = 100;
    sort_entries(entries);
    EXPECT_EQ(names_of(entries), (std::vector<std::string>{"A.txt", "b.txt", "c.txt"}));
}

TEST(SortPolicy, SortingTwiceGivesTheSameOrder) {
    std::vector<DirectoryEntry> entries = {
        dir_entry("x", 3), dir_entry("X", 3), dir_entry("y", std::nullopt), file_entry("Readme"),
        file_entry("readme"), dir_entry("w", 3), dir_entry("a", 1)
    };
    sort_entries(entries);
    std::vector<std::string> first = names_of(entries);
    sort_entries(entries);
    EXPECT_EQ(names_of(entries), first);

    std::vector<DirectoryEntry> reversed(entries.rbegin(), entries.rend());
    sort_entries(reversed);
    EXPECT_EQ(names_of(reversed), first);
}

TEST(SortPolicy, PinnedEntryStaysFirst) {
    std::vector<DirectoryEntry> entries = {
        dir_entry(PARENT_ENTRY_LABEL, std::nullopt), dir_entry("big", 50), file_entry("a.txt")
    };
    sort_entries(entries, 1);
    EXPECT_EQ(names_of(entries), (std::vector<std::string>{PARENT_ENTRY_LABEL, "big", "a.txt"}));
}

TEST(SortPolicy, FoldCase) {
    EXPECT_EQ(fold_case("MiXeD.TXT"), "mixed.txt");
    EXPECT_EQ(fold_case("bad\xff" "Name"), "bad\xff" "name");
}

TEST(SortPolicy, NonAsciiNamesIgnoreCase) {
    const char* current = std::setlocale(LC_CTYPE, nullptr);
    const std::string saved = current ? current : "C";
    if (!std::setlocale(LC_CTYPE, "C.UTF-8") && !std::setlocale(LC_CTYPE, "en_US.UTF-8")) {
        GTEST_SKIP() << "no UTF-8 locale available";
    }

    std::vector<DirectoryEntry> files = {file_entry("\xc3\x89" "bc"), file_entry("\xc3\xa9" "a")};
    sort_entries(files);
    std::vector<DirectoryEntry> dirs = {
        dir_entry("\xc3\x9c" "ber", std::nullopt), dir_entry("\xc3\xbc" "ad", std::nullopt)
    };
    sort_entries(dirs);
    const std::string folded = fold_case("\xc3\x89" "COLE");
    std::setlocale(LC_CTYPE, saved.c_str());

    EXPECT_EQ(names_of(files), (std::vector<std::string>{"\xc3\xa9" "a", "\xc3\x89" "bc"}));
    EXPECT_EQ(names_of(dirs), (std::vector<std::string>{"\xc3\xbc" "ad", "\xc3\x9c" "ber"}));
    EXPECT_EQ(folded, "\xc3\xa9" "cole");
}

class NavigationEngineTest : public ::testing::Test {
protected:
    TempTree tree;

    void SetUp() override {
        tree.make_files("docs", 3);
        tree.make_files("src", 10);
        tree.make_file("README");
    }
};

TEST_F(NavigationEngineTest, HomeListingHasNoParentEntry) {
    NavigationEngine engine(tree.root(), 2);

    EXPECT_EQ(engine.get_current_dir(), tree.root());
    EXPECT_EQ(engine.get_home_dir(), tree.root());
    EXPECT_FALSE(engine.has_parent_entry());
    ASSERT_EQ(engine.get_items().size(), 3u);
    EXPECT_EQ(listing_names(engine), (std::vector<std::string>{"docs", "src", "README"}));
    EXPECT_EQ(engine.get_selected_index(), 0u);
}

TEST_F(NavigationEngineTest, CountsResolveAndReorderListing) {
    NavigationEngine engine(tree.root(), 2);
    EXPECT_NE(engine.header_text("..").find("(Counting files..)"), std::string::npos);

    wait_for_counts(engine);

    ASSERT_TRUE(all_counts_known(engine));
    EXPECT_EQ(listing_names(engine), (std::vector<std::string>{"src", "docs", "README"}));
    EXPECT_EQ(*engine.get_items()[0].file_count, 10u);
    EXPECT_EQ(*engine.get_items()[1].file_count, 3u);
    EXPECT_FALSE(engine.get_items()[2].file_count.has_value());
    EXPECT_EQ(*engine.get_current_dir_count(), 14u);
    EXPECT_EQ(engine.header_text(".."), tree.root().string() + " (Total files: 14)");
}

TEST_F(NavigationEngineTest, EnterThenHomeUsesCachedCounts) {
    NavigationEngine engine(tree.root(), 2);
    wait_for_counts(engine);
    const size_t jobs_before = engine.census_dispatcher().submitted_jobs();

    ASSERT_TRUE(engine.enter(index_of(engine, "src")));
    EXPECT_EQ(engine.get_current_dir(), tree.root() / "src");
    ASSERT_TRUE(engine.has_parent_entry());
    EXPECT_EQ(engine.get_items()[0].name, PARENT_ENTRY_LABEL);
    EXPECT_EQ(engine.get_items()[0].path, tree.root());
    EXPECT_TRUE(engine.get_items()[0].is_dir);
    EXPECT_EQ(*engine.get_items()[0].file_count, 14u);
    EXPECT_EQ(engine.get_items().size(), 11u);
    EXPECT_EQ(*engine.get_current_dir_count(), 10u);

    engine.go_home();
    EXPECT_EQ(engine.get_current_dir(), tree.root());
    EXPECT_EQ(listing_names(engine), (std::vector<std::string>{"src", "docs", "README"}));
    EXPECT_TRUE(all_counts_known(engine));
    EXPECT_EQ(engine.census_dispatcher().submitted_jobs(), jobs_before);
    EXPECT_EQ(engine.census_cache().size(), 3u);
}

TEST_F(NavigationEngineTest, EnteredDirectoryIsNotItsOwnParent) {
    NavigationEngine engine(tree.root(), 2);
    ASSERT_TRUE(engine.enter(index_of(engine, "docs")));

    fs::path docs = tree.root() / "docs";
    EXPECT_EQ(engine.get_items()[0].path, tree.root());
    for (const auto& entry : engine.get_items()) {
        EXPECT_NE(entry.path, docs);
    }
}

TEST_F(NavigationEngineTest, EnterIgnoresFilesAndBadIndices) {
    NavigationEngine engine(tree.root(), 2);

    EXPECT_FALSE(engine.enter(index_of(engine, "README")));
    EXPECT_EQ(engine.get_current_dir(), tree.root());

    EXPECT_FALSE(engine.enter(engine.get_items().size()));
    EXPECT_FALSE(engine.enter(1000));
    EXPECT_EQ(engine.get_current_dir(), tree.root());
    EXPECT_EQ(engine.get_items().size(), 3u);
}

TEST_F(NavigationEngineTest, ParentEntryNeverLeavesHome) {
    NavigationEngine engine(tree.root(), 2);
    ASSERT_TRUE(engine.enter(index_of(engine, "src")));
    ASSERT_TRUE(engine.enter(0));

    EXPECT_EQ(engine.get_current_dir(), tree.root());
    EXPECT_FALSE(engine.has_parent_entry());
}

TEST_F(NavigationEngineTest, SelectionWrapsBothWays) {
    NavigationEngine engine(tree.root(), 2);
    ASSERT_EQ(engine.get_items().size(), 3u);

    engine.retreat_selection();
    EXPECT_EQ(engine.get_selected_index(), 2u);
    engine.advance_selection();
    EXPECT_EQ(engine.get_selected_index(), 0u);
    engine.advance_selection();
    engine.advance_selection();
    EXPECT_EQ(engine.get_selected_index(), 2u);
    engine.advance_selection();
    EXPECT_EQ(engine.get_selected_index(), 0u);

    engine.select(1);
    EXPECT_EQ(engine.get_selected_index(), 1u);
    engine.select(99);
    EXPECT_EQ(engine.get_selected_index(), 1u);
}

TEST_F(NavigationEngineTest, SelectionIndexIsClampedAcrossDirectoryChange) {
    NavigationEngine engine(tree.root(), 2);
    engine.select(index_of(engine, "src"));
    const size_t src_index = engine.get_selected_index();
    ASSERT_EQ(src_index, 1u);

    ASSERT_TRUE(engine.enter(src_index));
    EXPECT_EQ(engine.get_selected_index(), src_index);

    engine.select(engine.get_items().size() - 1);
    engine.go_home();
    EXPECT_EQ(engine.get_selected_index(), engine.get_items().size() - 1);
}

TEST_F(NavigationEngineTest, SelectionFollowsEntryWhenCountsReorder) {
    NavigationEngine engine(tree.root(), 2);
    // Before any result is merged the listing is in name order
    ASSERT_EQ(listing_names(engine), (std::vector<std::string>{"docs", "src", "README"}));
    engine.select(0);

    wait_for_counts(engine);

    ASSERT_EQ(listing_names(engine), (std::vector<std::string>{"src", "docs", "README"}));
    EXPECT_EQ(engine.get_items()[engine.get_selected_index()].name, "docs");
}

TEST_F(NavigationEngineTest, MergeCountUpdate) {
    NavigationEngine engine(tree.root(), 2);
    wait_for_counts(engine);

    EXPECT_FALSE(engine.merge_count_update(tree.root() / "elsewhere", 5));

    EXPECT_TRUE(engine.merge_count_update(tree.root(), 99));
    EXPECT_EQ(*engine.get_current_dir_count(), 99u);

    EXPECT_TRUE(engine.merge_count_update(tree.root() / "docs", 7));
    EXPECT_EQ(*engine.get_items()[index_of(engine, "docs")].file_count, 7u);

    EXPECT_FALSE(engine.drain_results());
}

TEST_F(NavigationEngineTest, PendingActionIsConsumedOnce) {
    NavigationEngine engine(tree.root(), 2);
    EXPECT_FALSE(engine.pending_action().has_value());
    EXPECT_FALSE(engine.process_pending_action());

    engine.queue_enter(index_of(engine, "src"));
    ASSERT_TRUE(engine.pending_action().has_value());
    EXPECT_EQ(engine.pending_action()->kind, ActionKind::EnterDirectory);

    EXPECT_TRUE(engine.process_pending_action());
    EXPECT_FALSE(engine.pending_action().has_value());
    EXPECT_EQ(engine.get_current_dir(), tree.root() / "src");
    EXPECT_FALSE(engine.process_pending_action());
}

TEST_F(NavigationEngineTest, LaterPendingActionReplacesEarlierOne) {
    NavigationEngine engine(tree.root(), 2);
    engine.queue_enter(index_of(engine, "src"));
    engine.queue_enter(index_of(engine, "README"));

    EXPECT_FALSE(engine.process_pending_action());
    EXPECT_FALSE(engine.pending_action().has_value());
    EXPECT_EQ(engine.get_current_dir(), tree.root());
}

TEST(NavigationEngineEmpty, EmptyListingIgnoresMovement) {
    TempTree tree;
    NavigationEngine engine(tree.root(), 1);
    ASSERT_TRUE(engine.get_items().empty());

    engine.advance_selection();
    engine.retreat_selection();
    EXPECT_EQ(engine.get_selected_index(), 0u);
    EXPECT_FALSE(engine.enter(0));

    wait_for_counts(engine);
    EXPECT_EQ(*engine.get_current_dir_count(), 0u);
}

TEST(NavigationEngineEmpty, UnreadableDirectoryListsAsEmpty) {
    if (::geteuid() == 0) {
        GTEST_SKIP() << "permission checks do not apply to root";
    }
    TempTree tree;
    tree.make_files("locked", 3);
    tree.make_dir("locked/inner");
    fs::permissions(tree.root() / "locked", fs::perms::owner_exec);

    NavigationEngine engine(tree.root(), 1);
    ASSERT_TRUE(engine.enter(index_of(engine, "locked")));

    ASSERT_EQ(engine.get_items().size(), 1u);
    EXPECT_EQ(engine.get_items()[0].name, PARENT_ENTRY_LABEL);
    wait_for_counts(engine);
    EXPECT_EQ(*engine.get_current_dir_count(), 0u);
}

TEST(NavigationEngineEmpty, VanishedDirectoryListsAsEmpty) {
    TempTree tree;
    tree.make_files("gone", 4);
    tree.make_files("work/sub", 2);

    NavigationEngine engine(tree.root(), 1);
    wait_for_counts(engine);
    const size_t gone_index = index_of(engine, "gone");
    fs::remove_all(tree.root() / "gone");

    ASSERT_TRUE(engine.enter(gone_index));
    EXPECT_EQ(engine.get_current_dir(), tree.root() / "gone");
    ASSERT_EQ(engine.get_items().size(), 1u);
    EXPECT_EQ(engine.get_items()[0].name, PARENT_ENTRY_LABEL);

    NavigationEngine work_engine(tree.root() / "work", 1);
    ASSERT_EQ(work_engine.get_items().size(), 1u);
    fs::remove_all(tree.root() / "work");
    work_engine.refresh_items();
    EXPECT_TRUE(work_engine.get_items().empty());
    EXPECT_EQ(work_engine.get_selected_index(), 0u);
}

TEST(NavigationEngineEmpty, StartDirectoryWithTrailingSlashIsNormalised) {
    TempTree tree;
    tree.make_dir("child");
    NavigationEngine engine(tree.root().string() + "/", 1);

    EXPECT_EQ(engine.get_home_dir(), tree.root());
    ASSERT_TRUE(engine.enter(0));
    EXPECT_EQ(engine.get_items()[0].path, tree.root());
}
