#include <gtest/gtest.h>

#include <functional>

#include "TestSupport.hpp"
#include "core/Errors.hpp"
#include "core/metadata/CatalogStore.hpp"
#include "core/util/Ids.hpp"

using namespace zipcat;
using zipcat::test::TempDir;
using zipcat::test::listFiles;
namespace fs = std::filesystem;

namespace {

ArchiveRecord makeArchive(const std::string& path, const std::string& volume, int64_t size = 1000) {
  ArchiveRecord a;
  a.id = uuid4();
  a.source_path = path;
  a.volume = volume;
  a.size = size;
  a.modified_at = 1600000000;
  a.scanned_at = 1700000000;
  return a;
}

EntryRecord makeEntry(const std::string& entryPath, int64_t size,
                      Category cat = Category::Video, std::optional<std::string> hash = std::nullopt) {
  EntryRecord e;
  e.entry_path = entryPath;
  const auto slash = entryPath.find_last_of('/');
  e.name = slash == std::string::npos ? entryPath : entryPath.substr(slash + 1);
  e.size = size;
  e.compressed_size = size / 2;
  e.category = cat;
  e.content_hash = std::move(hash);
  return e;
}

std::vector<std::string> entryPaths(const std::vector<CatalogMatch>& ms) {
  std::vector<std::string> out;
  for (const auto& m : ms) out.push_back(m.entry.entry_path);
  return out;
}

ErrorCode errorOf(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const CatalogError& e) {
    return e.code();
  }
  ADD_FAILURE() << "no CatalogError thrown";
  return ErrorCode::StoreFailure;
}

class CatalogStoreTest : public ::testing::Test {
protected:
  TempDir dir;
  CatalogStore store{(dir / "catalog.db").string()};
};

} // namespace

TEST_F(CatalogStoreTest, InsertArchiveKeepsExistingIdForSameKey) {
  auto first = makeArchive("/mnt/a/photos.zip", "a");
  EXPECT_EQ(store.insertArchive(first), first.id);

  auto again = makeArchive("/mnt/a/photos.zip", "a", 2000);
  EXPECT_EQ(store.insertArchive(again), first.id);

  auto stored = store.archive(first.id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->size, 2000);
  EXPECT_FALSE(store.archive(again.id).has_value());
  EXPECT_EQ(store.stats().archives, 1);
}

TEST_F(CatalogStoreTest, SamePathOnTwoVolumesIsTwoArchives) {
  store.insertArchive(makeArchive("/data/photos.zip", "a"));
  store.insertArchive(makeArchive("/data/photos.zip", "b"));
  const auto s = store.stats();
  EXPECT_EQ(s.archives, 2);
  EXPECT_EQ(s.volumes, 2);
}

TEST_F(CatalogStoreTest, InsertArchiveRejectsIdOwnedByAnotherKey) {
  auto a = makeArchive("/x/a.zip", "v");
  store.insertArchive(a);
  auto b = makeArchive("/x/b.zip", "v");
  b.id = a.id;
  EXPECT_EQ(errorOf([&] { store.insertArchive(b); }), ErrorCode::MergeConflict);
}

TEST_F(CatalogStoreTest, InsertEntriesIsIdempotent) {
  auto a = makeArchive("/x/a.zip", "v");
  const std::vector<EntryRecord> entries{makeEntry("t/1.mp4", 10), makeEntry("t/2.mp4", 20)};
  store.insertProbe(a, entries);
  store.insertEntries(a.id, entries);
  EXPECT_EQ(store.stats().entries, 2);
  EXPECT_EQ(store.stats().total_bytes, 30);
}

TEST_F(CatalogStoreTest, QueryFiltersAndOrdering) {
  auto b = makeArchive("/vol/b.zip", "v");
  auto a = makeArchive("/vol/a.zip", "v");
  store.insertProbe(b, {makeEntry("trip/IMG_0002.mp4", 5000), makeEntry("trip/pic.jpg", 300, Category::Image)});
  store.insertProbe(a, {makeEntry("trip/IMG_0001.mp4", 42000000), makeEntry("docs/100%_done.txt", 10, Category::Document)});

  EXPECT_EQ(entryPaths(store.query({})),
            (std::vector<std::string>{"docs/100%_done.txt", "trip/IMG_0001.mp4", "trip/IMG_0002.mp4", "trip/pic.jpg"}));

  QueryFilter byName;
  byName.name = "img_";
  EXPECT_EQ(entryPaths(store.query(byName)),
            (std::vector<std::string>{"trip/IMG_0001.mp4", "trip/IMG_0002.mp4"}));

  QueryFilter literal;
  literal.name = "100%";
  EXPECT_EQ(entryPaths(store.query(literal)), (std::vector<std::string>{"docs/100%_done.txt"}));

  QueryFilter re;
  re.regex = R"(IMG_\d{4}\.mp4$)";
  re.min_size = 10000;
  EXPECT_EQ(entryPaths(store.query(re)), (std::vector<std::string>{"trip/IMG_0001.mp4"}));

  QueryFilter range;
  range.min_size = 100;
  range.max_size = 5000;
  EXPECT_EQ(entryPaths(store.query(range)), (std::vector<std::string>{"trip/IMG_0002.mp4", "trip/pic.jpg"}));

  QueryFilter cats;
  cats.categories = {Category::Image, Category::Document};
  EXPECT_EQ(entryPaths(store.query(cats)), (std::vector<std::string>{"docs/100%_done.txt", "trip/pic.jpg"}));

  QueryFilter one;
  one.archive_id = b.id;
  one.limit = 1;
  const auto limited = store.query(one);
  ASSERT_EQ(limited.size(), 1u);
  EXPECT_EQ(limited[0].archive.source_path, "/vol/b.zip");
  EXPECT_EQ(limited[0].entry.entry_path, "trip/IMG_0002.mp4");
}

TEST_F(CatalogStoreTest, QueryRejectsBadInput) {
  QueryFilter bad;
  bad.regex = "([unclosed";
  EXPECT_EQ(errorOf([&] { store.query(bad); }), ErrorCode::InvalidQuery);

  QueryFilter range;
  range.min_size = 10;
  range.max_size = 5;
  EXPECT_EQ(errorOf([&] { store.query(range); }), ErrorCode::InvalidQuery);
}

TEST_F(CatalogStoreTest, ListArchivesCountsEntries) {
  auto a = makeArchive("/v/a.zip", "v");
  auto b = makeArchive("/v/b.zip", "v");
  store.insertProbe(a, {makeEntry("1.mp4", 1), makeEntry("2.mp4", 2)});
  store.insertProbe(b, {makeEntry("3.mp4", 3)});

  const auto all = store.listArchives();
  ASSERT_EQ(all.size(), 2u);
  EXPECT_EQ(all[0].archive.id, a.id);
  EXPECT_EQ(all[0].entry_count, 2);
  EXPECT_EQ(all[1].entry_count, 1);
  EXPECT_EQ(store.listArchives(1).size(), 1u);
}

TEST_F(CatalogStoreTest, VolumeStatsBreakDownPerVolume) {
  store.insertProbe(makeArchive("/mnt/b/one.zip", "usb"), {makeEntry("a.mp4", 100), makeEntry("b.mp4", 50)});
  store.insertProbe(makeArchive("/mnt/b/two.zip", "usb"), {makeEntry("c.jpg", 10, Category::Image)});
  store.insertProbe(makeArchive("/mnt/a/three.zip", "backup"), {makeEntry("d.mp4", 7)});
  store.insertArchive(makeArchive("/mnt/c/empty.zip", "cold"));

  const auto rows = store.volumeStats();
  ASSERT_EQ(rows.size(), 3u);
  EXPECT_EQ(rows[0].volume, "backup");
  EXPECT_EQ(rows[0].archives, 1);
  EXPECT_EQ(rows[0].entries, 1);
  EXPECT_EQ(rows[0].total_bytes, 7);
  EXPECT_EQ(rows[1].volume, "cold");
  EXPECT_EQ(rows[1].archives, 1);
  EXPECT_EQ(rows[1].entries, 0);
  EXPECT_EQ(rows[1].total_bytes, 0);
  EXPECT_EQ(rows[2].volume, "usb");
  EXPECT_EQ(rows[2].archives, 2);
  EXPECT_EQ(rows[2].entries, 3);
  EXPECT_EQ(rows[2].total_bytes, 160);
}

TEST_F(CatalogStoreTest, VideoFilterListsOnlyVideos) {
  store.insertProbe(makeArchive("/v/a.zip", "v"), {
    makeEntry("clips/b.mp4", 10),
    makeEntry("clips/a.mov", 20),
    makeEntry("photos/c.jpg", 30, Category::Image),
  });
  EXPECT_EQ(entryPaths(store.query(videoFilter())), (std::vector<std::string>{"clips/a.mov", "clips/b.mp4"}));
  EXPECT_EQ(store.query(videoFilter(1)).size(), 1u);
}

TEST_F(CatalogStoreTest, DuplicatesOnlyAmongHashedEntries) {
  store.insertProbe(makeArchive("/v/a.zip", "v"), {makeEntry("x.mp4", 7, Category::Video, "h1"),
                                                   makeEntry("y.mp4", 8)});
  store.insertProbe(makeArchive("/w/b.zip", "w"), {makeEntry("copy-of-x.mp4", 7, Category::Video, "h1"),
                                                   makeEntry("y.mp4", 8)});
  const auto groups = store.duplicateEntries();
  ASSERT_EQ(groups.size(), 1u);
  EXPECT_EQ(groups[0].content_hash, "h1");
  EXPECT_EQ(groups[0].size, 7);
  EXPECT_EQ(groups[0].members.size(), 2u);
}

// -------- merge --------

TEST_F(CatalogStoreTest, MergeIsAdditiveAcrossDisjointSources) {
  std::vector<std::unique_ptr<CatalogStore>> sources;
  int64_t archives = 0, entries = 0;
  for (int s = 0; s < 3; ++s) {
    sources.push_back(CatalogStore::createIsolated(dir.path(), "src" + std::to_string(s)));
    for (int a = 0; a <= s; ++a) {
      std::vector<EntryRecord> es;
      for (int e = 0; e < 3 + a; ++e) es.push_back(makeEntry("f" + std::to_string(e) + ".mp4", 100 + e));
      sources.back()->insertProbe(makeArchive("/v" + std::to_string(s) + "/" + std::to_string(a) + ".zip",
                                              "v" + std::to_string(s)), es);
      ++archives;
      entries += static_cast<int64_t>(es.size());
    }
  }

  for (auto& src : sources) {
    const auto before = src->listArchives();
    const auto m = store.mergeFrom(*src);
    EXPECT_EQ(m.archives_skipped, 0);
    EXPECT_EQ(m.entries_skipped, 0);
    // Ids and per-archive entry sets survive the merge.
    for (const auto& l : before) {
      QueryFilter f;
      f.archive_id = l.archive.id;
      EXPECT_EQ(static_cast<int64_t>(store.query(f).size()), l.entry_count);
    }
  }
  const auto s = store.stats();
  EXPECT_EQ(s.archives, archives);
  EXPECT_EQ(s.entries, entries);
}

TEST_F(CatalogStoreTest, MergeIsIdempotent) {
  auto src = CatalogStore::createIsolated(dir.path(), "job");
  src->insertProbe(makeArchive("/v/a.zip", "v"), {makeEntry("1.mp4", 1), makeEntry("2.mp4", 2)});

  const auto first = store.mergeFrom(*src);
  EXPECT_EQ(first.archives_merged, 1);
  EXPECT_EQ(first.entries_merged, 2);

  const auto second = store.mergeFrom(*src);
  EXPECT_EQ(second.archives_merged, 0);
  EXPECT_EQ(second.entries_merged, 0);
  EXPECT_EQ(second.archives_skipped, 1);
  EXPECT_EQ(second.entries_skipped, 2);
  EXPECT_EQ(store.stats().archives, 1);
  EXPECT_EQ(store.stats().entries, 2);
}

TEST_F(CatalogStoreTest, MergeRekeysEntriesOntoExistingArchive) {
  auto existing = makeArchive("/v/a.zip", "v");
  store.insertProbe(existing, {makeEntry("old.mp4", 1)});

  auto src = CatalogStore::createIsolated(dir.path(), "rescan");
  auto rescanned = makeArchive("/v/a.zip", "v");  // fresh id, same natural key
  src->insertProbe(rescanned, {makeEntry("old.mp4", 5), makeEntry("new.mp4", 2)});

  const auto m = store.mergeFrom(*src);
  EXPECT_EQ(m.archives_skipped, 1);
  EXPECT_EQ(m.entries_merged, 1);
  EXPECT_EQ(m.entries_skipped, 1);

  EXPECT_FALSE(store.archive(rescanned.id).has_value());
  QueryFilter f;
  f.archive_id = existing.id;
  const auto rows = store.query(f);
  EXPECT_EQ(entryPaths(rows), (std::vector<std::string>{"new.mp4", "old.mp4"}));
  EXPECT_EQ(rows[1].entry.size, 5);
}

TEST_F(CatalogStoreTest, MergeConflictRollsBackEverything) {
  auto owner = makeArchive("/v/a.zip", "v");
  store.insertProbe(owner, {makeEntry("a.mp4", 1)});

  auto src = CatalogStore::createIsolated(dir.path(), "bad");
  src->insertProbe(makeArchive("/v/ok.zip", "v"), {makeEntry("ok.mp4", 1)});
  auto clash = makeArchive("/v/other.zip", "v");
  clash.id = owner.id;
  src->insertProbe(clash, {makeEntry("b.mp4", 1)});

  EXPECT_EQ(errorOf([&] { store.mergeFrom(*src); }), ErrorCode::MergeConflict);
  EXPECT_EQ(store.stats().archives, 1);
  EXPECT_EQ(store.stats().entries, 1);

  // The store stays usable after the failed merge.
  auto good = CatalogStore::createIsolated(dir.path(), "good");
  good->insertProbe(makeArchive("/v/ok.zip", "v"), {makeEntry("ok.mp4", 1)});
  EXPECT_EQ(store.mergeFrom(*good).archives_merged, 1);
}

TEST_F(CatalogStoreTest, DisposeRemovesIsolatedFiles) {
  auto src = CatalogStore::createIsolated(dir / "tmp", "job");
  src->insertProbe(makeArchive("/v/a.zip", "v"), {makeEntry("1.mp4", 1)});
  store.mergeFrom(*src);
  EXPECT_FALSE(listFiles(dir / "tmp").empty());

  src->dispose();
  EXPECT_TRUE(src->disposed());
  EXPECT_TRUE(listFiles(dir / "tmp").empty());
  EXPECT_EQ(errorOf([&] { src->stats(); }), ErrorCode::StoreFailure);
  src->dispose();  // second call is a no-op
}

TEST_F(CatalogStoreTest, DisposeKeepsTheFinalCatalogFile) {
  store.insertProbe(makeArchive("/v/a.zip", "v"), {makeEntry("1.mp4", 1)});
  store.dispose();
  EXPECT_TRUE(fs::exists(dir / "catalog.db"));

  CatalogStore reopened((dir / "catalog.db").string());
  EXPECT_EQ(reopened.stats().entries, 1);
}
