#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "TestSupport.hpp"
#include "core/metadata/CatalogStore.hpp"
#include "core/util/Ids.hpp"
#include "services/api/HttpServer.hpp"

using namespace zipcat;
using nlohmann::json;
using zipcat::test::TempDir;

namespace {

EntryRecord entry(const std::string& path, int64_t size, Category cat) {
  EntryRecord e;
  e.entry_path = path;
  e.name = path.substr(path.find_last_of('/') + 1);
  e.size = size;
  e.compressed_size = size;
  e.category = cat;
  return e;
}

// Serves the catalog routes on an ephemeral loopback port.
class HttpServerTest : public ::testing::Test {
protected:
  void SetUp() override {
    ArchiveRecord a;
    a.id = uuid4();
    a.source_path = "/media/usb/takeout-1.zip";
    a.volume = "usb";
    a.size = 4096;
    archiveId = store.insertProbe(a, {entry("trip/clip.mp4", 3000, Category::Video),
                                      entry("trip/notes.txt", 20, Category::Document)});
    start();
  }

  void TearDown() override { stop(); }

  virtual std::string apiKey() const { return ""; }

  void start() {
    register_routes(svr, store, apiKey());
    port = svr.bind_to_any_port("127.0.0.1");
    ASSERT_GT(port, 0);
    listener = std::thread([this] { svr.listen_after_bind(); });
    for (int i = 0; i < 200 && !svr.is_running(); ++i)
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    ASSERT_TRUE(svr.is_running());
  }

  void stop() {
    svr.stop();
    if (listener.joinable()) listener.join();
  }

  httplib::Result get(const std::string& path, const httplib::Headers& headers = {}) {
    httplib::Client cli("127.0.0.1", port);
    return cli.Get(path, headers);
  }

  TempDir dir;
  CatalogStore store{(dir / "catalog.db").string()};
  std::string archiveId;
  httplib::Server svr;
  std::thread listener;
  int port = 0;
};

} // namespace

TEST_F(HttpServerTest, SearchReturnsMatches) {
  auto res = get("/search?q=clip");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  const auto body = json::parse(res->body);
  EXPECT_EQ(body["count"], 1);
  EXPECT_EQ(body["results"][0]["entry_path"], "trip/clip.mp4");
  EXPECT_EQ(body["results"][0]["archive_id"], archiveId);

  res = get("/search?categories=document");
  ASSERT_TRUE(res);
  EXPECT_EQ(json::parse(res->body)["results"][0]["name"], "notes.txt");
}

TEST_F(HttpServerTest, BadQueriesAreRejectedWith400) {
  auto res = get("/search?regex=%28");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  EXPECT_EQ(json::parse(res->body)["error"], "InvalidQuery");

  res = get("/search?min_size=abc");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);

  res = get("/search?categories=holograms");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
}

TEST_F(HttpServerTest, ArchiveDetailListsItsEntries) {
  auto res = get("/archives/" + archiveId);
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  const auto body = json::parse(res->body);
  EXPECT_EQ(body["volume"], "usb");
  EXPECT_EQ(body["entries"].size(), 2u);
}

TEST_F(HttpServerTest, UnknownArchiveIs404) {
  auto res = get("/archives/" + uuid4());
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 404);
  EXPECT_EQ(json::parse(res->body)["error"], "NotFound");
}

TEST_F(HttpServerTest, StatsAndVolumes) {
  auto res = get("/stats");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  auto body = json::parse(res->body);
  EXPECT_EQ(body["archives"], 1);
  EXPECT_EQ(body["entries"], 2);
  EXPECT_EQ(body["total_bytes"], 3020);

  res = get("/volumes");
  ASSERT_TRUE(res);
  body = json::parse(res->body);
  ASSERT_EQ(body.size(), 1u);
  EXPECT_EQ(body[0]["volume"], "usb");
  EXPECT_EQ(body[0]["entries"], 2);
}

class KeyedHttpServerTest : public HttpServerTest {
protected:
  std::string apiKey() const override { return "secret"; }
};

TEST_F(KeyedHttpServerTest, ApiKeyIsEnforced) {
  auto res = get("/stats");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 401);

  res = get("/stats", {{"X-API-Key", "secret"}});
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);

  res = get("/health");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
}
