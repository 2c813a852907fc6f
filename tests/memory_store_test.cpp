#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>
#include "adapters/memory_store.hpp"
#include "test_util.hpp"

using namespace bxfer;

namespace {

auto bytes(const std::string& s) -> std::span<const char> {
    return {s.data(), s.size()};
}

} // namespace

TEST(MemoryStoreTest, WriteCreatesParents)
{
    adapters::MemoryStore store;
    test::put_object(store, "/a/b/c.txt", "hello");

    EXPECT_TRUE(store.is_dir("/a"));
    EXPECT_TRUE(store.is_dir("/a/b"));
    EXPECT_FALSE(store.is_dir("/a/b/c.txt"));
    EXPECT_EQ(store.size("/a/b/c.txt").value(), 5u);
    EXPECT_EQ(test::cat_object(store, "a/b/c.txt"), "hello");
}

TEST(MemoryStoreTest, WriteWithoutOverwriteRefusesExisting)
{
    adapters::MemoryStore store;
    test::put_object(store, "/x", "one");

    const std::string two = "two";
    auto res = store.write("/x", bytes(two), false);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, infra::ErrorCode::PermissionDenied);
    EXPECT_EQ(test::cat_object(store, "/x"), "one");
}

TEST(MemoryStoreTest, ReadIsPositionalAndShortAtEnd)
{
    adapters::MemoryStore store;
    test::put_object(store, "/f", "0123456789");

    auto mid = store.read("/f", 3, 4);
    ASSERT_TRUE(mid.has_value());
    EXPECT_EQ(std::string(mid->begin(), mid->end()), "3456");

    auto tail = store.read("/f", 8, 100);
    EXPECT_EQ(std::string(tail->begin(), tail->end()), "89");

    auto past = store.read("/f", 10, 5);
    EXPECT_TRUE(past->empty());

    EXPECT_EQ(store.read("/missing", 0, 1).error().code, infra::ErrorCode::NotFound);
}

TEST(MemoryStoreTest, AppendExtends)
{
    adapters::MemoryStore store;
    const std::string a = "abc", b = "def";
    ASSERT_TRUE(store.append("/log", bytes(a)).has_value());
    ASSERT_TRUE(store.append("/log", bytes(b)).has_value());
    EXPECT_EQ(test::cat_object(store, "/log"), "abcdef");
}

TEST(MemoryStoreTest, ListIsSortedAndShallow)
{
    adapters::MemoryStore store;
    test::put_object(store, "/d/zeta", "1");
    test::put_object(store, "/d/alpha", "22");
    test::put_object(store, "/d/mid/deep", "333");

    auto entries = store.list("/d");
    ASSERT_TRUE(entries.has_value());
    ASSERT_EQ(entries->size(), 3u);
    EXPECT_EQ((*entries)[0].name, "alpha");
    EXPECT_EQ((*entries)[0].size, 2u);
    EXPECT_EQ((*entries)[1].name, "mid");
    EXPECT_TRUE((*entries)[1].is_dir);
    EXPECT_EQ((*entries)[2].name, "zeta");

    EXPECT_EQ(store.list("/nope").error().code, infra::ErrorCode::NotFound);
    EXPECT_EQ(store.list("/d/zeta").error().code, infra::ErrorCode::InvalidPath);
}

TEST(MemoryStoreTest, ConcatJoinsPartsInOrder)
{
    adapters::MemoryStore store;
    test::put_object(store, "/tmp/p0", "abc");
    test::put_object(store, "/tmp/p1", "");
    test::put_object(store, "/tmp/p2", "def");

    ASSERT_TRUE(store.concat("/out/file", {"/tmp/p0", "/tmp/p1", "/tmp/p2"}).has_value());
    EXPECT_EQ(test::cat_object(store, "/out/file"), "abcdef");
    // parts are left for the caller to remove
    EXPECT_TRUE(store.exists("/tmp/p0"));
}

TEST(MemoryStoreTest, ConcatWithMissingPartLeavesTargetUntouched)
{
    adapters::MemoryStore store;
    test::put_object(store, "/out/file", "previous");
    test::put_object(store, "/tmp/p0", "abc");

    auto res = store.concat("/out/file", {"/tmp/p0", "/tmp/p1"});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, infra::ErrorCode::NotFound);
    EXPECT_EQ(test::cat_object(store, "/out/file"), "previous");
}

TEST(MemoryStoreTest, RemoveRules)
{
    adapters::MemoryStore store;
    test::put_object(store, "/d/sub/f", "x");

    EXPECT_TRUE(store.remove("/never/was", false).has_value());
    EXPECT_EQ(store.remove("/d", false).error().code, infra::ErrorCode::InvalidPath);

    ASSERT_TRUE(store.remove("/d", true).has_value());
    EXPECT_FALSE(store.exists("/d"));
    EXPECT_FALSE(store.exists("/d/sub/f"));
    EXPECT_TRUE(store.exists("/"));
}

TEST(MemoryStoreTest, DiskUsage)
{
    adapters::MemoryStore store;
    test::make_remote_tree(store, "/root");

    auto deep = store.du("/root", true);
    ASSERT_TRUE(deep.has_value());
    EXPECT_EQ(deep->size(), 5u);
    EXPECT_EQ(store.du_total("/root", true).value(), 10040u);

    auto shallow = store.du("/root", false);
    ASSERT_TRUE(shallow.has_value());
    ASSERT_EQ(shallow->size(), 3u);
    EXPECT_EQ(shallow->at("/root/nested1"), 30u);
    EXPECT_EQ(shallow->at("/root/bigfile"), 10000u);
    EXPECT_EQ(store.du_total("/root", false).value(), 10040u);
}

TEST(MemoryStoreTest, InfoReportsKindAndLength)
{
    adapters::MemoryStore store;
    test::put_object(store, "/d/f", "12345");

    auto file = store.info("/d/f");
    ASSERT_TRUE(file.has_value());
    EXPECT_EQ(file->length, 5u);
    EXPECT_FALSE(file->is_dir);
    EXPECT_TRUE(store.info("/d")->is_dir);
    EXPECT_EQ(store.info("/zz").error().code, infra::ErrorCode::NotFound);
}

TEST(MemoryStoreTest, ConcurrentWritersToDistinctObjects)
{
    adapters::MemoryStore store;
    std::vector<std::jthread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&store, t] {
            for (int i = 0; i < 50; ++i) {
                test::put_object(store, "/w/" + std::to_string(t) + "/" + std::to_string(i), "x");
            }
        });
    }
    threads.clear();

    EXPECT_EQ(store.du("/w", true)->size(), 400u);
}
