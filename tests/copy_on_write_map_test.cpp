#include "storage/copy_on_write_map.hpp"

#include <algorithm>
#include <atomic>
#include <map>
#include <memory>
#include <new>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

namespace cowmap {

namespace {

// Renders a snapshot in key order so two renderings can be compared.
template <typename Map>
std::string render(const Map& snapshot) {
    std::map<std::string, std::string> ordered(snapshot.begin(), snapshot.end());
    std::ostringstream oss;
    for (const auto& [k, v] : ordered) {
        oss << k << '=' << v << ';';
    }
    return oss.str();
}

// Value whose copy constructor can be armed to throw after a given number of
// successful copies.  Moves never throw.
struct Fragile {
    static inline std::atomic<int> copies_left{-1}; // -1 = disarmed
    static inline bool throw_bad_alloc = true;

    std::string text;

    explicit Fragile(std::string t) : text(std::move(t)) {}

    Fragile(const Fragile& other) : text(other.text) {
        int left = copies_left.load();
        if (left == 0) {
            if (throw_bad_alloc) {
                throw std::bad_alloc();
            }
            throw std::runtime_error("copy failed");
        }
        if (left > 0) {
            copies_left.store(left - 1);
        }
    }

    Fragile(Fragile&&) noexcept            = default;
    Fragile& operator=(const Fragile&)     = default;
    Fragile& operator=(Fragile&&) noexcept = default;
};

} // anonymous namespace

// ── Fixture ───────────────────────────────────────────────────────────────────

class CopyOnWriteMapTest : public ::testing::Test {
protected:
    CopyOnWriteMap<std::string> map_;
};

// ── Basic contract ────────────────────────────────────────────────────────────

TEST_F(CopyOnWriteMapTest, StartsEmpty) {
    EXPECT_EQ(map_.size(), 0u);
    EXPECT_FALSE(map_.get("missing").has_value());
}

TEST_F(CopyOnWriteMapTest, ReadYourWrites) {
    map_.put("a", "1");
    auto v = map_.get("a");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, "1");
}

TEST_F(CopyOnWriteMapTest, EveryPutPublishesNewSnapshot) {
    auto before = map_.snapshot();
    map_.put("a", "1");
    auto after_insert = map_.snapshot();
    map_.put("a", "1"); // same key, same value: still a fresh copy
    auto after_overwrite = map_.snapshot();

    EXPECT_NE(before, after_insert);
    EXPECT_NE(after_insert, after_overwrite);
    EXPECT_EQ(render(*after_insert), render(*after_overwrite));
}

TEST_F(CopyOnWriteMapTest, SnapshotReturnsPublishedObjectWithoutCopying) {
    map_.put("a", "1");
    EXPECT_EQ(map_.snapshot(), map_.snapshot());
}

TEST_F(CopyOnWriteMapTest, DelOfMissingKeyPublishesNothing) {
    map_.put("a", "1");
    auto before = map_.snapshot();
    EXPECT_FALSE(map_.del("b"));
    EXPECT_EQ(map_.snapshot(), before);
}

TEST_F(CopyOnWriteMapTest, EmptyKeyLeavesSnapshotUntouched) {
    map_.put("a", "1");
    auto before = map_.snapshot();
    EXPECT_THROW(map_.put("", "x"), std::invalid_argument);
    EXPECT_THROW(map_.del(""), std::invalid_argument);
    EXPECT_EQ(map_.snapshot(), before);
}

// ── Snapshot isolation ────────────────────────────────────────────────────────

TEST_F(CopyOnWriteMapTest, HeldSnapshotContentNeverChanges) {
    for (int i = 0; i < 10; ++i) {
        map_.put(std::to_string(i), "v" + std::to_string(i));
    }
    auto held = map_.snapshot();
    const std::string before = render(*held);

    map_.put("3", "changed");
    map_.put("new", "entry");
    map_.del("5");
    map_.clear();

    EXPECT_EQ(render(*held), before);
    EXPECT_EQ(map_.size(), 0u);
}

// ── Options ───────────────────────────────────────────────────────────────────

TEST(CopyOnWriteMapOptionsTest, DefaultsDescribeReadMostlyWorkload) {
    CopyOnWriteMap<int> map;
    EXPECT_EQ(map.options().max_keys, 10000u);
    EXPECT_EQ(map.options().expected_read_write_ratio, 1000u);
}

TEST(CopyOnWriteMapOptionsTest, MaxKeysIsNotEnforced) {
    MapOptions options;
    options.max_keys = 2;
    CopyOnWriteMap<int> map{options};

    for (int i = 0; i < 5; ++i) {
        map.put("k" + std::to_string(i), i);
    }
    EXPECT_EQ(map.size(), 5u);
    EXPECT_EQ(*map.get("k4"), 4);
}

// ── Failure atomicity ─────────────────────────────────────────────────────────

class CopyOnWriteMapFailureTest : public ::testing::Test {
protected:
    void SetUp() override {
        Fragile::copies_left     = -1;
        Fragile::throw_bad_alloc = true;
        map_.put("a", Fragile{"1"});
        map_.put("b", Fragile{"2"});
        map_.put("c", Fragile{"3"});
    }

    void TearDown() override { Fragile::copies_left = -1; }

    CopyOnWriteMap<Fragile> map_;
};

TEST_F(CopyOnWriteMapFailureTest, OutOfMemoryDuringPutKeepsPreviousSnapshot) {
    auto before = map_.snapshot();

    Fragile::copies_left = 1; // second copied entry throws
    EXPECT_THROW(map_.put("d", Fragile{"4"}), std::bad_alloc);
    Fragile::copies_left = -1;

    EXPECT_EQ(map_.snapshot(), before);
    EXPECT_EQ(map_.size(), 3u);
    EXPECT_FALSE(map_.get("d").has_value());
    EXPECT_EQ(map_.get("a")->text, "1");
}

TEST_F(CopyOnWriteMapFailureTest, ThrowingCopyDuringDelKeepsPreviousSnapshot) {
    auto before = map_.snapshot();

    Fragile::throw_bad_alloc = false;
    Fragile::copies_left     = 0;
    EXPECT_THROW(map_.del("a"), std::runtime_error);
    Fragile::copies_left = -1;

    EXPECT_EQ(map_.snapshot(), before);
    EXPECT_TRUE(map_.get("a").has_value());
}

TEST_F(CopyOnWriteMapFailureTest, MapStaysWritableAfterFailedPut) {
    Fragile::copies_left = 0;
    EXPECT_THROW(map_.put("d", Fragile{"4"}), std::bad_alloc);
    Fragile::copies_left = -1;

    map_.put("d", Fragile{"4"});
    EXPECT_EQ(map_.size(), 4u);
    EXPECT_EQ(map_.get("d")->text, "4");
}

// ── Concurrency properties ────────────────────────────────────────────────────

// Each writer owns a block of keys and also races on one shared key.  Any
// serial order of the puts leaves every owned key at its writer's value and
// the shared key at some writer's final value.
TEST_F(CopyOnWriteMapTest, ConcurrentWritersAreLinearizable) {
    constexpr int kWriters = 8;
    constexpr int kIters   = 100;

    std::vector<std::thread> writers;
    writers.reserve(kWriters);
    for (int w = 0; w < kWriters; ++w) {
        writers.emplace_back([&, w] {
            for (int i = 0; i < kIters; ++i) {
                map_.put("w" + std::to_string(w) + "_" + std::to_string(i), std::to_string(w));
                map_.put("shared", std::to_string(w) + ":" + std::to_string(i));
            }
        });
    }
    for (auto& t : writers) t.join();

    EXPECT_EQ(map_.size(), static_cast<std::size_t>(kWriters * kIters + 1));
    for (int w = 0; w < kWriters; ++w) {
        for (int i = 0; i < kIters; ++i) {
            auto v = map_.get("w" + std::to_string(w) + "_" + std::to_string(i));
            ASSERT_TRUE(v.has_value());
            EXPECT_EQ(*v, std::to_string(w));
        }
    }

    const auto shared = map_.get("shared");
    ASSERT_TRUE(shared.has_value());
    const auto colon = shared->find(':');
    ASSERT_NE(colon, std::string::npos);
    EXPECT_EQ(shared->substr(colon + 1), std::to_string(kIters - 1));
}

// The writer always bumps "x" before "y", one put each.  A reader that sees
// a mix of two snapshots could observe y ahead of x or the two more than one
// step apart.
TEST_F(CopyOnWriteMapTest, SnapshotsAreNeverMixed) {
    map_.put("x", "0");
    map_.put("y", "0");

    constexpr int kReaders = 6;
    constexpr int kRounds  = 2000;

    std::atomic<bool> done{false};
    std::atomic<int>  violations{0};

    std::vector<std::thread> readers;
    readers.reserve(kReaders);
    for (int r = 0; r < kReaders; ++r) {
        readers.emplace_back([&] {
            while (!done.load(std::memory_order_acquire)) {
                auto snap = map_.snapshot();
                const int x = std::stoi(snap->at("x"));
                const int y = std::stoi(snap->at("y"));
                if (x < y || x - y > 1) {
                    ++violations;
                }
            }
        });
    }

    for (int i = 1; i <= kRounds; ++i) {
        map_.put("x", std::to_string(i));
        map_.put("y", std::to_string(i));
    }
    done.store(true, std::memory_order_release);
    for (auto& t : readers) t.join();

    EXPECT_EQ(violations.load(), 0);
    EXPECT_EQ(*map_.get("y"), std::to_string(kRounds));
}

// Once put() returns on one thread, a get() that starts afterwards on any
// thread sees that write.
TEST_F(CopyOnWriteMapTest, CompletedWriteIsVisibleToLaterReaders) {
    constexpr int kRounds = 500;

    std::atomic<int> published{-1};
    std::atomic<int> stale{0};

    std::thread reader([&] {
        int last = -1;
        while (last < kRounds - 1) {
            const int expected = published.load();
            if (expected < 0) {
                continue;
            }
            auto v = map_.get("k");
            if (!v || std::stoi(*v) < expected) {
                ++stale;
            }
            last = expected;
        }
    });

    for (int i = 0; i < kRounds; ++i) {
        map_.put("k", std::to_string(i));
        published.store(i);
    }
    reader.join();

    EXPECT_EQ(stale.load(), 0);
}

} // namespace cowmap
