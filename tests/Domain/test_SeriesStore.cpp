// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
#include "Domain/HistoryView.h"
#include "Domain/SeriesKind.h"
#include "Domain/SeriesStore.h"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <thread>
#include <vector>

namespace Domain
{
namespace
{

using Samples = std::vector<std::uint64_t>;

void pushAll(SeriesStore& store, const SeriesKind& kind, std::initializer_list<std::uint64_t> values)
{
    for (const auto value : values)
    {
        store.push(kind, value);
    }
}

// =============================================================================
// Tracking
// =============================================================================

TEST(SeriesStoreTest, UnknownKindIsAbsent)
{
    SeriesStore store(10);
    EXPECT_FALSE(store.lookup(SeriesKind::ioRead(), HistoryView{}).has_value());
}

TEST(SeriesStoreTest, TrackedKindWithoutDataIsEmpty)
{
    SeriesStore store(10);
    store.track(SeriesKind::ioWrite());

    const auto window = store.lookup(SeriesKind::ioWrite(), HistoryView{});
    ASSERT_TRUE(window.has_value());
    EXPECT_TRUE(window->empty());
}

TEST(SeriesStoreTest, FileSystemSeriesAreKeyedByName)
{
    SeriesStore store(10);
    store.push(SeriesKind::fileSystemUsedSpace("/dev/sda1"), 42);

    EXPECT_TRUE(store.lookup(SeriesKind::fileSystemUsedSpace("/dev/sda1"), HistoryView{}).has_value());
    EXPECT_FALSE(store.lookup(SeriesKind::fileSystemUsedSpace("/dev/sdb1"), HistoryView{}).has_value());
    EXPECT_EQ(store.trackedCount(), 1U);
}

TEST(SeriesStoreTest, ForgetDropsSeries)
{
    SeriesStore store(10);
    store.push(SeriesKind::ioRead(), 1);
    store.forget(SeriesKind::ioRead());

    EXPECT_FALSE(store.lookup(SeriesKind::ioRead(), HistoryView{}).has_value());
    EXPECT_EQ(store.trackedCount(), 0U);
}

// =============================================================================
// Windowing
// =============================================================================

TEST(SeriesStoreTest, ReturnsOldestFirst)
{
    SeriesStore store(10);
    pushAll(store, SeriesKind::ioRead(), {10, 50, 30});

    EXPECT_EQ(store.lookup(SeriesKind::ioRead(), HistoryView{}), Samples({10, 50, 30}));
}

TEST(SeriesStoreTest, WidthKeepsNewestPoints)
{
    SeriesStore store(10);
    pushAll(store, SeriesKind::ioRead(), {1, 2, 3, 4, 5});

    const HistoryView view{.width = 2, .zoomFactor = 1, .offset = 0};
    EXPECT_EQ(store.lookup(SeriesKind::ioRead(), view), Samples({4, 5}));
}

TEST(SeriesStoreTest, OffsetScrollsBack)
{
    SeriesStore store(10);
    pushAll(store, SeriesKind::ioRead(), {1, 2, 3, 4, 5});

    const HistoryView view{.width = 2, .zoomFactor = 1, .offset = 1};
    EXPECT_EQ(store.lookup(SeriesKind::ioRead(), view), Samples({3, 4}));
}

TEST(SeriesStoreTest, OffsetPastHistoryIsEmpty)
{
    SeriesStore store(10);
    pushAll(store, SeriesKind::ioRead(), {1, 2});

    const HistoryView view{.width = 5, .zoomFactor = 1, .offset = 2};
    const auto window = store.lookup(SeriesKind::ioRead(), view);
    ASSERT_TRUE(window.has_value());
    EXPECT_TRUE(window->empty());
}

TEST(SeriesStoreTest, ZeroWidthIsEmpty)
{
    SeriesStore store(10);
    pushAll(store, SeriesKind::ioRead(), {1, 2});

    const HistoryView view{.width = 0, .zoomFactor = 1, .offset = 0};
    const auto window = store.lookup(SeriesKind::ioRead(), view);
    ASSERT_TRUE(window.has_value());
    EXPECT_TRUE(window->empty());
}

// =============================================================================
// Zoom
// =============================================================================

TEST(SeriesStoreTest, ZoomTakesBucketMaxAlignedToNewest)
{
    SeriesStore store(10);
    pushAll(store, SeriesKind::ioWrite(), {9, 1, 2, 8, 3});

    // Buckets from the newest end: [8, 3], [1, 2], [9]
    const HistoryView view{.width = 10, .zoomFactor = 2, .offset = 0};
    EXPECT_EQ(store.lookup(SeriesKind::ioWrite(), view), Samples({9, 2, 8}));
}

TEST(SeriesStoreTest, ZoomWithWidthAndOffset)
{
    SeriesStore store(20);
    pushAll(store, SeriesKind::ioWrite(), {1, 2, 3, 4, 5, 6, 7, 8});

    // Buckets: [1,2] [3,4] [5,6] [7,8] -> 2 4 6 8; skip newest, keep two
    const HistoryView view{.width = 2, .zoomFactor = 2, .offset = 1};
    EXPECT_EQ(store.lookup(SeriesKind::ioWrite(), view), Samples({4, 6}));
}

TEST(SeriesStoreTest, ZeroZoomIsTreatedAsOne)
{
    SeriesStore store(10);
    pushAll(store, SeriesKind::ioRead(), {4, 5});

    const HistoryView view{.width = 10, .zoomFactor = 0, .offset = 0};
    EXPECT_EQ(store.lookup(SeriesKind::ioRead(), view), Samples({4, 5}));
}

TEST(SeriesStoreTest, HugeZoomFoldsEverythingIntoOnePoint)
{
    SeriesStore store(10);
    pushAll(store, SeriesKind::ioRead(), {4, 9, 2});

    const HistoryView view{.width = 10, .zoomFactor = std::numeric_limits<std::size_t>::max(), .offset = 0};
    EXPECT_EQ(store.lookup(SeriesKind::ioRead(), view), Samples({9}));
}

TEST(SeriesStoreTest, ZoomLargerThanHistoryIsOneBucket)
{
    SeriesStore store(10);
    pushAll(store, SeriesKind::ioRead(), {4, 9, 2});

    const HistoryView view{.width = 10, .zoomFactor = 8, .offset = 0};
    EXPECT_EQ(store.lookup(SeriesKind::ioRead(), view), Samples({9}));
}

// =============================================================================
// Capacity
// =============================================================================

TEST(SeriesStoreTest, CapacityBoundsRetention)
{
    SeriesStore store(3);
    pushAll(store, SeriesKind::ioRead(), {1, 2, 3, 4, 5});

    EXPECT_EQ(store.lookup(SeriesKind::ioRead(), HistoryView{}), Samples({3, 4, 5}));
}

TEST(SeriesStoreTest, SetCapacityKeepsNewest)
{
    SeriesStore store(5);
    pushAll(store, SeriesKind::ioRead(), {1, 2, 3, 4, 5});

    store.setCapacity(2);

    EXPECT_EQ(store.capacity(), 2U);
    EXPECT_EQ(store.lookup(SeriesKind::ioRead(), HistoryView{}), Samples({4, 5}));
}

TEST(SeriesStoreTest, ConcurrentPushAndLookup)
{
    SeriesStore store(100);
    const auto kind = SeriesKind::ioRead();

    std::thread writer(
        [&store, &kind]
        {
            for (std::uint64_t i = 0; i < 1000; ++i)
            {
                store.push(kind, i);
            }
        });

    for (int i = 0; i < 200; ++i)
    {
        const auto window = store.lookup(kind, HistoryView{});
        if (window.has_value())
        {
            EXPECT_LE(window->size(), 100U);
        }
    }

    writer.join();
    const auto window = store.lookup(kind, HistoryView{.width = 1, .zoomFactor = 1, .offset = 0});
    EXPECT_EQ(window, Samples({999}));
}

} // namespace
} // namespace Domain
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
