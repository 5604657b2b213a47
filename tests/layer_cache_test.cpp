#include <gtest/gtest.h>
#include "layer_cache.hpp"
#include "test_utils.hpp"

#include <stdexcept>
#include <utility>

TEST(LayerCacheTest, StartsEmptyAndAdoptsShapeOnFirstAppend) {
    LayerCache cache;
    EXPECT_TRUE(cache.empty());
    EXPECT_TRUE(cache.history().empty());

    cache.append(test_utils::random_state(2, 3, 4, 1));
    EXPECT_EQ(cache.steps(), 3);
    EXPECT_EQ(cache.batch(), 2);
    EXPECT_EQ(cache.hidden_dim(), 4);
}

TEST(LayerCacheTest, HistoryPreservesOrderAcrossGrowth) {
    LayerCache cache;
    HiddenState all = test_utils::random_state(2, 9, 3, 2);

    // One step at a time forces several capacity doublings.
    for (int t = 0; t < 9; ++t) {
        cache.append(all.slice(t, 1));
        ASSERT_EQ(cache.steps(), t + 1);
    }

    HiddenState history = cache.history();
    ASSERT_EQ(history.seq_len(), 9);
    for (int b = 0; b < 2; ++b) {
        EXPECT_TRUE(history[b] == all[b]);
    }
}

TEST(LayerCacheTest, ReserveBeforeFirstAppendKeepsContents) {
    LayerCache cache;
    cache.reserve(16);
    HiddenState x = test_utils::random_state(1, 2, 3, 3);
    cache.append(x);
    cache.reserve(32);
    EXPECT_TRUE(cache.history()[0] == x[0]);
}

TEST(LayerCacheTest, RejectsMismatchedAppend) {
    LayerCache cache;
    cache.append(test_utils::random_state(2, 1, 4, 4));
    EXPECT_THROW(cache.append(test_utils::random_state(3, 1, 4, 5)), std::runtime_error);
    EXPECT_THROW(cache.append(test_utils::random_state(2, 1, 5, 6)), std::runtime_error);
    EXPECT_EQ(cache.steps(), 1);
}

TEST(LayerCacheTest, StagedRowsAreViewedButNotCommitted) {
    LayerCache cache;
    HiddenState all = test_utils::random_state(2, 3, 4, 7);
    cache.append(all.slice(0, 2));

    cache.stage(all.slice(2, 1));
    EXPECT_EQ(cache.steps(), 2);
    EXPECT_EQ(cache.history().seq_len(), 2);

    StateViews view = cache.view();
    ASSERT_EQ(view.size(), 2u);
    for (int b = 0; b < 2; ++b) {
        EXPECT_TRUE(view[b] == all[b]);
    }

    cache.commit();
    EXPECT_EQ(cache.steps(), 3);
    EXPECT_TRUE(cache.history()[1] == all[1]);
}

TEST(LayerCacheTest, RestagingReplacesUncommittedRows) {
    LayerCache cache;
    HiddenState kept = test_utils::random_state(1, 1, 4, 8);
    HiddenState dropped = test_utils::random_state(1, 1, 4, 9);
    HiddenState next = test_utils::random_state(1, 1, 4, 10);
    cache.append(kept);

    cache.stage(dropped);
    cache.stage(next);
    cache.commit();

    HiddenState history = cache.history();
    ASSERT_EQ(history.seq_len(), 2);
    EXPECT_TRUE(history[0].row(0) == kept[0].row(0));
    EXPECT_TRUE(history[0].row(1) == next[0].row(0));
}

TEST(LayerCacheTest, MoveLeavesSourceEmpty) {
    LayerCache cache;
    cache.append(test_utils::random_state(2, 3, 4, 11));

    LayerCache moved = std::move(cache);
    EXPECT_EQ(moved.steps(), 3);
    EXPECT_EQ(cache.steps(), 0);
    EXPECT_EQ(cache.batch(), 0);
    EXPECT_TRUE(cache.view().empty());

    cache = std::move(moved);
    EXPECT_EQ(cache.steps(), 3);
    EXPECT_EQ(moved.steps(), 0);
}

TEST(CacheStackTest, NeedsAtLeastOneLayer) {
    EXPECT_THROW(CacheStack(0), std::runtime_error);

    CacheStack stack(3, 8);
    EXPECT_EQ(stack.num_layers(), 3);
    EXPECT_TRUE(stack.empty());
    EXPECT_EQ(stack.layer(2).steps(), 0);
    EXPECT_THROW(stack.layer(3), std::out_of_range);
}
