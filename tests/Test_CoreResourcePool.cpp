#include <gtest/gtest.h>
#include <memory>
#include <string>

import Core;

namespace
{
    struct PipelineTag {};
    using Handle = Core::StrongHandle<PipelineTag>;

    struct FakePipeline
    {
        std::string Name;
    };

    using Pool = Core::ResourcePool<FakePipeline, Handle>;
}

TEST(ResourcePool, AddAndGet)
{
    Pool pool;
    const Handle h = pool.Create(FakePipeline{"Lit"});
    ASSERT_TRUE(h.IsValid());

    auto result = pool.Get(h);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ((*result)->Name, "Lit");
    EXPECT_TRUE(pool.Contains(h));
    EXPECT_EQ(pool.Size(), 1u);
}

TEST(ResourcePool, GetUnknownHandle_ResourceNotFound)
{
    Pool pool;
    auto result = pool.Get(Handle{5, 1});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Core::ErrorCode::ResourceNotFound);
    EXPECT_EQ(pool.GetUnchecked(Handle{}), nullptr);
}

TEST(ResourcePool, RemoveDeferredRecycle)
{
    Pool pool;
    pool.Initialize(2);

    const Handle h0 = pool.Create(FakePipeline{"A"});

    // Soft delete at frame 10: lookups fail immediately.
    pool.Remove(h0, 10);
    EXPECT_FALSE(pool.Get(h0).has_value());
    EXPECT_EQ(pool.Size(), 0u);

    // Not yet reclaimed: a new resource takes a fresh slot.
    pool.ProcessDeletions(12);
    const Handle h1 = pool.Create(FakePipeline{"B"});
    EXPECT_NE(h1.Index, h0.Index);

    // Reclaimed: the slot recycles with a bumped generation.
    pool.ProcessDeletions(13);
    const Handle h2 = pool.Create(FakePipeline{"C"});
    EXPECT_EQ(h2.Index, h0.Index);
    EXPECT_NE(h2.Generation, h0.Generation);

    EXPECT_FALSE(pool.Get(h0).has_value()); // stale handle
    ASSERT_TRUE(pool.Get(h2).has_value());
    EXPECT_EQ((*pool.Get(h2))->Name, "C");
}

TEST(ResourcePool, Replace_KeepsHandle)
{
    Pool pool;
    const Handle h = pool.Create(FakePipeline{"Lit"});

    auto replaced = pool.Replace(h, std::make_unique<FakePipeline>(FakePipeline{"Lit (rebuilt)"}), 1);
    ASSERT_TRUE(replaced.has_value());

    auto result = pool.Get(h);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ((*result)->Name, "Lit (rebuilt)");
    EXPECT_EQ(pool.Size(), 1u);
}

TEST(ResourcePool, Replace_StaleHandleFails)
{
    Pool pool;
    const Handle h = pool.Create(FakePipeline{"Lit"});
    pool.Remove(h, 0);

    auto replaced = pool.Replace(h, std::make_unique<FakePipeline>(), 0);
    ASSERT_FALSE(replaced.has_value());
    EXPECT_EQ(replaced.error(), Core::ErrorCode::ResourceNotFound);
}

TEST(ResourcePool, Clear)
{
    Pool pool;
    const Handle h = pool.Create(FakePipeline{"Lit"});
    pool.Clear();

    EXPECT_FALSE(pool.Contains(h));
    EXPECT_EQ(pool.Capacity(), 0u);
    EXPECT_EQ(pool.Size(), 0u);
}
