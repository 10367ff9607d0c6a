#include <gtest/gtest.h>
#include "aggregation_pipeline.hpp"
#include "synthetic_generator.hpp"

#include <cmath>
#include <map>
#include <numeric>
#include <set>

TEST(CategoryCountsTest, FollowsPowerLawWeights) {
    const uint64_t n = 20'000'000;
    const auto counts = CategoryCounts(700, n, 1.3);
    ASSERT_EQ(counts.size(), 700u);

    double sum = 0.0;
    for (uint32_t i = 0; i < 700; ++i) {
        sum += 1.0 / std::pow(i + 1.0, 1.3);
    }
    for (uint32_t i = 0; i < 700; ++i) {
        const double expected = (1.0 / std::pow(i + 1.0, 1.3)) / sum * static_cast<double>(n);
        EXPECT_LE(std::fabs(static_cast<double>(counts[i]) - expected), 1.0) << "category " << i;
    }
    for (uint32_t i = 1; i < 700; ++i) {
        EXPECT_LE(counts[i], counts[i - 1]);
    }
    EXPECT_GT(counts[699], 0u);

    const uint64_t total = std::accumulate(counts.begin(), counts.end(), uint64_t{0});
    EXPECT_LE(std::llabs(static_cast<long long>(total) - static_cast<long long>(n)), 700);
}

TEST(CategoryCountsTest, UniformWhenExponentIsZero) {
    const auto counts = CategoryCounts(4, 100, 0.0);
    EXPECT_EQ(counts, (std::vector<uint64_t>{25, 25, 25, 25}));
}

class SyntheticGeneratorTest : public ::testing::Test {
protected:
    SSourceConfig MakeConfig() {
        SSourceConfig cfg;
        cfg.num_records = 200'000;
        cfg.num_categories = 50;
        cfg.batch_size = 30'000;
        cfg.seed = 7;
        return cfg;
    }
};

TEST_F(SyntheticGeneratorTest, EveryCategoryGetsAggregates) {
    const SSourceConfig cfg = MakeConfig();
    SEngineConfig engine;
    engine.workers = 2;
    CAggregationPipeline pipeline(engine, cfg.num_categories);
    auto table = std::make_shared<CTableSink>();
    pipeline.Subscribe(table);
    pipeline.Start();

    std::atomic<bool> keep_running{true};
    CSyntheticGenerator generator(cfg);
    const SGeneratorStats stats = generator.Run(*pipeline.Session(), keep_running);
    pipeline.Stop();

    const auto expected = CategoryCounts(cfg.num_categories, cfg.num_records, cfg.weight_exponent);
    EXPECT_EQ(stats.inserted_per_category, expected);
    EXPECT_EQ(stats.inserted, std::accumulate(expected.begin(), expected.end(), uint64_t{0}));
    EXPECT_EQ(stats.retracted, 0u);
    EXPECT_EQ(stats.batches, (stats.inserted + cfg.batch_size - 1) / cfg.batch_size);
    EXPECT_EQ(pipeline.BatchesProcessed(), stats.batches);

    std::set<uint32_t> categories;
    for (const auto& entry : table->Snapshot()) {
        const SAggregateRecord& agg = entry.second;
        categories.insert(agg.category);
        EXPECT_EQ(agg.bucket % kBucketWidthSec, 0);
        EXPECT_GE(agg.bucket, FloorToBucket(cfg.start_time));
        EXPECT_LE(agg.bucket, cfg.end_time);
        EXPECT_GE(agg.high, CPrice::FromUnits(cfg.min_price));
        EXPECT_LT(agg.high, CPrice::FromUnits(cfg.max_price));
    }
    EXPECT_EQ(categories.size(), cfg.num_categories);
    EXPECT_EQ(table->Size(), pipeline.Engine().LiveCount());
}

TEST_F(SyntheticGeneratorTest, SameSeedSameOutput) {
    SSourceConfig cfg = MakeConfig();
    cfg.num_records = 20'000;
    cfg.batch_size = 5'000;

    auto run = [&cfg]() {
        CAggregationPipeline pipeline(SEngineConfig{}, cfg.num_categories);
        auto table = std::make_shared<CTableSink>();
        pipeline.Subscribe(table);
        pipeline.Start();
        std::atomic<bool> keep_running{true};
        CSyntheticGenerator(cfg).Run(*pipeline.Session(), keep_running);
        pipeline.Stop();
        return table->Snapshot();
    };
    EXPECT_EQ(run(), run());
}

TEST_F(SyntheticGeneratorTest, RetractionsReachTheQueueAsNegativeDiffs) {
    SSourceConfig cfg = MakeConfig();
    cfg.num_categories = 5;
    cfg.num_records = 20'000;
    cfg.batch_size = 1'000;
    cfg.retract_probability = 0.5;

    auto queue = std::make_shared<CBatchQueue>();
    CInputSession session(queue, cfg.num_categories);
    std::atomic<bool> keep_running{true};
    const SGeneratorStats stats = CSyntheticGenerator(cfg).Run(session, keep_running);
    queue->Stop();

    // Net multiplicity per record over all committed batches so far.
    std::map<SRecord, int64_t> live;
    uint64_t negative = 0;
    uint64_t batches = 0;
    SBatch batch;
    while (queue->Pop(batch)) {
        ++batches;
        for (const auto& diff : batch.diffs) {
            if (diff.multiplicity < 0) {
                ++negative;
                // Only records committed by an earlier batch are retracted.
                ASSERT_GE(live[diff.record], -diff.multiplicity) << diff.record;
            }
        }
        for (const auto& diff : batch.diffs) {
            live[diff.record] += diff.multiplicity;
        }
    }
    EXPECT_EQ(batches, stats.batches);
    EXPECT_GT(stats.retracted, 0u);
    EXPECT_EQ(negative, stats.retracted);
}

TEST_F(SyntheticGeneratorTest, RetractionsKeepTableConsistent) {
    SSourceConfig cfg = MakeConfig();
    cfg.num_records = 50'000;
    cfg.batch_size = 5'000;
    cfg.retract_probability = 0.3;

    SEngineConfig engine;
    engine.workers = 2;
    CAggregationPipeline pipeline(engine, cfg.num_categories);
    auto table = std::make_shared<CTableSink>();
    pipeline.Subscribe(table);
    pipeline.Start();
    std::atomic<bool> keep_running{true};
    const SGeneratorStats stats = CSyntheticGenerator(cfg).Run(*pipeline.Session(), keep_running);
    EXPECT_NO_THROW(pipeline.Stop());

    EXPECT_GT(stats.retracted, 0u);
    EXPECT_LT(stats.retracted, stats.inserted);
    EXPECT_GT(table->Retractions(), 0u);
    EXPECT_EQ(table->Size(), pipeline.Engine().LiveCount());
    for (const auto& entry : table->Snapshot()) {
        EXPECT_EQ(pipeline.Engine().Query(entry.first), entry.second);
    }
}

TEST_F(SyntheticGeneratorTest, StopsWhenAskedTo) {
    SSourceConfig cfg = MakeConfig();
    auto queue = std::make_shared<CBatchQueue>();
    CInputSession session(queue, cfg.num_categories);
    std::atomic<bool> keep_running{false};

    const SGeneratorStats stats = CSyntheticGenerator(cfg).Run(session, keep_running);
    EXPECT_EQ(stats.inserted, 0u);
    EXPECT_EQ(stats.batches, 0u);
    EXPECT_EQ(queue->Size(), 0u);
}
