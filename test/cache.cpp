#include <Tyche/cache/generation.hpp>
#include <Tyche/entropy/mix.hpp>
#include "statistics.hpp"
#include "gtest/gtest.h"

namespace Tyche {

    TEST (Cache, Windows) {
        cache_windows standard {10000};
        EXPECT_EQ (standard.StochasticJitter, 2000);
        EXPECT_EQ (standard.ClusteringWeights, 1000);
        EXPECT_EQ (standard.TemporalVariance, 2000);
        EXPECT_EQ (standard.ContentSeeds, 2000);
        EXPECT_EQ (standard.SimilarityThresholds, 2000);
        EXPECT_EQ (standard.ExplorationPaths, 1000);

        for (size_t total : {50, 77, 123, 999, 10000, 12345}) {
            cache_windows w {total};
            EXPECT_EQ (w.ClusteringWeights % WeightDimension, 0) << total;
            EXPECT_EQ (w.StochasticJitter + w.ClusteringWeights + w.TemporalVariance +
                w.ContentSeeds + w.SimilarityThresholds + w.ExplorationPaths, total) << total;
            EXPECT_GT (w.ClusteringWeights, 0) << total;
            EXPECT_GT (w.ExplorationPaths, 0) << total;
        }
    }

    TEST (Cache, Transforms) {
        // a stream that hits both ends of [0, 1).
        values stream (100);
        for (int i = 0; i < 100; i++) stream[i] = (i % 2 == 0) ? 0.0 : 0.999999;

        derived_caches caches = build_caches (stream);
        cache_windows w {100};

        EXPECT_EQ (caches.size (cache_name::stochastic_jitter), w.StochasticJitter);
        EXPECT_EQ (caches.size (cache_name::clustering_weights), w.ClusteringWeights / WeightDimension);
        EXPECT_EQ (caches.size (cache_name::temporal_variance), w.TemporalVariance);
        EXPECT_EQ (caches.size (cache_name::content_seeds), w.ContentSeeds);
        EXPECT_EQ (caches.size (cache_name::similarity_thresholds), w.SimilarityThresholds);
        EXPECT_EQ (caches.size (cache_name::exploration_paths), w.ExplorationPaths);

        EXPECT_DOUBLE_EQ (caches.StochasticJitter[0], -0.1);
        EXPECT_DOUBLE_EQ (caches.TemporalVariance[0], 0.5);
        EXPECT_DOUBLE_EQ (caches.SimilarityThresholds[0], 0.1);
        EXPECT_EQ (caches.ContentSeeds[0], 0);

        for (double x : caches.StochasticJitter) EXPECT_LE (x, 0.1);
        for (double x : caches.TemporalVariance) EXPECT_LE (x, 2.0);
        for (double x : caches.SimilarityThresholds) EXPECT_LE (x, 0.8);
        for (seed x : caches.ContentSeeds) EXPECT_LT (x, int64 (1) << 31);

        // exploration paths are the stream itself.
        EXPECT_EQ (caches.ExplorationPaths, values (stream.end () - w.ExplorationPaths, stream.end ()));
    }

    TEST (Cache, ZeroWeightVectorIsDropped) {
        values stream (100, 0.5);
        // the first weight vector comes right after the jitter window.
        cache_windows w {100};
        for (size_t i = 0; i < WeightDimension; i++) stream[w.StochasticJitter + i] = 0.0;

        derived_caches caches = build_caches (stream);
        EXPECT_EQ (caches.ClusteringWeights.size (), w.ClusteringWeights / WeightDimension - 1);
        for (const weight_vector &v : caches.ClusteringWeights) for (double x : v) EXPECT_DOUBLE_EQ (x, 0.2);
    }

    TEST (Cache, Read) {
        values stream (200);
        for (int i = 0; i < 200; i++) stream[i] = i / 200.0;

        derived_caches caches = build_caches (stream);

        cache_values jitter = caches.read (cache_name::stochastic_jitter, 3);
        ASSERT_TRUE (jitter.is<values> ());
        EXPECT_EQ (jitter.get<values> (), values (caches.StochasticJitter.begin (), caches.StochasticJitter.begin () + 3));

        // fewer than requested if the cache is short.
        cache_values weights = caches.read (cache_name::clustering_weights, 100);
        ASSERT_TRUE ((weights.is<std::vector<weight_vector>> ()));
        EXPECT_EQ (weights.get<std::vector<weight_vector>> ().size (), caches.ClusteringWeights.size ());

        cache_values seeds = caches.read (cache_name::content_seeds, 5);
        ASSERT_TRUE (seeds.is<std::vector<seed>> ());

        JSON j = to_JSON (weights);
        ASSERT_TRUE (j.is_array ());
        EXPECT_EQ (j.size (), caches.ClusteringWeights.size ());
        EXPECT_EQ (j[0].size (), WeightDimension);

        JSON js = to_JSON (seeds);
        EXPECT_TRUE (js[0].is_number_integer ());

        EXPECT_THROW (caches.read (cache_name::invalid, 1), data::exception);
    }

    TEST (Cache, CacheNames) {
        for (cache_name c : all_caches ()) EXPECT_EQ (read_cache_name (string::write (c)), c);
        EXPECT_EQ (read_cache_name ("clustering-weights"), cache_name::clustering_weights);
        EXPECT_EQ (read_cache_name ("jitter"), cache_name::stochastic_jitter);
        EXPECT_EQ (read_cache_name ("nothing"), cache_name::invalid);

        EXPECT_EQ (max_read (cache_name::clustering_weights), 100);
        EXPECT_EQ (max_read (cache_name::stochastic_jitter), 1000);
        EXPECT_EQ (max_read (cache_name::content_seeds), 1000);
    }

    TEST (Cache, Generation) {
        collector c {100, test::seeded_random (), test::fixed_clock ()};
        entropy_options options {};

        EXPECT_THROW (generation::build (*c.pool (), options, clock::now ()), data::exception);

        auto pool = c.collect ();
        timestamp built_at = test::fixed_clock () ();
        generation g = generation::build (*pool, options, built_at);

        EXPECT_EQ (g.RefreshCount, pool->RefreshCount);
        EXPECT_EQ (g.EntropyRefreshedAt, pool->LastRefresh);
        EXPECT_EQ (g.GeneratedAt, built_at);
        EXPECT_EQ (g.Quality.size (), SourceCount);

        // the caches are cut from the mixed stream of the pool.
        derived_caches expected = build_caches (mix (*pool, options.CacheSize, options.MixSpread));
        EXPECT_EQ (g.Caches.StochasticJitter, expected.StochasticJitter);
        EXPECT_EQ (g.Caches.ExplorationPaths, expected.ExplorationPaths);

        cache_metadata m = g.metadata (cache_name::temporal_variance);
        EXPECT_EQ (m.Count, 2000);
        EXPECT_EQ (m.RefreshCount, 1);
        EXPECT_EQ (m.GeneratedAt, built_at);
        EXPECT_DOUBLE_EQ (m.Quality, g.Quality.overall ());
    }

    TEST (Cache, Contracts) {
        collector c {100, test::seeded_random (), test::fixed_clock ()};
        generation g = generation::build (*c.collect (), entropy_options {}, clock::now ());

        for (double x : g.Caches.StochasticJitter) {
            EXPECT_GE (x, -0.1);
            EXPECT_LE (x, 0.1);
        }

        EXPECT_LT (std::abs (test::mean (values (g.Caches.StochasticJitter.begin (), g.Caches.StochasticJitter.begin () + 100))), 0.05);

        for (const weight_vector &w : g.Caches.ClusteringWeights) {
            double sum = 0;
            for (double x : w) {
                EXPECT_GE (x, 0.0);
                sum += x;
            }

            EXPECT_NEAR (sum, 1.0, 0.01);
        }

        for (double x : g.Caches.TemporalVariance) {
            EXPECT_GE (x, 0.5);
            EXPECT_LE (x, 2.0);
        }

        double temporal_mean = test::mean (values (g.Caches.TemporalVariance.begin (), g.Caches.TemporalVariance.begin () + 50));
        EXPECT_GE (temporal_mean, 0.8);
        EXPECT_LE (temporal_mean, 1.7);

        for (seed x : g.Caches.ContentSeeds) {
            EXPECT_GE (x, 0);
            EXPECT_LT (x, int64 (1) << 31);
        }

        for (double x : g.Caches.SimilarityThresholds) {
            EXPECT_GE (x, 0.1);
            EXPECT_LE (x, 0.8);
        }

        auto [low, high] = std::minmax_element (g.Caches.SimilarityThresholds.begin (), g.Caches.SimilarityThresholds.begin () + 30);
        EXPECT_GT (*high - *low, 0.2);

        for (double x : g.Caches.ExplorationPaths) {
            EXPECT_GE (x, 0.0);
            EXPECT_LT (x, 1.0);
        }
    }

}
