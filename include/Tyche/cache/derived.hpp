#ifndef TYCHE_CACHE_DERIVED
#define TYCHE_CACHE_DERIVED

#include <Tyche/types.hpp>
#include <data/net/JSON.hpp>

namespace Tyche {

    // the caches that are cut out of the mixed stream, in
    // the order of their windows in the stream.
    enum class cache_name {
        invalid,
        stochastic_jitter,      // (v - 0.5) * 0.2, in [-0.1, 0.1]
        clustering_weights,     // 5-vectors that sum to 1
        temporal_variance,      // 0.5 + 1.5 v, in [0.5, 2.0]
        content_seeds,          // floor (v * 2^31)
        similarity_thresholds,  // 0.1 + 0.7 v, in [0.1, 0.8]
        exploration_paths       // v, in [0, 1)
    };

    constexpr size_t CacheCount {6};

    const std::array<cache_name, CacheCount> &all_caches ();

    std::ostream &operator << (std::ostream &, cache_name);

    // accepts either '_' or '-' as a separator.
    cache_name read_cache_name (const std::string &);

    // the largest number of elements that can be read from a cache at once.
    uint32 max_read (cache_name);

    constexpr uint32 MaxMixedRead {5000};

    constexpr size_t WeightDimension {5};
    using weight_vector = std::array<double, WeightDimension>;
    using seed = int64;

    using cache_values = either<values, std::vector<weight_vector>, std::vector<seed>>;

    JSON to_JSON (const cache_values &);

    // sizes of the windows of the mixed stream. Weight
    // vectors are counted in stream values, not vectors.
    struct cache_windows {
        size_t StochasticJitter;
        size_t ClusteringWeights;
        size_t TemporalVariance;
        size_t ContentSeeds;
        size_t SimilarityThresholds;
        size_t ExplorationPaths;

        // for a stream of the default length 10000 this is
        // 2000, 1000, 2000, 2000, 2000, 1000.
        explicit cache_windows (size_t total);
    };

    struct derived_caches {
        values StochasticJitter {};
        std::vector<weight_vector> ClusteringWeights {};
        values TemporalVariance {};
        std::vector<seed> ContentSeeds {};
        values SimilarityThresholds {};
        values ExplorationPaths {};

        // number of elements in the given cache.
        size_t size (cache_name) const;

        // the first count elements of the cache, or all of
        // them if there are fewer than count.
        cache_values read (cache_name, uint32 count) const;
    };

    // cut the mixed stream into consecutive windows and transform
    // each into its cache. Values in the stream must be in [0, 1).
    derived_caches build_caches (const values &mixed);

}

#endif
