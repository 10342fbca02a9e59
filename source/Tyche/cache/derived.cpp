#include <Tyche/cache/derived.hpp>
#include <regex>
#include <cmath>

namespace Tyche {

    const std::array<cache_name, CacheCount> &all_caches () {
        static const std::array<cache_name, CacheCount> Caches {
            cache_name::stochastic_jitter,
            cache_name::clustering_weights,
            cache_name::temporal_variance,
            cache_name::content_seeds,
            cache_name::similarity_thresholds,
            cache_name::exploration_paths};

        return Caches;
    }

    std::ostream &operator << (std::ostream &o, cache_name c) {
        switch (c) {
            case cache_name::stochastic_jitter: return o << "stochastic_jitter";
            case cache_name::clustering_weights: return o << "clustering_weights";
            case cache_name::temporal_variance: return o << "temporal_variance";
            case cache_name::content_seeds: return o << "content_seeds";
            case cache_name::similarity_thresholds: return o << "similarity_thresholds";
            case cache_name::exploration_paths: return o << "exploration_paths";
            default: return o << "invalid";
        }
    }

    cache_name read_cache_name (const std::string &name) {
        std::string sanitized = std::regex_replace (data::to_lower (name), std::regex {"_|-"}, "");

        if (sanitized == "stochasticjitter" || sanitized == "jitter") return cache_name::stochastic_jitter;
        if (sanitized == "clusteringweights") return cache_name::clustering_weights;
        if (sanitized == "temporalvariance") return cache_name::temporal_variance;
        if (sanitized == "contentseeds") return cache_name::content_seeds;
        if (sanitized == "similaritythresholds") return cache_name::similarity_thresholds;
        if (sanitized == "explorationpaths") return cache_name::exploration_paths;

        return cache_name::invalid;
    }

    uint32 max_read (cache_name c) {
        switch (c) {
            case cache_name::clustering_weights: return 100;
            case cache_name::invalid: return 0;
            default: return 1000;
        }
    }

    cache_windows::cache_windows (size_t total) {
        StochasticJitter = total / 5;
        ClusteringWeights = total / 10 - (total / 10) % WeightDimension;
        TemporalVariance = total / 5;
        ContentSeeds = total / 5;
        SimilarityThresholds = total / 5;
        ExplorationPaths = total - StochasticJitter - ClusteringWeights - TemporalVariance - ContentSeeds - SimilarityThresholds;
    }

    size_t derived_caches::size (cache_name c) const {
        switch (c) {
            case cache_name::stochastic_jitter: return StochasticJitter.size ();
            case cache_name::clustering_weights: return ClusteringWeights.size ();
            case cache_name::temporal_variance: return TemporalVariance.size ();
            case cache_name::content_seeds: return ContentSeeds.size ();
            case cache_name::similarity_thresholds: return SimilarityThresholds.size ();
            case cache_name::exploration_paths: return ExplorationPaths.size ();
            default: throw data::exception {} << "invalid cache name";
        }
    }

    namespace {
        template <typename X>
        std::vector<X> take (const std::vector<X> &v, uint32 count) {
            return std::vector<X> (v.begin (), v.begin () + std::min (static_cast<size_t> (count), v.size ()));
        }
    }

    cache_values derived_caches::read (cache_name c, uint32 count) const {
        switch (c) {
            case cache_name::stochastic_jitter: return take (StochasticJitter, count);
            case cache_name::clustering_weights: return take (ClusteringWeights, count);
            case cache_name::temporal_variance: return take (TemporalVariance, count);
            case cache_name::content_seeds: return take (ContentSeeds, count);
            case cache_name::similarity_thresholds: return take (SimilarityThresholds, count);
            case cache_name::exploration_paths: return take (ExplorationPaths, count);
            default: throw data::exception {} << "invalid cache name";
        }
    }

    JSON to_JSON (const cache_values &v) {
        JSON::array_t j;

        if (v.is<values> ()) for (double x : v.get<values> ()) j.push_back (x);
        else if (v.is<std::vector<seed>> ()) for (seed x : v.get<std::vector<seed>> ()) j.push_back (x);
        else for (const weight_vector &w : v.get<std::vector<weight_vector>> ())
            j.push_back (JSON::array_t (w.begin (), w.end ()));

        return j;
    }

    derived_caches build_caches (const values &mixed) {
        cache_windows windows {mixed.size ()};
        derived_caches caches {};

        auto next = mixed.begin ();

        caches.StochasticJitter.reserve (windows.StochasticJitter);
        for (auto end = next + windows.StochasticJitter; next != end; next++)
            caches.StochasticJitter.push_back ((*next - 0.5) * 0.2);

        // five values at a time, each normalized by their sum.
        caches.ClusteringWeights.reserve (windows.ClusteringWeights / WeightDimension);
        for (auto end = next + windows.ClusteringWeights; next != end; next += WeightDimension) {
            weight_vector w;
            std::copy (next, next + WeightDimension, w.begin ());

            double sum = 0;
            for (double x : w) sum += x;
            if (!(sum > 0)) continue;

            for (double &x : w) x /= sum;
            caches.ClusteringWeights.push_back (w);
        }

        caches.TemporalVariance.reserve (windows.TemporalVariance);
        for (auto end = next + windows.TemporalVariance; next != end; next++)
            caches.TemporalVariance.push_back (0.5 + *next * 1.5);

        caches.ContentSeeds.reserve (windows.ContentSeeds);
        for (auto end = next + windows.ContentSeeds; next != end; next++)
            caches.ContentSeeds.push_back (static_cast<seed> (std::floor (*next * 2147483648.0)));

        caches.SimilarityThresholds.reserve (windows.SimilarityThresholds);
        for (auto end = next + windows.SimilarityThresholds; next != end; next++)
            caches.SimilarityThresholds.push_back (0.1 + *next * 0.7);

        caches.ExplorationPaths.assign (next, mixed.end ());

        return caches;
    }

}
