#ifndef TYCHE_CACHE_GENERATION
#define TYCHE_CACHE_GENERATION

#include <Tyche/cache/derived.hpp>
#include <Tyche/entropy/quality.hpp>

namespace Tyche {

    struct cache_metadata {
        timestamp GeneratedAt;
        size_t Count;
        // overall quality of the pool the cache was built from.
        double Quality;
        uint64 RefreshCount;
    };

    // All six caches built from one pool. A generation is never
    // modified once it has been built; readers hold a pointer to it
    // for as long as they need it.
    struct generation {
        derived_caches Caches;

        // refresh count and time of the pool that was mixed.
        uint64 RefreshCount;
        timestamp EntropyRefreshedAt;

        timestamp GeneratedAt;
        quality_report Quality;

        cache_metadata metadata (cache_name) const;

        // mix the pool into a stream of length CacheSize and cut it into caches.
        static generation build (const entropy_pool &, const entropy_options &, timestamp generated_at);
    };

    cache_metadata inline generation::metadata (cache_name c) const {
        return cache_metadata {GeneratedAt, Caches.size (c), Quality.overall (), RefreshCount};
    }

}

#endif
