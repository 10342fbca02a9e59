#ifndef TYCHE_OPTIONS
#define TYCHE_OPTIONS

#include <Tyche/types.hpp>

namespace Tyche {

    struct entropy_options {
        constexpr static uint32 DefaultSampleSize {100};
        constexpr static uint32 DefaultCacheSize {10000};

        // the smallest cache size for which every window of the
        // derived caches has at least one element in it.
        constexpr static uint32 MinCacheSize {50};

        // bounds on the memory a single build may take.
        constexpr static uint32 MaxSampleSize {100000};
        constexpr static uint32 MaxCacheSize {1000000};

        constexpr static uint32 DefaultRefreshIntervalSeconds {300};
        constexpr static uint32 DefaultStaleAfterSeconds {600};

        // the weighted sum of the sources is multiplied by this
        // before it is reduced modulo 1.
        constexpr static double DefaultMixSpread {1000};

        // number of observations generated per source per collection.
        uint32 SampleSize {DefaultSampleSize};

        // length of the mixed stream that the derived caches are cut from.
        uint32 CacheSize {DefaultCacheSize};

        std::chrono::seconds RefreshInterval {DefaultRefreshIntervalSeconds};

        // entropy older than this is reported as stale.
        std::chrono::seconds StaleAfter {DefaultStaleAfterSeconds};

        double MixSpread {DefaultMixSpread};

        // throws data::exception if the options do not make sense.
        void validate () const;
    };

}

#endif
