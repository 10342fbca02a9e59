#include <Tyche/options.hpp>

namespace Tyche {

    void entropy_options::validate () const {
        if (SampleSize == 0) throw data::exception {} << "sample size must be at least 1";

        if (SampleSize > MaxSampleSize) throw data::exception {} <<
            "sample size (" << SampleSize << ") must be at most " << MaxSampleSize;

        if (CacheSize < MinCacheSize) throw data::exception {} <<
            "cache size (" << CacheSize << ") must be at least " << MinCacheSize;

        if (CacheSize > MaxCacheSize) throw data::exception {} <<
            "cache size (" << CacheSize << ") must be at most " << MaxCacheSize;

        if (RefreshInterval.count () <= 0) throw data::exception {} << "refresh interval must be positive";

        if (StaleAfter.count () <= 0) throw data::exception {} << "staleness threshold must be positive";

        if (!(MixSpread >= 1)) throw data::exception {} << "mix spread (" << MixSpread << ") must be at least 1";
    }

}
