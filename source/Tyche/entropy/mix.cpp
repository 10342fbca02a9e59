#include <Tyche/entropy/mix.hpp>
#include <cmath>

namespace Tyche {

    values mix (const entropy_pool &pool, uint32 count, const std::vector<source> &sources, double spread) {
        if (count == 0) throw invalid_argument {"cannot mix zero values"};

        size_t used = std::min (sources.size (), SourceCount);

        values mixed (count, 0.0);
        for (size_t j = 0; j < used; j++) {
            const values &observations = pool[sources[j]];
            if (observations.empty ()) continue;

            const double weight = MixWeights[j];
            for (uint32 i = 0; i < count; i++) mixed[i] += weight * observations[i % observations.size ()];
        }

        for (double &x : mixed) x = std::fmod (x * spread, 1.0);

        return mixed;
    }

    values mix (const entropy_pool &pool, uint32 count, double spread) {
        const auto &all = all_sources ();
        return mix (pool, count, std::vector<source> (all.begin (), all.end ()), spread);
    }

}
