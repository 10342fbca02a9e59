#ifndef TYCHE_ENTROPY_MIX
#define TYCHE_ENTROPY_MIX

#include <Tyche/entropy/pool.hpp>

namespace Tyche {

    // weights are assigned by position in the list of sources
    // being mixed, not by source. They sum to 1.
    constexpr std::array<double, SourceCount> MixWeights {0.20, 0.15, 0.15, 0.15, 0.10, 0.15, 0.10};

    // Combine the sources into a single stream in [0, 1). Value i is the
    // weighted sum of observation i mod n of each source, multiplied by
    // spread and reduced modulo 1. Only the first SourceCount sources
    // in the list are used. Sources are treated as cyclic, so count may
    // exceed the number of observations. count must be at least 1.
    values mix (const entropy_pool &, uint32 count, const std::vector<source> &,
        double spread = entropy_options::DefaultMixSpread);

    // mix all sources.
    values mix (const entropy_pool &, uint32 count,
        double spread = entropy_options::DefaultMixSpread);

}

#endif
