#ifndef TYCHE_ENTROPY_SOURCE
#define TYCHE_ENTROPY_SOURCE

#include <Tyche/types.hpp>

namespace Tyche {

    // each source has its own formula so that the sources can
    // be told apart statistically. The order here is the order
    // in which mixing weights are assigned.
    enum class source {
        invalid,
        system_time,
        crypto_secure,
        atmospheric,
        mathematical,
        quantum_sim,
        content_hash,
        temporal_drift
    };

    constexpr size_t SourceCount {7};

    const std::array<source, SourceCount> &all_sources ();

    std::ostream &operator << (std::ostream &, source);

    // returns source::invalid if the name is not recognized.
    source read_source (const std::string &);

    // read a comma-separated list of source names. Unknown
    // names are dropped. Duplicates are kept, since positions
    // in the list determine the mixing weights.
    std::vector<source> read_sources (const std::string &csv);

    std::string inline source_name (source s) {
        return string::write (s);
    }

}

#endif
