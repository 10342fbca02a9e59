#ifndef SERVER_METHOD
#define SERVER_METHOD

#include <Tyche/cache/derived.hpp>

#include "../Tyche.hpp"

using UTF8 = data::UTF8;

enum class meth {
    UNSET,
    STATUS,                 // the root of the service
    HELP,                   // print help messages
    VERSION,                // print a version message
    SHUTDOWN,
    HEALTH,
    ENTROPY,                // methods below are called as /entropy/<method>
    JITTER,
    CLUSTERING_WEIGHTS,
    TEMPORAL_VARIANCE,
    SIMILARITY_THRESHOLDS,
    EXPLORATION_PATHS,
    CONTENT_SEEDS,
    MIXED,                  // mix directly from the entropy pool
    QUALITY,                // quality of the entropy sources
    REFRESH                 // schedule a new generation of caches
};

meth read_method (const UTF8 &);

std::ostream &operator << (std::ostream &, meth);

// whether the method is called under /entropy.
bool inline is_entropy_method (meth m) {
    return m > meth::ENTROPY;
}

// the cache read by a method, or invalid.
Tyche::cache_name cache (meth);

// the count used when none is given in the query.
uint32 default_count (meth);

std::ostream &help (std::ostream &, meth m = meth::UNSET);

net::HTTP::response help_response (meth = meth::UNSET);

#endif
