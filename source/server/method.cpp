#include "method.hpp"

net::HTTP::response help_response (meth m) {
    std::stringstream ss;
    help (ss, m);
    return net::HTTP::response (200, {{"content-type", "text/plain"}}, bytes (data::string (ss.str ())));
}

meth read_method (const UTF8 &p) {
    UTF8 sanitized = sanitize (p);

    if (sanitized == "help") return meth::HELP;
    if (sanitized == "version") return meth::VERSION;
    if (sanitized == "shutdown") return meth::SHUTDOWN;
    if (sanitized == "health") return meth::HEALTH;
    if (sanitized == "entropy") return meth::ENTROPY;
    if (sanitized == "jitter") return meth::JITTER;
    if (sanitized == "clusteringweights") return meth::CLUSTERING_WEIGHTS;
    if (sanitized == "temporalvariance") return meth::TEMPORAL_VARIANCE;
    if (sanitized == "similaritythresholds") return meth::SIMILARITY_THRESHOLDS;
    if (sanitized == "explorationpaths") return meth::EXPLORATION_PATHS;
    if (sanitized == "contentseeds") return meth::CONTENT_SEEDS;
    if (sanitized == "mixed") return meth::MIXED;
    if (sanitized == "quality") return meth::QUALITY;
    if (sanitized == "refresh") return meth::REFRESH;

    return meth::UNSET;
}

std::ostream &operator << (std::ostream &o, meth m) {
    switch (m) {
        case meth::UNSET: return o << "unset";
        case meth::STATUS: return o << "status";
        case meth::HELP: return o << "help";
        case meth::VERSION: return o << "version";
        case meth::SHUTDOWN: return o << "shutdown";
        case meth::HEALTH: return o << "health";
        case meth::ENTROPY: return o << "entropy";
        case meth::JITTER: return o << "jitter";
        case meth::CLUSTERING_WEIGHTS: return o << "clustering_weights";
        case meth::TEMPORAL_VARIANCE: return o << "temporal_variance";
        case meth::SIMILARITY_THRESHOLDS: return o << "similarity_thresholds";
        case meth::EXPLORATION_PATHS: return o << "exploration_paths";
        case meth::CONTENT_SEEDS: return o << "content_seeds";
        case meth::MIXED: return o << "mixed";
        case meth::QUALITY: return o << "quality";
        case meth::REFRESH: return o << "refresh";
        default: throw data::exception {} << "unknown method";
    }
}

Tyche::cache_name cache (meth m) {
    switch (m) {
        case meth::JITTER: return Tyche::cache_name::stochastic_jitter;
        case meth::CLUSTERING_WEIGHTS: return Tyche::cache_name::clustering_weights;
        case meth::TEMPORAL_VARIANCE: return Tyche::cache_name::temporal_variance;
        case meth::SIMILARITY_THRESHOLDS: return Tyche::cache_name::similarity_thresholds;
        case meth::EXPLORATION_PATHS: return Tyche::cache_name::exploration_paths;
        case meth::CONTENT_SEEDS: return Tyche::cache_name::content_seeds;
        default: return Tyche::cache_name::invalid;
    }
}

uint32 default_count (meth m) {
    switch (m) {
        case meth::CLUSTERING_WEIGHTS: return 5;
        case meth::EXPLORATION_PATHS: return 50;
        case meth::MIXED: return 100;
        default: return 10;
    }
}
