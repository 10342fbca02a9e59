#include <regex>

#include "Tyche.hpp"
#include "server/method.hpp"

std::string sanitize (const std::string &in) {
    return std::regex_replace (data::to_lower (in), std::regex {"_|-"}, "");
}

std::ostream &version (std::ostream &o) {
    return o << "Tyche entropy service version 0.1.0";
}

std::ostream &help (std::ostream &o, meth m) {
    switch (m) {
        default :
            return version (o) << "\n" << "call GET /<method> or GET /entropy/<method> where method is "
                "\n\thealth                -- whether the caches are populated and the entropy is fresh."
                "\n\tversion               -- print the version."
                "\n\thelp                  -- print this message."
                "\n\tshutdown              -- (PUT) stop the server."
                "\n\tentropy/jitter                -- small perturbations in [-0.1, 0.1]."
                "\n\tentropy/clustering-weights    -- weight vectors of length 5 that sum to 1."
                "\n\tentropy/temporal-variance     -- multipliers in [0.5, 2.0]."
                "\n\tentropy/similarity-thresholds -- thresholds in [0.1, 0.8]."
                "\n\tentropy/exploration-paths     -- probabilities in [0, 1)."
                "\n\tentropy/content-seeds         -- integer seeds in [0, 2^31)."
                "\n\tentropy/mixed                 -- values mixed directly from the entropy sources."
                "\n\tentropy/quality               -- quality of each entropy source."
                "\n\tentropy/refresh               -- (POST) schedule a refresh of the caches."
                "\nuse help/<method> for information on a specific method";
        case meth::JITTER :
        case meth::CLUSTERING_WEIGHTS :
        case meth::TEMPORAL_VARIANCE :
        case meth::SIMILARITY_THRESHOLDS :
        case meth::EXPLORATION_PATHS :
        case meth::CONTENT_SEEDS :
            return o << "Read values from the current generation of the " << m << " cache."
                " Two reads with no refresh in between return the same values."
                "\nquery parameters:"
                "\n\t(count=<uint32>) (between 1 and " << Tyche::max_read (cache (m)) << ", default " << default_count (m) << ")";
        case meth::MIXED :
            return o << "Mix values directly from the live entropy pool."
                "\nquery parameters:"
                "\n\t(count=<uint32>) (between 1 and " << Tyche::MaxMixedRead << ", default " << default_count (m) << ")"
                "\n\t(sources=<comma separated source names>) (= all sources)"
                "\n\t  sources are system_time, crypto_secure, atmospheric, mathematical, quantum_sim, content_hash, temporal_drift";
        case meth::QUALITY :
            return o << "Chi-square quality score of each entropy source and statistics for each cache. No parameters.";
        case meth::REFRESH :
            return o << "Schedule a new generation of caches. Returns 202 immediately. No parameters.";
        case meth::HEALTH :
            return o << "Report whether caches have been built and whether the entropy is fresh. No parameters.";
        case meth::SHUTDOWN :
            return o << "Stop the server. Use PUT.";
    }
}
