#ifndef TYCHE_ENTROPY_QUALITY
#define TYCHE_ENTROPY_QUALITY

#include <Tyche/entropy/pool.hpp>
#include <data/net/JSON.hpp>

namespace Tyche {

    // a score in [0, 1] for each source, higher meaning
    // more consistent with a uniform distribution.
    struct quality_report {
        std::map<source, double> Scores {};

        // mean over all sources, 0 if there are none.
        double overall () const;

        size_t size () const {
            return Scores.size ();
        }

        // 0 for a source that was not assessed.
        double operator [] (source) const;

        explicit operator JSON () const;
    };

    constexpr uint32 QualityBins {10};

    // chi-square statistic of the observations against a uniform
    // distribution over QualityBins bins of [0, 1].
    double chi_square_uniform (const values &);

    // Score a set of observations. The chi-square p-value with
    // QualityBins - 1 degrees of freedom is doubled and capped at 1,
    // so that anything that is not clearly non-uniform saturates.
    // No observations score zero.
    double quality_score (const values &);

    quality_report assess (const entropy_pool &);

}

#endif
