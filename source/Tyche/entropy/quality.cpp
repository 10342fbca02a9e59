#include <Tyche/entropy/quality.hpp>

#include <boost/math/distributions/chi_squared.hpp>

#include <numeric>

namespace Tyche {

    double chi_square_uniform (const values &v) {
        std::array<uint32, QualityBins> histogram {};

        for (double x : v) {
            if (x < 0.0 || x > 1.0) continue;
            // the last bin is closed on the right.
            uint32 bin = std::min (static_cast<uint32> (x * QualityBins), QualityBins - 1);
            histogram[bin]++;
        }

        const double expected = static_cast<double> (v.size ()) / QualityBins;

        double chi2 = 0;
        for (uint32 count : histogram) chi2 += (count - expected) * (count - expected) / expected;

        return chi2;
    }

    double quality_score (const values &v) {
        if (v.empty ()) return 0.0;

        boost::math::chi_squared_distribution<double> chi2 {QualityBins - 1};
        double p_value = boost::math::cdf (boost::math::complement (chi2, chi_square_uniform (v)));

        return std::min (1.0, p_value * 2);
    }

    quality_report assess (const entropy_pool &pool) {
        quality_report report {};
        for (source s : all_sources ()) report.Scores[s] = quality_score (pool[s]);
        return report;
    }

    double quality_report::overall () const {
        if (Scores.empty ()) return 0;
        return std::accumulate (Scores.begin (), Scores.end (), 0.0,
            [] (double sum, const auto &entry) -> double {
                return sum + entry.second;
            }) / Scores.size ();
    }

    double quality_report::operator [] (source s) const {
        auto x = Scores.find (s);
        return x == Scores.end () ? 0.0 : x->second;
    }

    quality_report::operator JSON () const {
        JSON::object_t j;
        for (const auto &[s, score] : Scores) j[source_name (s)] = score;
        return j;
    }

}
