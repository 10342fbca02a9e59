#ifndef TYCHE_TEST_STATISTICS
#define TYCHE_TEST_STATISTICS

#include <Tyche/entropy/pool.hpp>
#include <algorithm>
#include <cmath>
#include <numeric>

namespace Tyche::test {

    // a clock that never moves, so that the deterministic sources are reproducible.
    collector::clock_function inline fixed_clock (int64 seconds = 1700000000) {
        return [seconds] () -> timestamp {
            return timestamp {std::chrono::seconds {seconds}};
        };
    }

    ptr<random> inline seeded_random (uint64 seed = 42) {
        return std::static_pointer_cast<random> (std::make_shared<casual_random_threadsafe> (seed));
    }

    // asymptotic Kolmogorov distribution with the Stephens
    // correction for finite samples. en is the effective
    // sample size and d is the KS statistic.
    double inline kolmogorov_p_value (double en, double d) {
        double sqrt_en = std::sqrt (en);
        double lambda = (sqrt_en + 0.12 + 0.11 / sqrt_en) * d;

        if (lambda < 0.2) return 1.0;

        double sum = 0;
        double sign = 1;
        for (int j = 1; j <= 100; j++) {
            double term = sign * std::exp (-2.0 * j * j * lambda * lambda);
            sum += term;
            if (std::abs (term) < 1e-12) break;
            sign = -sign;
        }

        return std::clamp (2 * sum, 0.0, 1.0);
    }

    // one-sample KS test against Uniform (0, 1).
    double inline ks_uniform_p_value (values v) {
        std::sort (v.begin (), v.end ());
        const double n = static_cast<double> (v.size ());

        double d = 0;
        for (size_t i = 0; i < v.size (); i++)
            d = std::max ({d, (i + 1) / n - v[i], v[i] - i / n});

        return kolmogorov_p_value (n, d);
    }

    double inline ks_two_sample_p_value (values a, values b) {
        std::sort (a.begin (), a.end ());
        std::sort (b.begin (), b.end ());
        const double na = static_cast<double> (a.size ());
        const double nb = static_cast<double> (b.size ());

        double d = 0;
        size_t i = 0;
        size_t j = 0;
        while (i < a.size () && j < b.size ()) {
            double x = std::min (a[i], b[j]);
            while (i < a.size () && a[i] <= x) i++;
            while (j < b.size () && b[j] <= x) j++;
            d = std::max (d, std::abs (i / na - j / nb));
        }

        return kolmogorov_p_value (na * nb / (na + nb), d);
    }

    double inline mean (const values &v) {
        return std::accumulate (v.begin (), v.end (), 0.0) / v.size ();
    }

    double inline pearson (const values &x, const values &y) {
        double mx = mean (x);
        double my = mean (y);

        double sxy = 0;
        double sxx = 0;
        double syy = 0;
        for (size_t i = 0; i < x.size (); i++) {
            sxy += (x[i] - mx) * (y[i] - my);
            sxx += (x[i] - mx) * (x[i] - mx);
            syy += (y[i] - my) * (y[i] - my);
        }

        return sxy / std::sqrt (sxx * syy);
    }

    // correlation of each value with the next.
    double inline lag_one_correlation (const values &v) {
        return pearson (values (v.begin (), v.end () - 1), values (v.begin () + 1, v.end ()));
    }

}

#endif
