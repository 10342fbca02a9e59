#include <Tyche/entropy/pool.hpp>
#include <data/crypto/hash.hpp>

#include <cmath>
#include <numbers>

namespace Tyche {

    const values &entropy_pool::operator [] (source s) const {
        static const values Empty {};
        auto x = Sources.find (s);
        if (x == Sources.end ()) return Empty;
        return x->second;
    }

    collector::collector (uint32 sample_size, ptr<random> secure, clock_function now):
        SampleSize {sample_size}, Secure {secure}, Now {now}, Live {std::make_shared<entropy_pool> ()} {
        if (SampleSize == 0) throw data::exception {} << "collector: sample size must be at least 1";
        if (Secure == nullptr) throw data::exception {} << "collector: no secure random source provided";
        if (!bool (Now)) Now = [] () -> timestamp {
            return clock::now ();
        };
    }

    collector::collector (uint32 sample_size):
        collector {sample_size, std::static_pointer_cast<random> (std::make_shared<secure_random_threadsafe> ())} {}

    ptr<const entropy_pool> collector::pool () const {
        std::lock_guard<std::mutex> Lock (Mutex);
        return Live;
    }

    ptr<const entropy_pool> collector::collect () {
        std::lock_guard<std::mutex> collecting (CollectMutex);

        timestamp now = Now ();
        uint64 refresh_count = pool ()->RefreshCount + 1;

        auto next = std::make_shared<entropy_pool> ();
        next->LastRefresh = now;
        next->RefreshCount = refresh_count;

        next->Sources[source::system_time] = system_time (now);
        next->Sources[source::crypto_secure] = crypto_secure ();
        next->Sources[source::atmospheric] = atmospheric (now);
        next->Sources[source::mathematical] = mathematical (now);
        next->Sources[source::quantum_sim] = quantum_sim (now);
        next->Sources[source::content_hash] = content_hash (now, refresh_count);
        next->Sources[source::temporal_drift] = temporal_drift (now);

        DATA_LOG (debug) << "collected " << SampleSize << " observations from each of "
            << next->Sources.size () << " sources; refresh " << refresh_count;

        {
            std::lock_guard<std::mutex> Lock (Mutex);
            Live = next;
        }

        return next;
    }

    namespace {
        int64 nanoseconds (timestamp t) {
            return std::chrono::duration_cast<std::chrono::nanoseconds> (t.time_since_epoch ()).count ();
        }

        double fractional_part (double x) {
            return x - std::floor (x);
        }

        // a starting point for the logistic map strictly inside (0, 1)
        // away from the fixed points.
        double logistic_seed (double now, uint64 draws) {
            return 0.05 + 0.9 * fractional_part (now * std::numbers::phi + draws * std::numbers::inv_sqrt3);
        }
    }

    values collector::system_time (timestamp now) {
        // a prime stride, so that consecutive draws made within
        // the same tick of the clock are spread out.
        constexpr uint64 stride = 7919;
        const uint64 ns = static_cast<uint64> (nanoseconds (now));

        values v (SampleSize);
        for (double &x : v) x = ((ns + Draws++ * stride) % 10000) / 10000.0;
        return v;
    }

    values collector::crypto_secure () {
        values v (SampleSize);
        for (double &x : v) x = Secure->range01 ();
        Draws += SampleSize;
        return v;
    }

    values collector::atmospheric (timestamp now) {
        const double t = seconds_since_epoch (now);
        std::hash<std::string> hash {};

        values v (SampleSize);
        for (uint32 i = 0; i < SampleSize; i++) {
            std::string noise = std::to_string (t + i * 0.001) + "#" + std::to_string (Draws++);
            v[i] = (hash (noise) % 10000) / 10000.0;
        }

        return v;
    }

    values collector::mathematical (timestamp now) {
        const double t = seconds_since_epoch (now);
        // time-varying parameter of the logistic map, in [3.8, 4.0].
        const double r = 3.9 + 0.1 * std::sin (t * 0.1);
        double x = logistic_seed (t, Draws);

        values v (SampleSize);
        for (double &y : v) {
            x = r * x * (1 - x);
            // with r = 4 the map can fall onto 0 and stay there.
            if (!(x > 0.0 && x < 1.0)) x = logistic_seed (t, Draws + 1);
            y = x;
            Draws++;
        }

        return v;
    }

    values collector::quantum_sim (timestamp now) {
        std::mt19937_64 gen {static_cast<uint64> (nanoseconds (now)) ^ (Draws * 0x9E3779B97F4A7C15ULL)};
        std::uniform_real_distribution<double> phase_distribution {0.0, 2 * std::numbers::pi};

        // the probability of measuring a state with a uniformly random phase.
        values v (SampleSize);
        for (double &x : v) {
            double amplitude = std::sin (phase_distribution (gen));
            x = amplitude * amplitude;
        }

        Draws += SampleSize;
        return v;
    }

    values collector::content_hash (timestamp now, uint64 refresh_count) {
        const std::string base = string::write ("tyche_", std::to_string (seconds_since_epoch (now)), "_", refresh_count, "_");

        values v (SampleSize);
        for (uint32 i = 0; i < SampleSize; i++) {
            auto digest = data::crypto::SHA2_256 (base + std::to_string (i));
            auto b = digest.begin ();
            uint32 first = (uint32 (b[0]) << 24) | (uint32 (b[1]) << 16) | (uint32 (b[2]) << 8) | uint32 (b[3]);
            v[i] = first / 4294967296.0;
        }

        Draws += SampleSize;
        return v;
    }

    values collector::temporal_drift (timestamp now) {
        const double t = seconds_since_epoch (now);
        const double offset = static_cast<double> (Draws % 100000);

        values v (SampleSize);
        for (uint32 i = 0; i < SampleSize; i++) {
            double drift = std::sin (t * 0.01 + (i + offset) * 0.1) * std::cos (t * 0.007 + (i + offset) * 0.13);
            v[i] = (drift + 1) / 2;
        }

        Draws += SampleSize;
        return v;
    }

}
