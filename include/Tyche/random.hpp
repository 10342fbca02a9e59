#ifndef TYCHE_RANDOM
#define TYCHE_RANDOM

#include <data/crypto/NIST_DRBG.hpp>
#include <data/crypto/random.hpp>
#include <Tyche/types.hpp>
#include <random>
#include <mutex>

namespace Tyche {

    // Some stuff having to do with random number generators. Only the
    // crypto_secure source needs strong random numbers. The rest of the
    // sources are deterministic functions of the time and a counter and
    // use basic generators that you would use in a game or something.

    struct random {

        // uniform in [0, 1).
        virtual double range01 () = 0;

        virtual ~random () {}

    };

    template <std::uniform_random_bit_generator engine>
    struct std_random : random, data::crypto::std_random<engine> {
        using data::crypto::std_random<engine>::std_random;

        static double range01 (engine &gen) {
            return std::uniform_real_distribution<double> {0.0, 1.0} (gen);
        }

        double range01 () override {
            return range01 (data::crypto::std_random<engine>::Engine);
        }

    };

    using casual_random = std_random<std::mt19937_64>;

    // cryptographic randomness from the operating system, slow.
    struct secure_random : random {
        double range01 () override;

    private:
        data::crypto::random::OS_entropy Entropy {};

        data::uint32 next ();
    };

    template <typename R>
    class random_threadsafe : public random {
        R Random;
        std::mutex Mutex;

    public:
        template <typename ...args>
        random_threadsafe (args &&...a) : random {}, Random {std::forward<args> (a)...} {}

        double range01 () override {
            std::lock_guard<std::mutex> Lock (Mutex);
            return Random.range01 ();
        }

    };

    using secure_random_threadsafe = random_threadsafe<secure_random>;
    using casual_random_threadsafe = random_threadsafe<casual_random>;

}

#endif
