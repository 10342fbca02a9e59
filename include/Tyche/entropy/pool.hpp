#ifndef TYCHE_ENTROPY_POOL
#define TYCHE_ENTROPY_POOL

#include <functional>
#include <map>
#include <mutex>

#include <Tyche/entropy/source.hpp>
#include <Tyche/options.hpp>
#include <Tyche/random.hpp>

namespace Tyche {

    // The observations of every source from one collection. A pool
    // is never modified after it is created; a new collection makes
    // a new pool.
    struct entropy_pool {
        std::map<source, values> Sources {};
        timestamp LastRefresh {};
        uint64 RefreshCount {0};

        // empty if the source was not collected.
        const values &operator [] (source) const;

        bool empty () const {
            return RefreshCount == 0;
        }
    };

    // generates the observations for each source.
    class collector {
    public:
        using clock_function = std::function<timestamp ()>;

        // Secure provides the values of the crypto_secure source. If
        // Now is not provided, the system clock is used.
        collector (uint32 sample_size, ptr<random> secure, clock_function now = {});

        explicit collector (uint32 sample_size);

        // generate a new pool and make it the live pool.
        ptr<const entropy_pool> collect ();

        // the latest pool collected. Before the first collection
        // this is an empty pool with RefreshCount zero.
        ptr<const entropy_pool> pool () const;

    private:
        uint32 SampleSize;
        ptr<random> Secure;
        clock_function Now;

        // incremented for every observation drawn so that successive
        // collections differ even if the clock has not moved.
        uint64 Draws {0};

        // held while collecting so that two collections cannot
        // interleave and refresh counts are assigned in order.
        std::mutex CollectMutex;

        mutable std::mutex Mutex;
        ptr<const entropy_pool> Live;

        values system_time (timestamp now);
        values crypto_secure ();
        values atmospheric (timestamp now);
        values mathematical (timestamp now);
        values quantum_sim (timestamp now);
        values content_hash (timestamp now, uint64 refresh_count);
        values temporal_drift (timestamp now);
    };

}

#endif
