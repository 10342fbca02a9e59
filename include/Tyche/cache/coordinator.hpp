#ifndef TYCHE_CACHE_COORDINATOR
#define TYCHE_CACHE_COORDINATOR

#include <atomic>
#include <condition_variable>
#include <thread>

#include <Tyche/cache/generation.hpp>

namespace Tyche {

    // Owns the collector and the published generation, and runs the
    // background refresher. Any number of threads may read while a
    // new generation is being built; builds are serialized.
    class coordinator {
    public:
        using clock_function = collector::clock_function;

        // throws if the options are invalid.
        coordinator (const entropy_options &, ptr<random> secure, clock_function now = {});

        explicit coordinator (const entropy_options &);

        // stops the refresher.
        ~coordinator ();

        coordinator (const coordinator &) = delete;
        coordinator &operator = (const coordinator &) = delete;

        // the first count elements of a cache from the current generation.
        // A generation is built here only if none exists yet. Throws
        // invalid_argument if count is zero or more than max_read.
        cache_values read (cache_name, uint32 count);

        struct mixed {
            values Values;
            std::vector<source> SourcesUsed;
            quality_report Quality;
            timestamp GeneratedAt;
            uint64 RefreshCount;

            explicit operator JSON () const;
        };

        // mix count values from the live pool. Sources that are not in the
        // pool are ignored; if none are left, all sources are mixed. Throws
        // invalid_argument if count is zero or more than MaxMixedRead.
        mixed mix (uint32 count, const std::vector<source> & = {});

        // collect, mix, build and publish a new generation, waiting
        // for any build in progress first. If this throws, the
        // published generation is unchanged.
        ptr<const generation> refresh ();

        struct ticket {
            uint64 Number;

            // last refresh before the request was made.
            maybe<timestamp> PreviousRefresh;
            uint64 RefreshCount;
        };

        // Ask the refresher for a new generation and return immediately.
        // Requests made while a build is in progress are served together
        // by a single build after it.
        ticket request_refresh ();

        // wait until a build has finished that started after the
        // ticket was issued. Returns false on timeout.
        bool await_refresh (const ticket &, std::chrono::milliseconds timeout);

        // quality of the live pool.
        quality_report quality () const;

        struct health_report {
            bool CachePopulated;
            bool EntropyFresh;

            bool healthy () const {
                return CachePopulated && EntropyFresh;
            }
        };

        health_report health () const;

        struct cache_statistics {
            size_t Count;
            double AgeSeconds;
            uint64 RefreshCount;
        };

        // empty if no generation has been built.
        std::map<cache_name, cache_statistics> statistics () const;

        // nullptr before the first generation is published.
        ptr<const generation> current () const;

        ptr<const entropy_pool> pool () const {
            return Collector.pool ();
        }

        // start the background refresher, which builds a new generation
        // every RefreshInterval and whenever a refresh is requested.
        void start ();

        // stop the refresher after any build in progress. After this,
        // reads throw not_ready if there is no generation.
        void stop ();

        // number of generations that have been published.
        uint64 builds () const;

    private:
        entropy_options Options;
        clock_function Now;
        collector Collector;

        // guards only the pointer to the published generation.
        mutable std::mutex Mutex;
        ptr<const generation> Current {nullptr};
        uint64 Builds {0};

        // whether the last health check found the service degraded.
        mutable std::atomic<bool> Degraded {false};

        std::mutex BuildMutex;

        // refresher state
        std::mutex QueueMutex;
        std::condition_variable Wake;
        std::condition_variable Completion;
        bool Pending {false};
        bool Stopping {false};
        bool Stopped {false};
        uint64 Requested {0};
        uint64 Completed {0};
        std::thread Refresher;

        ptr<const generation> ensure_generation ();

        // BuildMutex must be held.
        ptr<const generation> publish ();
        void run ();
    };

}

#endif
