#include <Tyche/cache/coordinator.hpp>
#include <Tyche/entropy/mix.hpp>

namespace Tyche {

    namespace {
        const entropy_options &validated (const entropy_options &o) {
            o.validate ();
            return o;
        }
    }

    coordinator::coordinator (const entropy_options &o, ptr<random> secure, clock_function now):
        Options {validated (o)}, Now {now}, Collector {o.SampleSize, secure, now} {
        if (!bool (Now)) Now = [] () -> timestamp {
            return clock::now ();
        };
    }

    coordinator::coordinator (const entropy_options &o):
        coordinator {o, std::static_pointer_cast<random> (std::make_shared<secure_random_threadsafe> ())} {}

    coordinator::~coordinator () {
        stop ();
    }

    ptr<const generation> coordinator::current () const {
        std::lock_guard<std::mutex> Lock (Mutex);
        return Current;
    }

    uint64 coordinator::builds () const {
        std::lock_guard<std::mutex> Lock (Mutex);
        return Builds;
    }

    ptr<const generation> coordinator::refresh () {
        std::lock_guard<std::mutex> building (BuildMutex);
        return publish ();
    }

    ptr<const generation> coordinator::publish () {
        auto pool = Collector.collect ();
        auto next = std::make_shared<const generation> (generation::build (*pool, Options, Now ()));

        {
            std::lock_guard<std::mutex> Lock (Mutex);
            Current = next;
            Builds++;
        }

        DATA_LOG (info) << "published generation " << next->RefreshCount << " with overall quality " << next->Quality.overall ();

        return next;
    }

    ptr<const generation> coordinator::ensure_generation () {
        if (auto g = current (); g != nullptr) return g;

        {
            std::lock_guard<std::mutex> Lock (QueueMutex);
            if (Stopped) throw not_ready {"coordinator was stopped before any caches were built"};
        }

        std::lock_guard<std::mutex> building (BuildMutex);

        // someone else may have built the first generation while we waited.
        if (auto g = current (); g != nullptr) return g;

        DATA_LOG (debug) << "no caches yet; building the first generation";
        return publish ();
    }

    cache_values coordinator::read (cache_name c, uint32 count) {
        if (c == cache_name::invalid) throw invalid_argument {"unknown cache"};

        uint32 max = max_read (c);
        if (count < 1 || count > max) throw invalid_argument {"count for ", c, " must be between 1 and ", max, "; got ", count};

        return ensure_generation ()->Caches.read (c, count);
    }

    coordinator::mixed coordinator::mix (uint32 count, const std::vector<source> &requested) {
        if (count < 1 || count > MaxMixedRead)
            throw invalid_argument {"count for mixed entropy must be between 1 and ", MaxMixedRead, "; got ", count};

        ensure_generation ();
        auto pool = Collector.pool ();

        std::vector<source> sources;
        for (source s : requested) if (!pool->operator [] (s).empty ()) sources.push_back (s);

        if (sources.empty ()) {
            const auto &all = all_sources ();
            sources.assign (all.begin (), all.end ());
        } else if (sources.size () > SourceCount) sources.resize (SourceCount);

        return mixed {
            Tyche::mix (*pool, count, sources, Options.MixSpread),
            sources,
            assess (*pool),
            Now (),
            pool->RefreshCount};
    }

    quality_report coordinator::quality () const {
        return assess (*Collector.pool ());
    }

    coordinator::health_report coordinator::health () const {
        auto p = Collector.pool ();
        bool fresh = !p->empty () && (Now () - p->LastRefresh) <= Options.StaleAfter;
        bool populated = current () != nullptr;

        health_report report {populated, fresh};

        // log only when the service goes in or out of the degraded state.
        bool degraded = !report.healthy ();
        if (Degraded.exchange (degraded) != degraded) {
            if (!populated) DATA_LOG (warning) << "no caches have been built";
            else if (!fresh) DATA_LOG (warning) << "entropy is stale; last refreshed " << seconds_since_epoch (p->LastRefresh);
            else DATA_LOG (info) << "service is healthy again";
        }

        return report;
    }

    std::map<cache_name, coordinator::cache_statistics> coordinator::statistics () const {
        std::map<cache_name, cache_statistics> stats {};

        auto g = current ();
        if (g == nullptr) return stats;

        double age = seconds_between (g->GeneratedAt, Now ());
        for (cache_name c : all_caches ()) stats[c] = cache_statistics {g->Caches.size (c), age, g->RefreshCount};

        return stats;
    }

    coordinator::ticket coordinator::request_refresh () {
        auto p = Collector.pool ();
        maybe<timestamp> previous {};
        if (!p->empty ()) previous = p->LastRefresh;

        uint64 number;
        {
            std::lock_guard<std::mutex> Lock (QueueMutex);
            if (Pending) DATA_LOG (warning) << "refresh already pending; request will be served by the same build";
            number = ++Requested;
            Pending = true;
        }

        Wake.notify_one ();
        return ticket {number, previous, p->RefreshCount};
    }

    bool coordinator::await_refresh (const ticket &t, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> Lock (QueueMutex);
        return Completion.wait_for (Lock, timeout, [this, &t] () -> bool {
            return Completed >= t.Number;
        });
    }

    void coordinator::start () {
        std::lock_guard<std::mutex> Lock (QueueMutex);
        if (Stopped) throw data::exception {} << "coordinator has been stopped";
        if (Refresher.joinable ()) throw data::exception {} << "refresher is already running";
        Refresher = std::thread {&coordinator::run, this};
    }

    void coordinator::stop () {
        {
            std::lock_guard<std::mutex> Lock (QueueMutex);
            Stopping = true;
            Stopped = true;
        }

        Wake.notify_all ();
        if (Refresher.joinable ()) Refresher.join ();
    }

    void coordinator::run () {
        DATA_LOG (info) << "refresher started; refreshing every " << Options.RefreshInterval.count () << " seconds";

        std::unique_lock<std::mutex> Lock (QueueMutex);
        auto next_tick = std::chrono::steady_clock::now () + Options.RefreshInterval;

        while (true) {
            bool requested = Wake.wait_until (Lock, next_tick, [this] () -> bool {
                return Pending || Stopping;
            });

            if (Stopping) break;

            // every request made up to now is served by this build.
            uint64 serving = Requested;
            Pending = false;
            Lock.unlock ();

            DATA_LOG (debug) << (requested ? "requested" : "scheduled") << " refresh";

            try {
                refresh ();
            } catch (const std::exception &x) {
                DATA_LOG (error) << "refresh failed, keeping the current generation: " << x.what ();
            }

            Lock.lock ();
            Completed = serving;
            Completion.notify_all ();
            next_tick = std::chrono::steady_clock::now () + Options.RefreshInterval;
        }

        DATA_LOG (info) << "refresher stopped";
    }

    coordinator::mixed::operator JSON () const {
        JSON::array_t vals (Values.begin (), Values.end ());

        JSON::array_t used;
        for (source s : SourcesUsed) used.push_back (source_name (s));

        return JSON::object_t {
            {"values", vals},
            {"count", Values.size ()},
            {"sources_used", used},
            {"quality", JSON (Quality)},
            {"metadata", JSON::object_t {
                {"generated_at", seconds_since_epoch (GeneratedAt)},
                {"refresh_count", RefreshCount}}}};
    }

}
