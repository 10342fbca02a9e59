#include "entropy.hpp"
#include "problem.hpp"

uint32 read_count (meth m, const map<UTF8, UTF8> &query) {
    const UTF8 *count_param = query.contains ("count");
    if (count_param == nullptr) return default_count (m);

    uint32 count;
    if (!parse_uint32 (*count_param, count))
        throw Tyche::invalid_argument {"count must be a non-negative integer; got ", *count_param};

    // the coordinator checks the upper limit.
    if (count == 0) throw Tyche::invalid_argument {"count must be at least 1"};

    return count;
}

namespace {

    net::HTTP::response handle_cache (server &p, meth m, const map<UTF8, UTF8> &query) {
        return JSON_response (Tyche::to_JSON (p.Coordinator->read (cache (m), read_count (m, query))));
    }

    net::HTTP::response handle_mixed (server &p, const map<UTF8, UTF8> &query) {
        uint32 count = read_count (meth::MIXED, query);

        std::vector<Tyche::source> sources {};
        if (const UTF8 *sources_param = query.contains ("sources"); sources_param != nullptr)
            sources = Tyche::read_sources (*sources_param);

        return JSON_response (JSON (p.Coordinator->mix (count, sources)));
    }

    net::HTTP::response handle_quality (server &p) {
        Tyche::quality_report quality = p.Coordinator->quality ();

        JSON::object_t stats;
        for (const auto &[c, s] : p.Coordinator->statistics ())
            stats[string::write (c)] = JSON {
                {"count", s.Count},
                {"age_seconds", s.AgeSeconds},
                {"refresh_count", s.RefreshCount}};

        JSON::array_t sources;
        for (Tyche::source s : Tyche::all_sources ()) sources.push_back (Tyche::source_name (s));

        return JSON_response (JSON {
            {"entropy_quality", JSON (quality)},
            {"cache_statistics", stats},
            {"overall_quality", quality.overall ()},
            {"entropy_sources", sources}});
    }

    net::HTTP::response handle_refresh (server &p) {
        Tyche::coordinator::ticket t = p.Coordinator->request_refresh ();

        JSON previous = nullptr;
        if (bool (t.PreviousRefresh)) previous = Tyche::seconds_since_epoch (*t.PreviousRefresh);

        return JSON_response (JSON {
            {"message", "entropy cache refresh scheduled"},
            {"previous_refresh", previous},
            {"refresh_count", t.RefreshCount}}, 202);
    }

}

net::HTTP::response handle_entropy (server &p, net::HTTP::method http_method, meth m, const map<UTF8, UTF8> &query) {

    if (m == meth::REFRESH) {
        if (http_method != net::HTTP::method::post)
            return error_response (405, m, problem::invalid_method, "use post");

        return handle_refresh (p);
    }

    if (http_method != net::HTTP::method::get)
        return error_response (405, m, problem::invalid_method, "use get");

    if (m == meth::MIXED) return handle_mixed (p, query);

    if (m == meth::QUALITY) return handle_quality (p);

    if (cache (m) != Tyche::cache_name::invalid) return handle_cache (p, m, query);

    return error_response (400, m, problem::unknown_method);
}
