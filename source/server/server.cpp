#include "server.hpp"
#include "entropy.hpp"
#include "problem.hpp"

const std::string ServiceName {"Tyche randomness service"};

server::server (const options &o):
    Coordinator {std::make_shared<Tyche::coordinator> (o.entropy_options ())}, Started {Tyche::clock::now ()} {}

server::server (ptr<Tyche::coordinator> c): Coordinator {c}, Started {Tyche::clock::now ()} {
    if (Coordinator == nullptr) throw data::exception {} << "server requires a coordinator";
}

double server::uptime () const {
    return Tyche::seconds_between (Started, Tyche::clock::now ());
}

server::status::operator JSON () const {
    return JSON {
        {"status", Health.healthy () ? "healthy" : "degraded"},
        {"cache_populated", Health.CachePopulated},
        {"entropy_fresh", Health.EntropyFresh},
        {"service", Service},
        {"uptime_seconds", Uptime}};
}

JSON server::info () const {
    auto pool = Coordinator->pool ();

    JSON::array_t caches;
    for (Tyche::cache_name c : Tyche::all_caches ()) caches.push_back (string::write (c));

    JSON last_refresh = nullptr;
    if (!pool->empty ()) last_refresh = Tyche::seconds_since_epoch (pool->LastRefresh);

    return JSON {
        {"service", ServiceName},
        {"status", "active"},
        {"entropy_sources", Tyche::SourceCount},
        {"cache_types", caches},
        {"last_refresh", last_refresh},
        {"quality_metrics", JSON (Tyche::assess (*pool))}};
}

net::HTTP::response version_response () {
    std::stringstream ss;
    version (ss);
    return net::HTTP::response (200, {{"content-type", "text/plain"}}, bytes (data::string (ss.str ())));
}

extern std::atomic<bool> Shutdown;

awaitable<net::HTTP::response> server::operator () (const net::HTTP::request &req) {

    std::cout << "Responding to request " << req << std::endl;
    list<UTF8> path = req.Target.path ().read ('/');

    // the first part of the path is always "" as long as we use "/" as a delimiter
    // because a path always begins with "/".
    if (size (path) > 0) path = rest (path);

    if (size (path) == 0 || path[0] == "") {
        if (req.Method != net::HTTP::method::get)
            co_return error_response (405, meth::STATUS, problem::invalid_method, "use get");

        co_return JSON_response (info ());
    }

    meth m = read_method (path[0]);

    if (m == meth::UNSET || is_entropy_method (m)) co_return error_response (400, m, problem::unknown_method, path[0]);

    if (m == meth::VERSION) {
        if (req.Method != net::HTTP::method::get)
            co_return error_response (405, meth::VERSION, problem::invalid_method, "use get");

        co_return version_response ();
    }

    if (m == meth::HELP) {
        if (req.Method != net::HTTP::method::get)
            co_return error_response (405, meth::HELP, problem::invalid_method, "use get with method help");

        if (path.size () == 1) co_return help_response ();
        else {
            meth help_with_method = read_method (path[1]);
            if (help_with_method == meth::UNSET)
                co_return error_response (400, meth::HELP, problem::unknown_method, path[1]);
            co_return help_response (help_with_method);
        }
    }

    if (m == meth::SHUTDOWN) {
        if (req.Method != net::HTTP::method::put)
            co_return error_response (405, meth::SHUTDOWN, problem::invalid_method, "use put with method shutdown");

        Shutdown = true;
        co_return ok_response ();
    }

    if (m == meth::HEALTH) {
        if (req.Method != net::HTTP::method::get)
            co_return error_response (405, meth::HEALTH, problem::invalid_method, "use get");

        co_return JSON_response (JSON (status {ServiceName, Coordinator->health (), uptime ()}));
    }

    // everything else is under /entropy.
    if (path.size () < 2 || path[1] == "")
        co_return error_response (400, meth::ENTROPY, problem::unknown_method, "call /entropy/<method>");

    m = read_method (path[1]);
    if (!is_entropy_method (m)) co_return error_response (400, meth::ENTROPY, problem::unknown_method, path[1]);

    if (path.size () > 3 || (path.size () == 3 && path[2] != ""))
        co_return error_response (400, m, problem::invalid_target, "unexpected path after method");

    // now we get the parameters from the query.
    map<UTF8, UTF8> query;
    maybe<dispatch<UTF8, UTF8>> qm = req.Target.query_map ();
    if (bool (qm)) {
        map<UTF8, list<UTF8>> q = data::dispatch_to_map (*qm);

        for (const auto &[k, v] : q) if (v.size () != 1)
            co_return error_response (400, m, problem::invalid_query, "duplicate query parameters");
        else query = query.insert (k, v[0]);
    }

    UTF8 fragment {};
    maybe<UTF8> fm = req.Target.fragment ();
    if (bool (fm)) fragment = *fm;

    if (fragment != "") co_return error_response (400, m, problem::invalid_target, "We don't use the fragment");

    try {
        co_return handle_entropy (*this, req.Method, m, query);
    } catch (const Tyche::invalid_argument &x) {
        co_return error_response (400, m, problem::invalid_parameter, x.what ());
    } catch (const Tyche::not_ready &x) {
        co_return error_response (503, m, problem::not_ready, x.what ());
    } catch (const data::exception &x) {
        co_return error_response (500, m, problem::failed, x.what ());
    } catch (const std::exception &x) {
        co_return error_response (500, m, problem::failed, x.what ());
    }
}

bool parse_uint32 (const std::string &str, uint32_t &result) {
    try {
        size_t idx = 0;
        unsigned long val = std::stoul (str, &idx, 10);  // base 10

        // Extra characters after number
        if (idx != str.size ()) return false;

        // stoul accepts a leading minus sign.
        if (str.size () > 0 && str[0] == '-') return false;

        // Out of range for uint32_t
        if (val > std::numeric_limits<uint32_t>::max ())
            return false;

        result = static_cast<uint32_t> (val);
        return true;

    } catch (const std::invalid_argument &) {
        return false;  // Not a number
    } catch (const std::out_of_range &) {
        return false;  // Too large for unsigned long
    }
}
