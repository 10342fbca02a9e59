#ifndef SERVER_SERVER
#define SERVER_SERVER

#include <Tyche/cache/coordinator.hpp>
#include <data/net/JSON.hpp>
#include <data/async.hpp>

#include "options.hpp"

using UTF8 = data::UTF8;

struct server {

    // make a new coordinator from the options. No caches
    // are built and the refresher is not started.
    server (const options &o);

    explicit server (ptr<Tyche::coordinator>);

    awaitable<net::HTTP::response> operator () (const net::HTTP::request &);

    ptr<Tyche::coordinator> Coordinator;

    Tyche::timestamp Started;

    double uptime () const;

    struct status {
        std::string Service;
        Tyche::coordinator::health_report Health;
        double Uptime;

        operator JSON () const;
    };

    // service name, source and cache names, last refresh and quality.
    JSON info () const;

};

net::HTTP::response version_response ();

net::HTTP::response inline ok_response () {
    return net::HTTP::response (204);
}

net::HTTP::response inline JSON_response (const JSON &j, unsigned int status = 200) {
    return net::HTTP::response (status, {{"content-type", "application/json"}}, bytes (data::string (j.dump ())));
}

// read a number from a query parameter. Returns false if it is malformed.
bool parse_uint32 (const std::string &str, uint32_t &result);

#endif
