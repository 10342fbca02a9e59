#include <charconv>
#include <cstdlib>
#include <cstring>

#include "options.hpp"

namespace {

    // returns nothing if the variable is not set.
    template <typename N>
    maybe<N> read_env (const char *name) {
        const char *val = std::getenv (name);
        if (!bool (val)) return {};

        N n {};
        auto [_, ec] = std::from_chars (val, val + std::strlen (val), n);
        if (ec != std::errc ()) throw data::exception {} << "could not parse " << name << " = " << val;
        return n;
    }

    template <typename N>
    N read_option (const options &o, const std::string &arg, const char *env, N fallback) {
        maybe<N> n;
        o.get (arg, n);
        if (bool (n)) return *n;

        n = read_env<N> (env);
        if (bool (n)) return *n;

        return fallback;
    }

}

maybe<std::filesystem::path> options::env () const {
    maybe<std::filesystem::path> env_path;
    this->get ("env", env_path);
    return env_path;
}

uint32 options::threads () const {
    return read_option<uint32> (*this, "threads", "TYCHE_THREADS", 1);
}

net::IP::address options::ip_address () const {
    maybe<net::IP::address> ip_address;
    this->get ("ip_address", ip_address);
    if (bool (ip_address)) return *ip_address;

    const char *addr = std::getenv ("TYCHE_IP_ADDRESS");
    if (bool (addr)) return net::IP::address {addr};

    return net::IP::address {"127.0.0.1"};
}

uint16 options::port () const {
    return read_option<uint16> (*this, "port", "TYCHE_PORT", DefaultPort);
}

net::IP::TCP::endpoint options::endpoint () const {
    maybe<net::IP::TCP::endpoint> endpoint;
    this->get ("endpoint", endpoint);
    if (bool (endpoint)) return *endpoint;

    const char *val = std::getenv ("TYCHE_ENDPOINT");
    if (bool (val)) return net::IP::TCP::endpoint {val};

    return net::IP::TCP::endpoint {ip_address (), port ()};
}

Tyche::entropy_options options::entropy_options () const {
    using eo = Tyche::entropy_options;
    eo o {};

    o.SampleSize = read_option<uint32> (*this, "sample_size", "TYCHE_SAMPLE_SIZE", eo::DefaultSampleSize);
    o.CacheSize = read_option<uint32> (*this, "cache_size", "TYCHE_CACHE_SIZE", eo::DefaultCacheSize);
    o.RefreshInterval = std::chrono::seconds {
        read_option<uint32> (*this, "refresh_interval", "TYCHE_REFRESH_INTERVAL", eo::DefaultRefreshIntervalSeconds)};
    o.StaleAfter = std::chrono::seconds {
        read_option<uint32> (*this, "stale_after", "TYCHE_STALE_AFTER", eo::DefaultStaleAfterSeconds)};
    o.MixSpread = read_option<double> (*this, "mix_spread", "TYCHE_MIX_SPREAD", eo::DefaultMixSpread);

    o.validate ();
    return o;
}
