#ifndef SERVER_OPTIONS
#define SERVER_OPTIONS

#include <filesystem>

#include <Tyche/options.hpp>
#include <data/io/arg_parser.hpp>
#include <data/net/URL.hpp>

#include "../Tyche.hpp"

using uint16 = data::uint16;

// Each option is read first from the command line, then from
// an environment variable, and otherwise takes its default.
struct options : arg_parser {
    constexpr static uint16 DefaultPort {47777};

    options (arg_parser &&ap) : arg_parser {ap} {}

    // path to an env file containing program options.
    maybe<std::filesystem::path> env () const;

    uint32 threads () const;

    net::IP::address ip_address () const;
    uint16 port () const;

    net::IP::TCP::endpoint endpoint () const;

    // throws if the options do not make sense.
    Tyche::entropy_options entropy_options () const;
};

#endif
