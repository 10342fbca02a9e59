#include "problem.hpp"
#include <data/net/JSON.hpp>

using JSON = data::JSON;

std::ostream &operator << (std::ostream &o, problem p) {
    switch (p) {
        case problem::unknown_method: return o << "unknown method";
        case problem::invalid_method: return o << "invalid method";
        case problem::invalid_query: return o << "invalid query";
        case problem::invalid_target: return o << "invalid target";
        case problem::invalid_parameter: return o << "invalid parameter";
        case problem::not_ready: return o << "caches are not ready";
        case problem::failed: return o << "failed";
        default: throw data::exception {} << "invalid problem...";
    }
}

net::HTTP::response error_response (unsigned int status, meth m, problem tt, const std::string &detail) {
    std::stringstream meth_string;
    meth_string << m;
    std::stringstream problem_type;
    problem_type << tt;

    JSON err {
        {"method", meth_string.str ()},
        {"status", status},
        {"title", problem_type.str ()}};

    if (detail != "") err["detail"] = detail;

    return net::HTTP::response (status, {{"content-type", "application/problem+json"}}, bytes (data::string (err.dump ())));
}
