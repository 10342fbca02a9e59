#ifndef SERVER_PROBLEM
#define SERVER_PROBLEM

#include "method.hpp"

enum class problem {
    unknown_method,
    invalid_method,
    invalid_query,
    invalid_target,
    invalid_parameter,
    not_ready,
    failed
};

std::ostream &operator << (std::ostream &, problem);

// an RFC 7807 problem+json response.
net::HTTP::response error_response (unsigned int status, meth m, problem, const std::string & = "");

#endif
