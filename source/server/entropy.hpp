#ifndef SERVER_ENTROPY
#define SERVER_ENTROPY

#include "server.hpp"
#include "method.hpp"

// handle any method under /entropy. Throws Tyche::invalid_argument
// if a query parameter is out of range or malformed.
net::HTTP::response handle_entropy (server &, net::HTTP::method, meth, const map<UTF8, UTF8> &query);

// the count parameter, or the default count for the method if it is missing.
uint32 read_count (meth, const map<UTF8, UTF8> &query);

#endif
