#ifndef TYCHE
#define TYCHE

#include <data/io/arg_parser.hpp>
#include <data/io/error.hpp>
#include <data/net/HTTP.hpp>
#include <Tyche/types.hpp>

using namespace data;

using arg_parser = io::arg_parser;
using error = io::error;

std::ostream &version (std::ostream &);

std::string sanitize (const std::string &in);

#endif
