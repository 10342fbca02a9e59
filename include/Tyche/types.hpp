#ifndef TYCHE_TYPES
#define TYCHE_TYPES

#include <chrono>
#include <array>
#include <vector>

#include <data/tools.hpp>
#include <data/math.hpp>
#include <data/numbers.hpp>
#include <data/io/exception.hpp>

namespace Tyche {
    using namespace data;

    using clock = std::chrono::system_clock;
    using timestamp = clock::time_point;

    // all observations and cache values are stored as doubles.
    using values = std::vector<double>;

    // seconds since the Unix epoch as a floating point number,
    // which is how we report times over HTTP.
    double inline seconds_since_epoch (const timestamp &t) {
        return std::chrono::duration<double> {t.time_since_epoch ()}.count ();
    }

    double inline seconds_between (const timestamp &from, const timestamp &to) {
        return std::chrono::duration<double> {to - from}.count ();
    }

    // a request was made with a parameter outside of what we allow.
    struct invalid_argument : data::exception {
        template <typename ...X>
        explicit invalid_argument (const std::string &message, X &&...x) : data::exception {} {
            ((static_cast<data::exception &> (*this) << message) << ... << x);
        }
    };

    // thrown if there is no generation to read from and
    // we are not allowed to build one.
    struct not_ready : data::exception {
        template <typename ...X>
        explicit not_ready (const std::string &message, X &&...x) : data::exception {} {
            ((static_cast<data::exception &> (*this) << message) << ... << x);
        }
    };
}

#endif
