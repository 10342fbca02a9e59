#include <Tyche/random.hpp>

namespace Tyche {

    data::uint32 secure_random::next () {
        bytes b (4);
        Entropy >> b;
        return (data::uint32 (b[0]) << 24) | (data::uint32 (b[1]) << 16) | (data::uint32 (b[2]) << 8) | data::uint32 (b[3]);
    }

    double secure_random::range01 () {
        return next () / 4294967296.0;
    }

}
