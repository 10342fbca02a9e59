#include <Tyche/cache/generation.hpp>
#include <Tyche/entropy/mix.hpp>

namespace Tyche {

    generation generation::build (const entropy_pool &pool, const entropy_options &options, timestamp generated_at) {
        if (pool.empty ()) throw data::exception {} << "cannot build caches from an empty pool";

        return generation {
            build_caches (mix (pool, options.CacheSize, options.MixSpread)),
            pool.RefreshCount,
            pool.LastRefresh,
            generated_at,
            assess (pool)};
    }

}
