#include "tessera/core/options.hpp"

#include "tessera/core/platform_utils.hpp"

namespace tessera {

auto CollectionOptions::from_env() -> CollectionOptions {
    CollectionOptions opts;
    opts.debug = core::env_flag("TESSERA_DEBUG");
    opts.trace = opts.debug || core::env_flag("TESSERA_TRACE");
    return opts;
}

} // namespace tessera
