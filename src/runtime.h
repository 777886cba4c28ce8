// SPDX-License-Identifier: GPL-2.0-or-later
#ifndef SVGFX_RUNTIME_H
#define SVGFX_RUNTIME_H

/*
 * Process-wide services of the filter pipeline
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include <memory>
#include "async/worker-pool.h"
#include "filters/cache-manager.h"
#include "filters/fallback-policy.h"
#include "filters/filter-chain.h"
#include "filters/filter-registry.h"
#include "settings.h"

namespace Svgfx {

namespace Debug {
class DiagnosticsSink;
} // namespace Debug

namespace Filters {
class FilterGraph;
} // namespace Filters

/**
 * The registry, the policy, the result cache and the worker pool, created together from one set
 * of settings.
 *
 * The runtime exists between init() and shutdown(); nothing creates it implicitly. Chains do not
 * look it up themselves: they receive the services they use through ChainServices, and tests may
 * build those from isolated instances instead.
 */
class Runtime final
{
public:
    /**
     * Create the runtime. Loads the native-effect table named by the settings and registers the
     * built-in primitives.
     *
     * @throws ConfigError if the native-effect table cannot be read.
     * @throws std::logic_error if the runtime already exists.
     */
    static Runtime &init(Settings settings = {});

    /// @throws std::logic_error if init() has not been called.
    static Runtime &get();

    static bool exists();

    /// Join the worker pool, stop the cache sweeper, drop the registry.
    static void shutdown();

    explicit Runtime(Settings settings);
    ~Runtime();

    Runtime(Runtime const &) = delete;
    Runtime &operator=(Runtime const &) = delete;

    Settings const &settings() const { return _settings; }
    Filters::FilterRegistry &registry() { return _registry; }
    Filters::FallbackPolicyEngine &policy() { return _policy; }
    Filters::CacheManager &cache() { return _cache; }
    Async::WorkerPool &pool() { return _pool; }

    Filters::ChainServices services(Debug::DiagnosticsSink *sink = nullptr);

    /// Chain options from the settings, for the given element and mode.
    Filters::ChainOptions chain_options(Filters::ChainInput input = {},
                                        Filters::ExecutionMode mode = Filters::ExecutionMode::Parallel) const;

    std::unique_ptr<Filters::FilterChain> make_chain(std::shared_ptr<Filters::FilterGraph const> graph,
                                                     Filters::ChainInput input = {},
                                                     Filters::ExecutionMode mode = Filters::ExecutionMode::Parallel,
                                                     Debug::DiagnosticsSink *sink = nullptr);

private:
    // Destroyed bottom-up: the pool is joined before the cache and the registry go away.
    Settings _settings;
    Filters::FilterRegistry _registry;
    Filters::FallbackPolicyEngine _policy;
    Filters::CacheManager _cache;
    Async::WorkerPool _pool;
};

} // namespace Svgfx

#endif // SVGFX_RUNTIME_H
