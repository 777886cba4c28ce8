// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Process-wide services of the filter pipeline
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "runtime.h"

#include <chrono>
#include <glib.h>
#include "filters/builtin-primitives.h"
#include "filters/native-effect-table.h"
#include "util/statics.h"

namespace Svgfx {
namespace {

Util::Static<Runtime> &instance()
{
    static Util::Static<Runtime> runtime;
    return runtime;
}

Filters::CacheOptions cache_options(Settings const &settings)
{
    Filters::CacheOptions options;
    options.capacity_entries = settings.cache_capacity_entries.get();
    options.capacity_bytes = settings.cache_capacity_bytes.get();
    options.ttl = std::chrono::seconds(settings.cache_ttl_seconds.get());
    options.sweep_interval = std::chrono::seconds(settings.cache_sweep_seconds.get());
    return options;
}

} // namespace

Runtime &Runtime::init(Settings settings)
{
    auto &runtime = instance().emplace(std::move(settings));
    g_message("svgfx runtime started: %d worker threads, native-effect table version %d",
              runtime._pool.size(), runtime._policy.table().version());
    return runtime;
}

Runtime &Runtime::get()
{
    return instance().get();
}

bool Runtime::exists()
{
    return instance().has_value();
}

void Runtime::shutdown()
{
    if (!exists()) {
        return;
    }
    Util::StaticsBin::get().destroy();
    g_message("svgfx runtime stopped");
}

Runtime::Runtime(Settings settings)
    : _settings(std::move(settings))
    , _policy(Filters::NativeEffectTable::load_from_file(_settings.native_table))
    , _cache(cache_options(_settings))
    , _pool(_settings.worker_threads)
{
    Filters::register_builtin_primitives(_registry, _policy);
}

Runtime::~Runtime() = default;

Filters::ChainServices Runtime::services(Debug::DiagnosticsSink *sink)
{
    return Filters::ChainServices{_registry, _policy, &_cache, &_pool, sink};
}

Filters::ChainOptions Runtime::chain_options(Filters::ChainInput input, Filters::ExecutionMode mode) const
{
    auto options = Filters::ChainOptions::from_settings(_settings);
    options.mode = mode;
    options.input = std::move(input);
    return options;
}

std::unique_ptr<Filters::FilterChain> Runtime::make_chain(std::shared_ptr<Filters::FilterGraph const> graph,
                                                          Filters::ChainInput input,
                                                          Filters::ExecutionMode mode,
                                                          Debug::DiagnosticsSink *sink)
{
    return std::make_unique<Filters::FilterChain>(std::move(graph), services(sink), chain_options(std::move(input), mode));
}

} // namespace Svgfx
