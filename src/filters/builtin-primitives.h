// SPDX-License-Identifier: GPL-2.0-or-later
#ifndef SEEN_SVGFX_BUILTIN_PRIMITIVES_H
#define SEEN_SVGFX_BUILTIN_PRIMITIVES_H

/*
 * Registration of the primitives shipped with the library
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "filters/filter-types.h"

namespace Svgfx {
namespace Filters {

class FallbackPolicyEngine;
class FilterRegistry;

/// Default complexity bound of the vector approximation of \a kind.
double default_vector_bound(PrimitiveKind kind);

/**
 * Register every built-in primitive with \a registry and its vector approximation with
 * \a policy. Earlier registrations of the same kinds are replaced.
 */
void register_builtin_primitives(FilterRegistry &registry, FallbackPolicyEngine &policy);

} // namespace Filters
} // namespace Svgfx

#endif // SEEN_SVGFX_BUILTIN_PRIMITIVES_H
