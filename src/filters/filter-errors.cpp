// SPDX-License-Identifier: GPL-2.0-or-later
#include "filter-errors.h"

#include <ios>
#include <glibmm/ustring.h>

namespace Svgfx {
namespace Filters {
namespace {

std::string join(std::vector<std::string> const &ids)
{
    std::string out;
    for (auto const &id : ids) {
        if (!out.empty()) {
            out += ", ";
        }
        out += id;
    }
    return out;
}

} // namespace

FilterNotFoundError::FilterNotFoundError(PrimitiveKind kind)
    : FilterError(Glib::ustring::compose("No filter primitive registered for kind '%1'", kind_name(kind)).raw())
    , _kind(kind)
{}

CyclicFilterGraphError::CyclicFilterGraphError(std::vector<std::string> node_ids)
    : FilterGraphError("Filter graph contains a cycle through: " + join(node_ids))
    , _node_ids(std::move(node_ids))
{}

UnresolvedReferenceError::UnresolvedReferenceError(std::string node_id, std::string reference)
    : FilterGraphError(Glib::ustring::compose("Primitive '%1' references unknown result '%2'", node_id, reference).raw())
    , _node_id(std::move(node_id))
    , _reference(std::move(reference))
{}

FilterPrimitiveError::FilterPrimitiveError(std::string node_id, std::string cause)
    : FilterError(Glib::ustring::compose("Primitive '%1' failed: %2", node_id, cause).raw())
    , _node_id(std::move(node_id))
    , _cause(std::move(cause))
{}

FilterChainError::FilterChainError(std::string node_id, std::string cause)
    : FilterError(node_id.empty()
                  ? "Filter chain aborted: " + cause
                  : Glib::ustring::compose("Filter chain aborted at '%1': %2", node_id, cause).raw())
    , _node_id(std::move(node_id))
    , _cause(std::move(cause))
{}

CacheCorruptionError::CacheCorruptionError(std::size_t key)
    : FilterError(Glib::ustring::compose("Cache entry %1 failed its checksum", Glib::ustring::format(std::hex, key)).raw())
    , _key(key)
{}

ParameterError::ParameterError(std::string param, std::string const &message)
    : FilterError(Glib::ustring::compose("Parameter '%1': %2", param, message).raw())
    , _param(std::move(param))
{}

} // namespace Filters
} // namespace Svgfx
