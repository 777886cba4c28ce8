// SPDX-License-Identifier: GPL-2.0-or-later
#ifndef SEEN_SVGFX_SLOT_RESOLVER_H
#define SEEN_SVGFX_SLOT_RESOLVER_H
/*
 * Maps input references of a filter graph to slots.
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include <optional>
#include <string>
#include <unordered_map>

namespace Svgfx {
namespace Filters {

/**
 * Resolves names while walking a graph in document order: well-known source names map to
 * negative source slots, and result names map to the index of their most recent writer.
 */
class SlotResolver final
{
public:
    /// Slot for \a name, or FILTER_SLOT_NOT_SET if it is neither a source nor written yet.
    int read(std::string const &name) const;

    /// Record that node \a index produces \a name. Later writers shadow earlier ones.
    void write(std::string const &name, int index);

    /// The source slot for a well-known name.
    static std::optional<int> read_special_name(std::string const &name);

private:
    std::unordered_map<std::string, int> map;
};

} // namespace Filters
} // namespace Svgfx

#endif // SEEN_SVGFX_SLOT_RESOLVER_H
