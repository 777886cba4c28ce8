// SPDX-License-Identifier: GPL-2.0-or-later
#include "slot-resolver.h"
#include "filters/filter-types.h"

namespace Svgfx {
namespace Filters {

std::optional<int> SlotResolver::read_special_name(std::string const &name)
{
    static auto const dict = std::unordered_map<std::string, int>{
        { "SourceGraphic",   FILTER_SOURCEGRAPHIC },
        { "SourceAlpha",     FILTER_SOURCEALPHA },
        { "StrokePaint",     FILTER_STROKEPAINT },
        { "FillPaint",       FILTER_FILLPAINT },
        { "BackgroundImage", FILTER_BACKGROUNDIMAGE },
        { "BackgroundAlpha", FILTER_BACKGROUNDALPHA }
    };

    if (auto it = dict.find(name); it != dict.end()) {
        return it->second;
    }

    return {};
}

int SlotResolver::read(std::string const &name) const
{
    if (auto ret = read_special_name(name)) {
        return *ret;
    }

    if (auto it = map.find(name); it != map.end()) {
        return it->second;
    }

    return FILTER_SLOT_NOT_SET;
}

void SlotResolver::write(std::string const &name, int index)
{
    if (name.empty()) {
        return;
    }
    map[name] = index;
}

} // namespace Filters
} // namespace Svgfx
