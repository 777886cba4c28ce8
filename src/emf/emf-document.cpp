// SPDX-License-Identifier: GPL-2.0-or-later
#include "emf-document.h"

#include <algorithm>
#include <stdexcept>
#include "emf/emf-types.h"

namespace Svgfx {
namespace Emf {

char const *record_name(std::uint32_t type)
{
    switch (type) {
        case EMR_HEADER:              return "EMR_HEADER";
        case EMR_POLYGON:             return "EMR_POLYGON";
        case EMR_POLYLINE:            return "EMR_POLYLINE";
        case EMR_EOF:                 return "EMR_EOF";
        case EMR_SETPOLYFILLMODE:     return "EMR_SETPOLYFILLMODE";
        case EMR_SELECTOBJECT:        return "EMR_SELECTOBJECT";
        case EMR_CREATEPEN:           return "EMR_CREATEPEN";
        case EMR_CREATEBRUSHINDIRECT: return "EMR_CREATEBRUSHINDIRECT";
        case EMR_DELETEOBJECT:        return "EMR_DELETEOBJECT";
        case EMR_RECTANGLE:           return "EMR_RECTANGLE";
        case EMR_BEGINPATH:           return "EMR_BEGINPATH";
        case EMR_ENDPATH:             return "EMR_ENDPATH";
        case EMR_FILLPATH:            return "EMR_FILLPATH";
        case EMR_CREATEMONOBRUSH:     return "EMR_CREATEMONOBRUSH";
        default:                      return "EMR_UNKNOWN";
    }
}

EmfDocument::EmfDocument(std::vector<std::uint8_t> bytes, std::vector<RecordInfo> records, Geom::OptIntRect bounds)
    : _bytes(std::move(bytes))
    , _records(std::move(records))
    , _bounds(bounds)
{}

std::size_t EmfDocument::count(std::uint32_t type) const
{
    return std::count_if(_records.begin(), _records.end(), [type] (RecordInfo const &r) { return r.type == type; });
}

std::uint32_t EmfDocument::read_u32(std::size_t offset) const
{
    if (offset + 4 > _bytes.size()) {
        throw std::out_of_range("EmfDocument::read_u32: offset past end");
    }
    return static_cast<std::uint32_t>(_bytes[offset])
         | static_cast<std::uint32_t>(_bytes[offset + 1]) << 8
         | static_cast<std::uint32_t>(_bytes[offset + 2]) << 16
         | static_cast<std::uint32_t>(_bytes[offset + 3]) << 24;
}

} // namespace Emf
} // namespace Svgfx
