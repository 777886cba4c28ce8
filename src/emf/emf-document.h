// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * An encoded, immutable metafile.
 */
#ifndef SVGFX_EMF_DOCUMENT_H
#define SVGFX_EMF_DOCUMENT_H

#include <cstddef>
#include <cstdint>
#include <vector>
#include <2geom/int-rect.h>

namespace Svgfx {
namespace Emf {

struct RecordInfo
{
    std::uint32_t type;
    std::size_t offset;
    std::size_t size;
};

class EmfDocument final
{
public:
    EmfDocument(std::vector<std::uint8_t> bytes, std::vector<RecordInfo> records, Geom::OptIntRect bounds);

    std::vector<std::uint8_t> const &bytes() const { return _bytes; }
    std::size_t size() const { return _bytes.size(); }

    /// Every record in file order, starting with the header and ending with EMR_EOF.
    std::vector<RecordInfo> const &records() const { return _records; }
    std::size_t count(std::uint32_t type) const;

    /// Bounds of everything drawn, in logical units. Empty for a document that draws nothing.
    Geom::OptIntRect const &bounds() const { return _bounds; }

    std::uint32_t read_u32(std::size_t offset) const;
    std::int32_t read_i32(std::size_t offset) const { return static_cast<std::int32_t>(read_u32(offset)); }

    bool operator==(EmfDocument const &other) const { return _bytes == other._bytes; }
    bool operator!=(EmfDocument const &other) const { return _bytes != other._bytes; }

private:
    std::vector<std::uint8_t> _bytes;
    std::vector<RecordInfo> _records;
    Geom::OptIntRect _bounds;
};

} // namespace Emf
} // namespace Svgfx

#endif // SVGFX_EMF_DOCUMENT_H
