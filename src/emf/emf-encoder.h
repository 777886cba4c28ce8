// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Serialisation of drawing commands into Enhanced Metafile records.
 */
#ifndef SVGFX_EMF_ENCODER_H
#define SVGFX_EMF_ENCODER_H

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>
#include "emf/emf-document.h"
#include "emf/emf-types.h"

namespace Svgfx {
namespace Emf {

class EmfEncodingError : public std::runtime_error
{
public:
    enum class Reason
    {
        SizeExceeded,
        UnsupportedRecord
    };

    EmfEncodingError(Reason reason, std::string const &message)
        : std::runtime_error(message), _reason(reason) {}

    Reason reason() const { return _reason; }

private:
    Reason _reason;
};

/**
 * Encodes drawing commands into a metafile.
 *
 * Every record is a little-endian type tag, the record length including those 8 bytes, and the
 * payload padded to 4 bytes. The document starts with a 108-byte header and ends with EMR_EOF.
 * Each filled or stroked shape creates its brush and pen, selects them, draws, and deletes them
 * again, so object handles never outlive one command.
 *
 * Encoding holds no shared state: one encoder may be used from any number of threads, and equal
 * input always gives byte-identical output.
 */
class EmfEncoder final
{
public:
    static constexpr std::size_t DEFAULT_SIZE_CAP = 8 * 1024 * 1024;
    static constexpr std::size_t HEADER_SIZE = 108;

    explicit EmfEncoder(std::size_t size_cap = DEFAULT_SIZE_CAP, int dpi = 96);

    /**
     * Encode \a commands.
     *
     * @throws EmfEncodingError SizeExceeded if the document would grow past the size cap,
     *         UnsupportedRecord for a command the format cannot express (PixelComposite, too
     *         few points, coordinates outside the 32-bit range).
     */
    EmfDocument encode(std::vector<Command> const &commands) const;

    std::size_t size_cap() const { return _size_cap; }
    int dpi() const { return _dpi; }

private:
    std::size_t _size_cap;
    int _dpi;
};

} // namespace Emf
} // namespace Svgfx

#endif // SVGFX_EMF_ENCODER_H
