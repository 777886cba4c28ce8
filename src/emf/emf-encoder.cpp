// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Enhanced Metafile encoder
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "emf-encoder.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <glibmm/ustring.h>
#include "emf/emf-patterns.h"

namespace Svgfx {
namespace Emf {
namespace {

// Stock objects (MS-EMF 2.1.31).
constexpr std::uint32_t NULL_BRUSH = 0x80000005;
constexpr std::uint32_t NULL_PEN = 0x80000008;

// Polygon fill modes.
constexpr std::uint32_t ALTERNATE = 1;
constexpr std::uint32_t WINDING = 2;

constexpr std::uint32_t PS_SOLID = 0;
constexpr std::uint32_t DIB_RGB_COLORS = 0;

constexpr std::uint32_t ENHMETA_SIGNATURE = 0x464d4520;
constexpr std::uint32_t EMF_VERSION = 0x10000;

constexpr std::uint32_t BRUSH_HANDLE = 1;
constexpr std::uint32_t PEN_HANDLE = 2;

constexpr std::size_t EOF_SIZE = 20;

/// 0xRRGGBB to COLORREF, which is 0x00BBGGRR.
std::uint32_t colorref(std::uint32_t rgb)
{
    return ((rgb >> 16) & 0xff) | (rgb & 0xff00) | ((rgb & 0xff) << 16);
}

struct IntPoint
{
    std::int32_t x, y;
};

/**
 * Appends records to a byte buffer, keeping the record index and enforcing the size cap.
 */
class RecordWriter
{
public:
    explicit RecordWriter(std::size_t cap) : _cap(cap) {}

    void begin(std::uint32_t type, std::size_t expected_size)
    {
        // Always leave room for the closing EMR_EOF.
        if (_bytes.size() + expected_size + EOF_SIZE > _cap) {
            throw EmfEncodingError(EmfEncodingError::Reason::SizeExceeded,
                Glib::ustring::compose("Metafile would exceed the size cap of %1 bytes at %2",
                                       _cap, record_name(type)).raw());
        }
        _start = _bytes.size();
        _type = type;
        u32(type);
        u32(0);
    }

    void end()
    {
        while (_bytes.size() % 4) {
            _bytes.push_back(0);
        }
        auto const size = _bytes.size() - _start;
        patch_u32(_start + 4, static_cast<std::uint32_t>(size));
        _records.push_back({_type, _start, size});
    }

    void u8(std::uint8_t v) { _bytes.push_back(v); }

    void u16(std::uint16_t v)
    {
        _bytes.push_back(v & 0xff);
        _bytes.push_back(v >> 8);
    }

    void u32(std::uint32_t v)
    {
        for (int i = 0; i < 4; i++) {
            _bytes.push_back((v >> (8 * i)) & 0xff);
        }
    }

    void i32(std::int32_t v) { u32(static_cast<std::uint32_t>(v)); }

    void rectl(std::int32_t left, std::int32_t top, std::int32_t right, std::int32_t bottom)
    {
        i32(left);
        i32(top);
        i32(right);
        i32(bottom);
    }

    void patch_u32(std::size_t offset, std::uint32_t v)
    {
        for (int i = 0; i < 4; i++) {
            _bytes[offset + i] = (v >> (8 * i)) & 0xff;
        }
    }

    void patch_u16(std::size_t offset, std::uint16_t v)
    {
        _bytes[offset] = v & 0xff;
        _bytes[offset + 1] = v >> 8;
    }

    std::size_t size() const { return _bytes.size(); }
    std::size_t record_count() const { return _records.size(); }

    std::vector<std::uint8_t> take_bytes() { return std::move(_bytes); }
    std::vector<RecordInfo> take_records() { return std::move(_records); }

private:
    std::size_t _cap;
    std::vector<std::uint8_t> _bytes;
    std::vector<RecordInfo> _records;
    std::size_t _start = 0;
    std::uint32_t _type = 0;
};

/**
 * State for one call to EmfEncoder::encode().
 */
class Encoding
{
public:
    Encoding(std::size_t cap, int dpi)
        : _writer(cap), _scale(dpi / 96.0), _dpi(dpi) {}

    EmfDocument run(std::vector<Command> const &commands);

    void operator()(Polygon const &polygon);
    void operator()(Polyline const &polyline);
    void operator()(Rectangle const &rectangle);
    void operator()(FillPath const &path);
    void operator()(PixelComposite const &composite);

private:
    RecordWriter _writer;
    double _scale;
    int _dpi;
    bool _used_objects = false;
    std::optional<std::int32_t> _x0, _y0, _x1, _y1;

    std::int32_t logical(double px) const;
    IntPoint logical(Geom::Point const &p) const { return {logical(p[Geom::X]), logical(p[Geom::Y])}; }
    std::vector<IntPoint> logical(std::vector<Geom::Point> const &points) const;

    void include(IntPoint const &p);
    void measure(Command const &command);

    void header();
    void finish_header();
    void eof();

    void brush(Fill const &fill);
    void pen(Stroke const &stroke);
    void select(std::uint32_t handle);
    void remove(std::uint32_t handle);
    void polygon_record(std::uint32_t type, std::vector<IntPoint> const &points);
};

std::int32_t Encoding::logical(double px) const
{
    double const v = std::round(px * _scale);
    if (!std::isfinite(v) || v > std::numeric_limits<std::int32_t>::max() || v < std::numeric_limits<std::int32_t>::min()) {
        throw EmfEncodingError(EmfEncodingError::Reason::UnsupportedRecord,
                               "Coordinate outside the metafile's 32-bit range");
    }
    return static_cast<std::int32_t>(v);
}

std::vector<IntPoint> Encoding::logical(std::vector<Geom::Point> const &points) const
{
    std::vector<IntPoint> result;
    result.reserve(points.size());
    for (auto const &p : points) {
        result.push_back(logical(p));
    }
    return result;
}

void Encoding::include(IntPoint const &p)
{
    _x0 = _x0 ? std::min(*_x0, p.x) : p.x;
    _y0 = _y0 ? std::min(*_y0, p.y) : p.y;
    _x1 = _x1 ? std::max(*_x1, p.x) : p.x;
    _y1 = _y1 ? std::max(*_y1, p.y) : p.y;
}

void Encoding::measure(Command const &command)
{
    auto points = [this] (std::vector<Geom::Point> const &pts) {
        for (auto const &p : pts) {
            include(logical(p));
        }
    };

    if (auto polygon = std::get_if<Polygon>(&command)) {
        points(polygon->points);
    } else if (auto polyline = std::get_if<Polyline>(&command)) {
        points(polyline->points);
    } else if (auto rectangle = std::get_if<Rectangle>(&command)) {
        include(logical(rectangle->rect.min()));
        include(logical(rectangle->rect.max()));
    } else if (auto path = std::get_if<FillPath>(&command)) {
        for (auto const &contour : path->contours) {
            points(contour);
        }
    }
}

EmfDocument Encoding::run(std::vector<Command> const &commands)
{
    for (auto const &command : commands) {
        measure(command);
    }

    header();
    for (auto const &command : commands) {
        std::visit(*this, command);
    }
    eof();
    finish_header();

    Geom::OptIntRect bounds;
    if (_x0) {
        bounds = Geom::IntRect(Geom::IntPoint(*_x0, *_y0), Geom::IntPoint(*_x1, *_y1));
    }
    return EmfDocument(_writer.take_bytes(), _writer.take_records(), bounds);
}

/*
 * Header layout (offsets in bytes):
 *   0 type, 4 size, 8 Bounds, 24 Frame, 40 signature, 44 version, 48 total bytes,
 *  52 record count, 56 handle count (u16), 58 reserved, 60 nDescription, 64 offDescription,
 *  68 nPalEntries, 72 Device, 80 Millimeters, 88 cbPixelFormat, 92 offPixelFormat, 96 bOpenGL,
 * 100 MicrometersX, 104 MicrometersY.
 */
void Encoding::header()
{
    _writer.begin(EMR_HEADER, EmfEncoder::HEADER_SIZE);
    _writer.rectl(0, 0, 0, 0);      // Bounds, patched
    _writer.rectl(0, 0, 0, 0);      // Frame, patched
    _writer.u32(ENHMETA_SIGNATURE);
    _writer.u32(EMF_VERSION);
    _writer.u32(0);                 // Bytes, patched
    _writer.u32(0);                 // Records, patched
    _writer.u16(1);                 // Handles, patched
    _writer.u16(0);                 // Reserved
    _writer.u32(0);                 // nDescription
    _writer.u32(0);                 // offDescription
    _writer.u32(0);                 // nPalEntries
    _writer.i32(0);                 // Device cx, patched
    _writer.i32(0);                 // Device cy, patched
    _writer.i32(0);                 // Millimeters cx, patched
    _writer.i32(0);                 // Millimeters cy, patched
    _writer.u32(0);                 // cbPixelFormat
    _writer.u32(0);                 // offPixelFormat
    _writer.u32(0);                 // bOpenGL
    _writer.u32(0);                 // MicrometersX, patched
    _writer.u32(0);                 // MicrometersY, patched
    _writer.end();
}

void Encoding::finish_header()
{
    std::int32_t left = 0, top = 0, right = -1, bottom = -1;
    std::int32_t width = 0, height = 0;
    if (_x0) {
        left = *_x0;
        top = *_y0;
        right = *_x1;
        bottom = *_y1;
        width = right - left + 1;
        height = bottom - top + 1;
    }

    // Frame is inclusive, in hundredths of a millimetre.
    auto hundredths = [this] (std::int32_t v) {
        return static_cast<std::uint32_t>(std::lround(v * 2540.0 / _dpi));
    };
    auto millimetres = [this] (std::int32_t v) {
        return static_cast<std::uint32_t>(std::max<long>(1, std::lround(v * 25.4 / _dpi)));
    };

    _writer.patch_u32(8, left);
    _writer.patch_u32(12, top);
    _writer.patch_u32(16, right);
    _writer.patch_u32(20, bottom);
    _writer.patch_u32(24, _x0 ? hundredths(left) : 0);
    _writer.patch_u32(28, _x0 ? hundredths(top) : 0);
    _writer.patch_u32(32, _x0 ? hundredths(right) : 0);
    _writer.patch_u32(36, _x0 ? hundredths(bottom) : 0);
    _writer.patch_u32(48, static_cast<std::uint32_t>(_writer.size()));
    _writer.patch_u32(52, static_cast<std::uint32_t>(_writer.record_count()));
    _writer.patch_u16(56, _used_objects ? 3 : 1);

    auto const device_cx = std::max(1, width);
    auto const device_cy = std::max(1, height);
    _writer.patch_u32(72, device_cx);
    _writer.patch_u32(76, device_cy);
    _writer.patch_u32(80, millimetres(device_cx));
    _writer.patch_u32(84, millimetres(device_cy));
    _writer.patch_u32(100, millimetres(device_cx) * 1000);
    _writer.patch_u32(104, millimetres(device_cy) * 1000);
}

void Encoding::eof()
{
    _writer.begin(EMR_EOF, 0);
    _writer.u32(0);         // nPalEntries
    _writer.u32(16);        // offPalEntries
    _writer.u32(EOF_SIZE);  // SizeLast
    _writer.end();
}

void Encoding::brush(Fill const &fill)
{
    auto const &entry = pattern_for(fill.semantics);
    _used_objects = true;

    if (entry.stock) {
        _writer.begin(EMR_CREATEBRUSHINDIRECT, 24);
        _writer.u32(BRUSH_HANDLE);
        _writer.u32(entry.brush_style);
        _writer.u32(colorref(fill.color));
        _writer.u32(entry.hatch);
        _writer.end();
        return;
    }

    // 8x8 monochrome DIB: BITMAPINFOHEADER, two-entry colour table, bottom-up rows padded to 4 bytes.
    constexpr std::uint32_t fixed = 32, bmi = 48, bits = 32;
    _writer.begin(EMR_CREATEMONOBRUSH, fixed + bmi + bits);
    _writer.u32(BRUSH_HANDLE);
    _writer.u32(DIB_RGB_COLORS);
    _writer.u32(fixed);         // offBmi
    _writer.u32(bmi);           // cbBmi
    _writer.u32(fixed + bmi);   // offBits
    _writer.u32(bits);          // cbBits

    _writer.u32(40);            // biSize
    _writer.i32(8);             // biWidth
    _writer.i32(8);             // biHeight
    _writer.u16(1);             // biPlanes
    _writer.u16(1);             // biBitCount
    _writer.u32(0);             // biCompression = BI_RGB
    _writer.u32(bits);          // biSizeImage
    _writer.i32(0);             // biXPelsPerMeter
    _writer.i32(0);             // biYPelsPerMeter
    _writer.u32(2);             // biClrUsed
    _writer.u32(0);             // biClrImportant

    // RGBQUAD is blue, green, red, reserved. Index 0 is background.
    for (auto rgb : {fill.background, fill.color}) {
        _writer.u8(rgb & 0xff);
        _writer.u8((rgb >> 8) & 0xff);
        _writer.u8((rgb >> 16) & 0xff);
        _writer.u8(0);
    }

    for (int row = 7; row >= 0; row--) {
        _writer.u8(entry.bits[row]);
        _writer.u8(0);
        _writer.u8(0);
        _writer.u8(0);
    }
    _writer.end();
}

void Encoding::pen(Stroke const &stroke)
{
    _used_objects = true;
    _writer.begin(EMR_CREATEPEN, 28);
    _writer.u32(PEN_HANDLE);
    _writer.u32(PS_SOLID);
    _writer.i32(std::max(0, logical(stroke.width)));
    _writer.i32(0);
    _writer.u32(colorref(stroke.color));
    _writer.end();
}

void Encoding::select(std::uint32_t handle)
{
    _writer.begin(EMR_SELECTOBJECT, 12);
    _writer.u32(handle);
    _writer.end();
}

void Encoding::remove(std::uint32_t handle)
{
    _writer.begin(EMR_DELETEOBJECT, 12);
    _writer.u32(handle);
    _writer.end();
}

void Encoding::polygon_record(std::uint32_t type, std::vector<IntPoint> const &points)
{
    std::int32_t x0 = points[0].x, y0 = points[0].y, x1 = x0, y1 = y0;
    for (auto const &p : points) {
        x0 = std::min(x0, p.x);
        y0 = std::min(y0, p.y);
        x1 = std::max(x1, p.x);
        y1 = std::max(y1, p.y);
    }

    _writer.begin(type, 28 + 8 * points.size());
    _writer.rectl(x0, y0, x1, y1);
    _writer.u32(static_cast<std::uint32_t>(points.size()));
    for (auto const &p : points) {
        _writer.i32(p.x);
        _writer.i32(p.y);
    }
    _writer.end();
}

void Encoding::operator()(Polygon const &polygon)
{
    if (polygon.points.size() < 3) {
        throw EmfEncodingError(EmfEncodingError::Reason::UnsupportedRecord, "Polygon needs at least 3 points");
    }
    auto const points = logical(polygon.points);

    brush(polygon.fill);
    select(BRUSH_HANDLE);
    if (polygon.stroke) {
        pen(*polygon.stroke);
        select(PEN_HANDLE);
    } else {
        select(NULL_PEN);
    }

    polygon_record(EMR_POLYGON, points);

    remove(BRUSH_HANDLE);
    if (polygon.stroke) {
        remove(PEN_HANDLE);
    }
}

void Encoding::operator()(Polyline const &polyline)
{
    if (polyline.points.size() < 2) {
        throw EmfEncodingError(EmfEncodingError::Reason::UnsupportedRecord, "Polyline needs at least 2 points");
    }
    auto const points = logical(polyline.points);

    pen(polyline.stroke);
    select(PEN_HANDLE);
    select(NULL_BRUSH);
    polygon_record(EMR_POLYLINE, points);
    remove(PEN_HANDLE);
}

void Encoding::operator()(Rectangle const &rectangle)
{
    auto const min = logical(rectangle.rect.min());
    auto const max = logical(rectangle.rect.max());

    brush(rectangle.fill);
    select(BRUSH_HANDLE);
    if (rectangle.stroke) {
        pen(*rectangle.stroke);
        select(PEN_HANDLE);
    } else {
        select(NULL_PEN);
    }

    _writer.begin(EMR_RECTANGLE, 24);
    _writer.rectl(min.x, min.y, max.x, max.y);
    _writer.end();

    remove(BRUSH_HANDLE);
    if (rectangle.stroke) {
        remove(PEN_HANDLE);
    }
}

void Encoding::operator()(FillPath const &path)
{
    if (path.contours.empty()) {
        throw EmfEncodingError(EmfEncodingError::Reason::UnsupportedRecord, "Path has no contours");
    }

    std::vector<std::vector<IntPoint>> contours;
    for (auto const &contour : path.contours) {
        if (contour.size() < 3) {
            throw EmfEncodingError(EmfEncodingError::Reason::UnsupportedRecord, "Path contour needs at least 3 points");
        }
        contours.push_back(logical(contour));
    }

    _writer.begin(EMR_SETPOLYFILLMODE, 12);
    _writer.u32(path.rule == FillRule::EvenOdd ? ALTERNATE : WINDING);
    _writer.end();

    brush(path.fill);
    select(BRUSH_HANDLE);
    select(NULL_PEN);

    _writer.begin(EMR_BEGINPATH, 8);
    _writer.end();
    for (auto const &contour : contours) {
        polygon_record(EMR_POLYGON, contour);
    }
    _writer.begin(EMR_ENDPATH, 8);
    _writer.end();

    std::int32_t x0 = contours[0][0].x, y0 = contours[0][0].y, x1 = x0, y1 = y0;
    for (auto const &contour : contours) {
        for (auto const &p : contour) {
            x0 = std::min(x0, p.x);
            y0 = std::min(y0, p.y);
            x1 = std::max(x1, p.x);
            y1 = std::max(y1, p.y);
        }
    }
    _writer.begin(EMR_FILLPATH, 24);
    _writer.rectl(x0, y0, x1, y1);
    _writer.end();

    remove(BRUSH_HANDLE);
}

void Encoding::operator()(PixelComposite const &composite)
{
    throw EmfEncodingError(EmfEncodingError::Reason::UnsupportedRecord,
        Glib::ustring::compose("Per-pixel composition '%1' has no metafile record", composite.op).raw());
}

} // namespace

EmfEncoder::EmfEncoder(std::size_t size_cap, int dpi)
    : _size_cap(size_cap)
    , _dpi(dpi > 0 ? dpi : 96)
{}

EmfDocument EmfEncoder::encode(std::vector<Command> const &commands) const
{
    return Encoding(_size_cap, _dpi).run(commands);
}

} // namespace Emf
} // namespace Svgfx
