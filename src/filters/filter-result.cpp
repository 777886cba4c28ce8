// SPDX-License-Identifier: GPL-2.0-or-later
#include "filter-result.h"

#include <boost/functional/hash.hpp>
#include "util/hash.h"

namespace Svgfx {
namespace Filters {

std::string const *FilterExecutionResult::markup() const
{
    if (auto fragment = std::get_if<MarkupFragment>(&payload)) {
        return &fragment->xml;
    }
    return nullptr;
}

std::vector<std::uint8_t> const *FilterExecutionResult::blob() const
{
    if (auto document = std::get_if<Emf::EmfDocument>(&payload)) {
        return &document->bytes();
    } else if (auto image = std::get_if<Raster::RasterImage>(&payload)) {
        return &image->png;
    }
    return nullptr;
}

char const *FilterExecutionResult::content_type() const
{
    switch (payload.index()) {
        case 1:  return "image/x-emf";
        case 2:  return "image/png";
        default: return "application/xml";
    }
}

std::size_t FilterExecutionResult::size_estimate() const
{
    std::size_t size = sizeof(FilterExecutionResult);
    if (auto xml = markup()) {
        size += xml->size();
    } else if (auto bytes = blob()) {
        size += bytes->size();
    }
    if (auto document = std::get_if<Emf::EmfDocument>(&payload)) {
        size += document->records().size() * sizeof(Emf::RecordInfo);
    }
    return size;
}

std::size_t FilterExecutionResult::checksum() const
{
    std::size_t seed = 0;
    boost::hash_combine(seed, static_cast<int>(strategy));
    boost::hash_combine(seed, payload.index());
    boost::hash_combine(seed, passthrough);
    Util::hash_combine_rect(seed, bounds);
    if (auto xml = markup()) {
        boost::hash_combine(seed, *xml);
    } else if (auto bytes = blob()) {
        boost::hash_range(seed, bytes->begin(), bytes->end());
    }
    return seed;
}

} // namespace Filters
} // namespace Svgfx
