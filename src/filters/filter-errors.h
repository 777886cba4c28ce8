// SPDX-License-Identifier: GPL-2.0-or-later
#ifndef SEEN_SVGFX_FILTER_ERRORS_H
#define SEEN_SVGFX_FILTER_ERRORS_H

/*
 * Exceptions raised by the filter pipeline
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>
#include "filters/filter-types.h"

namespace Svgfx {
namespace Filters {

class FilterError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/// No implementation registered for a primitive kind.
class FilterNotFoundError : public FilterError
{
public:
    explicit FilterNotFoundError(PrimitiveKind kind);
    PrimitiveKind kind() const { return _kind; }

private:
    PrimitiveKind _kind;
};

/// Structural problem of a graph. Always fatal, and raised before any primitive runs.
class FilterGraphError : public FilterError
{
public:
    using FilterError::FilterError;
};

class CyclicFilterGraphError : public FilterGraphError
{
public:
    explicit CyclicFilterGraphError(std::vector<std::string> node_ids);
    std::vector<std::string> const &node_ids() const { return _node_ids; }

private:
    std::vector<std::string> _node_ids;
};

class UnresolvedReferenceError : public FilterGraphError
{
public:
    UnresolvedReferenceError(std::string node_id, std::string reference);
    std::string const &node_id() const { return _node_id; }
    std::string const &reference() const { return _reference; }

private:
    std::string _node_id;
    std::string _reference;
};

/// Failure of a single node, with the id of the node and the cause.
class FilterPrimitiveError : public FilterError
{
public:
    FilterPrimitiveError(std::string node_id, std::string cause);
    std::string const &node_id() const { return _node_id; }
    std::string const &cause() const { return _cause; }

private:
    std::string _node_id;
    std::string _cause;
};

/// The chain as a whole was aborted: fail-fast, chain timeout, or misuse.
class FilterChainError : public FilterError
{
public:
    FilterChainError(std::string node_id, std::string cause);
    std::string const &node_id() const { return _node_id; }
    std::string const &cause() const { return _cause; }

private:
    std::string _node_id;
    std::string _cause;
};

class CacheCorruptionError : public FilterError
{
public:
    explicit CacheCorruptionError(std::size_t key);
    std::size_t key() const { return _key; }

private:
    std::size_t _key;
};

/// A required parameter is missing, has the wrong type, or has an invalid value.
class ParameterError : public FilterError
{
public:
    ParameterError(std::string param, std::string const &message);
    std::string const &param() const { return _param; }

private:
    std::string _param;
};

} // namespace Filters
} // namespace Svgfx

#endif // SEEN_SVGFX_FILTER_ERRORS_H
