#pragma once

/**
 * @file diff.hpp
 * @brief Structural diff between two spec documents
 */

#include "apiguard/spec_model.hpp"

#include <string>
#include <variant>
#include <vector>

namespace apiguard::diff {

struct EndpointAdded
{
    spec::EndpointKey endpoint;
};

struct EndpointRemoved
{
    spec::EndpointKey endpoint;
};

struct ParameterAdded
{
    spec::EndpointKey endpoint;
    spec::Parameter parameter;
};

struct ParameterRemoved
{
    spec::EndpointKey endpoint;
    spec::Parameter parameter;
};

/// The required flag differs between baseline and candidate
struct ParameterRequirednessChanged
{
    spec::EndpointKey endpoint;
    spec::Parameter before;
    spec::Parameter after;
};

/// Both sides declare a type and the types differ
struct ParameterTypeChanged
{
    spec::EndpointKey endpoint;
    spec::Parameter before;
    spec::Parameter after;
};

struct ResponseAdded
{
    spec::EndpointKey endpoint;
    std::string status_code;
};

struct ResponseRemoved
{
    spec::EndpointKey endpoint;
    std::string status_code;
};

using Change = std::variant<EndpointAdded,
                            EndpointRemoved,
                            ParameterAdded,
                            ParameterRemoved,
                            ParameterRequirednessChanged,
                            ParameterTypeChanged,
                            ResponseAdded,
                            ResponseRemoved>;

/**
 * Endpoint a change applies to
 */
[[nodiscard]] const spec::EndpointKey& endpoint_of(const Change& change);

/**
 * Compare two documents.
 *
 * Changes are listed in (path, method) order; within an endpoint parameter
 * changes come first (by name), then response changes (by status code).
 * Endpoints absent from one side produce a single added/removed record and
 * are not descended into.
 */
[[nodiscard]] std::vector<Change> diff_specs(const spec::SpecDocument& baseline,
                                             const spec::SpecDocument& candidate);

}  // namespace apiguard::diff
