/**
 * @file diff_engine.cpp
 * @brief Structural diff between two spec documents
 */

#include "apiguard/diff.hpp"

#include <set>

namespace apiguard::diff {

namespace {

template <typename Map>
[[nodiscard]] std::set<typename Map::key_type> key_union(const Map& before, const Map& after)
{
    std::set<typename Map::key_type> keys;
    for (const auto& [key, _] : before) {
        keys.insert(key);
    }
    for (const auto& [key, _] : after) {
        keys.insert(key);
    }
    return keys;
}

void diff_parameters(const spec::Endpoint& before,
                     const spec::Endpoint& after,
                     std::vector<Change>& changes)
{
    const auto endpoint = before.key();
    for (const auto& name : key_union(before.parameters, after.parameters)) {
        auto old_it = before.parameters.find(name);
        auto new_it = after.parameters.find(name);
        if (new_it == after.parameters.end()) {
            changes.emplace_back(ParameterRemoved{.endpoint = endpoint, .parameter = old_it->second});
            continue;
        }
        if (old_it == before.parameters.end()) {
            changes.emplace_back(ParameterAdded{.endpoint = endpoint, .parameter = new_it->second});
            continue;
        }
        const auto& old_param = old_it->second;
        const auto& new_param = new_it->second;
        if (old_param.required != new_param.required) {
            changes.emplace_back(ParameterRequirednessChanged{.endpoint = endpoint,
                                                              .before = old_param,
                                                              .after = new_param});
        }
        if (old_param.type != spec::ParamType::kUnspecified
            && new_param.type != spec::ParamType::kUnspecified && old_param.type != new_param.type) {
            changes.emplace_back(
                ParameterTypeChanged{.endpoint = endpoint, .before = old_param, .after = new_param});
        }
    }
}

void diff_responses(const spec::Endpoint& before,
                    const spec::Endpoint& after,
                    std::vector<Change>& changes)
{
    const auto endpoint = before.key();
    for (const auto& code : key_union(before.responses, after.responses)) {
        const bool in_before = before.responses.contains(code);
        const bool in_after = after.responses.contains(code);
        if (in_before && !in_after) {
            changes.emplace_back(ResponseRemoved{.endpoint = endpoint, .status_code = code});
        } else if (!in_before && in_after) {
            changes.emplace_back(ResponseAdded{.endpoint = endpoint, .status_code = code});
        }
    }
}

}  // namespace

const spec::EndpointKey& endpoint_of(const Change& change)
{
    return std::visit([](const auto& record) -> const spec::EndpointKey& { return record.endpoint; },
                      change);
}

std::vector<Change> diff_specs(const spec::SpecDocument& baseline, const spec::SpecDocument& candidate)
{
    std::vector<Change> changes;
    for (const auto& key : key_union(baseline.endpoints, candidate.endpoints)) {
        auto old_it = baseline.endpoints.find(key);
        auto new_it = candidate.endpoints.find(key);
        if (new_it == candidate.endpoints.end()) {
            changes.emplace_back(EndpointRemoved{.endpoint = key});
            continue;
        }
        if (old_it == baseline.endpoints.end()) {
            changes.emplace_back(EndpointAdded{.endpoint = key});
            continue;
        }
        diff_parameters(old_it->second, new_it->second, changes);
        diff_responses(old_it->second, new_it->second, changes);
    }
    return changes;
}

}  // namespace apiguard::diff
