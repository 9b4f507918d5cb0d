#include "exploration/exploration_options.hpp"
#include "common/errors.hpp"

#include <algorithm>

namespace relnet {

namespace {

void requireNonNegative(const char* name, int value) {
    if (value < 0) throw InvalidBound(name, std::to_string(value));
}

void requirePositive(const char* name, int value) {
    if (value <= 0) throw InvalidBound(name, std::to_string(value));
}

void requireProbability(const char* name, double value) {
    if (!(value >= 0.0 && value <= 1.0)) throw InvalidBound(name, std::to_string(value));
}

} // namespace

EdgeFilter relationTypeFilter(const std::vector<std::string>& relation_types) {
    return [relation_types](const Edge& e) {
        return std::find(relation_types.begin(), relation_types.end(),
                         e.relationship_type) != relation_types.end();
    };
}

void ExploreByDepthOptions::validate() const {
    requireNonNegative("max_depth", max_depth);
    requirePositive("max_nodes", max_nodes);
}

void PreFilteredOptions::validate() const {
    requireNonNegative("max_depth", max_depth);
    requirePositive("max_nodes", max_nodes);
}

void ExploreByDegreesOptions::validate() const {
    requireNonNegative("degrees", degrees);
    requirePositive("max_nodes", max_nodes);
}

void ExploreWithFilterOptions::validate() const {
    requireNonNegative("max_depth", max_depth);
    requirePositive("max_nodes", max_nodes);
}

void SubgraphOptions::validate() const {
    if (center_node) requireNonNegative("radius", radius);
    if (min_degree && max_degree && *min_degree > *max_degree) {
        throw InvalidBound("min_degree", std::to_string(*min_degree) + " > max_degree " +
                                             std::to_string(*max_degree));
    }
}

void ProgressiveOptions::validate() const {
    requirePositive("max_nodes", max_nodes);
    requireProbability("walk_probability", walk_probability);
    requireProbability("teleport_probability", teleport_probability);
}

} // namespace relnet
