#pragma once

#include <string>

namespace relnet {

// Relationship type tags understood by discovery and pathway ranking.
inline const std::string kKinship = "kinship";
inline const std::string kAssociation = "association";

/// Classification of a bridge or pathway by the relation types it uses.
enum class RelationMix {
    KINSHIP,
    ASSOCIATION,
    MIXED
};

inline std::string toString(RelationMix mix) {
    switch (mix) {
        case RelationMix::KINSHIP:     return "kinship";
        case RelationMix::ASSOCIATION: return "association";
        case RelationMix::MIXED:       return "mixed";
    }
    return "association";
}

/// Tracks which relation families have been seen and classifies the mix.
/// Anything that is not kinship counts as association.
struct RelationMixTracker {
    bool has_kinship = false;
    bool has_association = false;

    void add(const std::string& relationship_type) {
        if (relationship_type == kKinship) has_kinship = true;
        else has_association = true;
    }

    RelationMix mix() const {
        if (has_kinship && has_association) return RelationMix::MIXED;
        if (has_kinship) return RelationMix::KINSHIP;
        return RelationMix::ASSOCIATION;
    }
};

} // namespace relnet
