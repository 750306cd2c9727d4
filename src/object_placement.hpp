#pragma once

#include "placement.hpp"
#include "placement_optimizer.hpp"
#include "rng.hpp"

#include <string>
#include <vector>

// Rules for Enemy, Item, Trap and Treasure. Other types fall back to
// PlacementRule{} inside the optimizer.
PlacementRules defaultPlacementRules();

// Per-genre count multiplier for one object type (1.0 when the genre does not
// touch the type). Genre names are canonicalized first.
double genreCountMultiplier(const std::string& genre, ObjectType type);

class ObjectPlacementEngine {
public:
    ObjectPlacementEngine();

    const PlacementRules& rules() const { return rules_; }
    PlacementRules& rules() { return rules_; }

    const PlacementOptimizer& optimizer() const { return optimizer_; }
    PlacementOptimizer& optimizer() { return optimizer_; }

    // Counts from walkable area, then scaled by the genre table.
    ObjectCounts computeObjectCounts(const GeneratedLevel& level, const std::string& genre) const;

    // Builds exactly one PlacementContext and hands it to the optimizer.
    // A null or empty `explicitCounts` means "derive the counts".
    std::vector<GameObject> placeObjects(
        const GeneratedLevel& level,
        const ScenarioInput& scenario,
        RNG& rng,
        const ObjectCounts* explicitCounts = nullptr,
        PlacementStats* stats = nullptr) const;

private:
    PlacementRules rules_;
    PlacementOptimizer optimizer_;
};
