#pragma once

#include <stacker/planning/htn.hpp>
#include <stacker/planning/selectors.hpp>
#include <stacker/planning/stacker_config.hpp>
#include <stacker/world/nav_oracle.hpp>
#include <stacker/world/planned_action.hpp>
#include <stacker/world/world_state.hpp>
#include <optional>
#include <vector>

namespace stacker::planning {

using world::NavOracle;
using world::PlannedAction;

// Planning snapshot threaded through one decomposition. Copying it is how the
// engine takes a snapshot-of-snapshot for rollback, so it owns everything it
// mutates. config and oracle are borrowed and must outlive the pass.
struct BlockWorldContext {
    WorldState world;
    const StackerConfig* config = nullptr;
    const NavOracle* oracle = nullptr;

    // Actions emitted so far, in execution order
    std::vector<PlannedAction> action_queue;

    // Scratch shared between the primitives of one BuildStep
    std::optional<size_t> frontier_index;
    Cell anchor;
    std::optional<PlannedStep> pending_step;
};

BlockWorldContext make_block_context(WorldState world, const StackerConfig& config,
                                     const NavOracle& oracle);

// AchieveGoal = Select [
//     GlobalPlanToGoal                          (lookahead only)
//     ReachGoal = Select [ ReachDirect, ClimbCompletedSteps ]
//     BuildStep = Sequence [
//         SelectFrontier,
//         AcquireBlock = Select [ HoldingBlock, FetchBlock = Sequence [ NavigateToSupply, PickBlock ] ],
//         ApproachFrontier = Select [ ApproachAdjacent, ApproachAnchor ],
//         PlaceBlock
//     ]
// ]
HTNDomain<BlockWorldContext> build_block_domain(bool lookahead, bool rollback_on_failure = true);

} // namespace stacker::planning
