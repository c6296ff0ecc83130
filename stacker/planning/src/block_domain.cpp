#include <stacker/planning/block_domain.hpp>
#include <stacker/core/log.hpp>

#include <cmath>
#include <format>

namespace stacker::planning {

using Primitive = HTNPrimitive<BlockWorldContext>;
using Sequence = HTNSequence<BlockWorldContext>;
using Select = HTNSelect<BlockWorldContext>;
using Task = HTNTask<BlockWorldContext>;

namespace {

const std::vector<StepDefinition>& steps_of(const BlockWorldContext& ctx) {
    return ctx.config->steps;
}

const Vec3& extents_of(const BlockWorldContext& ctx) {
    return ctx.config->half_extents;
}

Vec3 goal_top(const BlockWorldContext& ctx) {
    return ctx.world.grid.cell_top(ctx.config->goal_cell);
}

bool staircase_complete(BlockWorldContext& ctx) {
    return !find_frontier(ctx.world.grid, steps_of(ctx)).has_value();
}

bool same_position(const Vec3& a, const Vec3& b) {
    return horizontal_distance(a, b) < SAME_POSITION_EPSILON && std::abs(a.y - b.y) < SAME_POSITION_EPSILON;
}

void push_navigate(BlockWorldContext& ctx, std::vector<Vec3> path, const Vec3& target,
                   std::string description) {
    ctx.action_queue.push_back(world::make_navigate(std::move(path), target, std::move(description)));
    ctx.world.agent_position = target;
}

// Query the snapshot's surface and move the agent; false when unreachable
bool navigate_to(BlockWorldContext& ctx, const Vec3& target, std::string description) {
    auto path = ctx.world.find_path(target, extents_of(ctx));
    if (!path.success) {
        core::log(core::LogLevel::Debug, "[BlockStacker] '{}' unreachable: {} -> {}",
                  description, core::to_string(ctx.world.agent_position), core::to_string(target));
        return false;
    }
    push_navigate(ctx, std::move(path.waypoints), target, std::move(description));
    return true;
}

const StepDefinition* frontier_step(const BlockWorldContext& ctx) {
    if (!ctx.frontier_index || *ctx.frontier_index >= steps_of(ctx).size()) return nullptr;
    return &steps_of(ctx)[*ctx.frontier_index];
}

// ============================================================================
// Lookahead
// ============================================================================

// Runs whole build cycles on a private copy until the goal is reached or the
// budget runs out. The copy is adopted only when the simulated agent arrives.
class GlobalPlanToGoal : public Task {
public:
    GlobalPlanToGoal(Task* build_step, Task* reach_goal)
        : m_build_step(build_step)
        , m_reach_goal(reach_goal) {
        m_name = "GlobalPlanToGoal";
    }

    TaskStatus decompose(BlockWorldContext& ctx, HTNPlan& plan, const DecomposeOptions& options) override {
        BlockWorldContext sim = ctx;
        HTNPlan sim_plan;

        const int budget = iteration_budget_for(steps_of(ctx).size());
        bool arrived = false;

        for (int i = 0; i < budget; ++i) {
            if (staircase_complete(sim)) {
                if (m_reach_goal->decompose(sim, sim_plan, options) == TaskStatus::Failure) {
                    break;
                }
                arrived = has_agent_reached_goal(sim.world.grid, sim.world.agent_position,
                                                 sim.config->goal_cell);
                break;
            }

            if (m_build_step->decompose(sim, sim_plan, options) == TaskStatus::Failure) {
                core::log(core::LogLevel::Debug, "[BlockStacker] lookahead stalled after {} cycles", i);
                break;
            }
        }

        if (!arrived) {
            return TaskStatus::Failure;
        }

        core::log(core::LogLevel::Debug, "[BlockStacker] lookahead found {} actions",
                  sim.action_queue.size());
        ctx = std::move(sim);
        plan.insert(plan.end(), sim_plan.begin(), sim_plan.end());
        return TaskStatus::Success;
    }

private:
    Task* m_build_step;
    Task* m_reach_goal;
};

// ============================================================================
// Reaching the goal
// ============================================================================

void add_reach_goal(Select& reach_goal) {
    reach_goal.add_child<Primitive>("ReachDirect")
        ->add_condition("staircase complete", staircase_complete)
        .set_operator([](BlockWorldContext& ctx) {
            return navigate_to(ctx, goal_top(ctx), "Climb to the tower top")
                ? TaskStatus::Success : TaskStatus::Failure;
        });

    reach_goal.add_child<Primitive>("ClimbCompletedSteps")
        ->add_condition("staircase complete", staircase_complete)
        .add_condition("has steps", [](BlockWorldContext& ctx) { return !steps_of(ctx).empty(); })
        .set_operator([](BlockWorldContext& ctx) {
            for (const auto& step : steps_of(ctx)) {
                const Vec3 top = ctx.world.grid.cell_top(step.cell);
                if (same_position(ctx.world.agent_position, top)) continue;
                if (!navigate_to(ctx, top, std::format("Walk existing {}", step.label))) {
                    return TaskStatus::Failure;
                }
            }
            return navigate_to(ctx, goal_top(ctx), "Climb to goal top")
                ? TaskStatus::Success : TaskStatus::Failure;
        });
}

// ============================================================================
// Building one block of the staircase
// ============================================================================

void add_build_step(Sequence& build) {
    build.add_child<Primitive>("SelectFrontier")
        ->add_condition("frontier exists", [](BlockWorldContext& ctx) { return !staircase_complete(ctx); })
        .set_effect([](BlockWorldContext& ctx) {
            ctx.frontier_index = find_frontier(ctx.world.grid, steps_of(ctx));
            ctx.anchor = anchor_for(steps_of(ctx), *ctx.frontier_index, ctx.config->start_cell);
        });

    auto* acquire = build.add_child<Select>("AcquireBlock");

    acquire->add_child<Primitive>("HoldingBlock")
        ->add_condition("carrying", [](BlockWorldContext& ctx) { return ctx.world.carrying; });

    auto* fetch = acquire->add_child<Sequence>("FetchBlock");

    fetch->add_child<Primitive>("NavigateToSupply")
        ->add_condition("supply selected", [](BlockWorldContext& ctx) {
            ctx.pending_step = choose_supply(ctx.world, steps_of(ctx), ctx.config->supplies,
                                             ctx.config->start_cell, extents_of(ctx));
            return ctx.pending_step.has_value();
        })
        .set_effect([](BlockWorldContext& ctx) {
            PlannedStep& step = *ctx.pending_step;
            push_navigate(ctx, std::move(step.path_to_stand), step.stand_top,
                          std::format("Walk to supply crate at {}", world::to_string(step.supply)));
        });

    fetch->add_child<Primitive>("PickBlock")
        ->add_condition("hands free", [](BlockWorldContext& ctx) { return !ctx.world.carrying; })
        .add_condition("supply selected", [](BlockWorldContext& ctx) { return ctx.pending_step.has_value(); })
        .set_operator([](BlockWorldContext& ctx) {
            const Cell supply = ctx.pending_step->supply;
            const Vec3 top = ctx.world.grid.cell_top(supply);
            if (!world::apply_pick(ctx.world, *ctx.oracle, supply)) {
                return TaskStatus::Failure;
            }
            ctx.action_queue.push_back(
                world::make_pick(supply, top, std::format("Pick block at {}", world::to_string(supply))));
            return TaskStatus::Success;
        });

    auto* approach = build.add_child<Select>("ApproachFrontier");

    approach->add_child<Primitive>("ApproachAdjacent")
        ->set_operator([](BlockWorldContext& ctx) {
            const StepDefinition* step = frontier_step(ctx);
            if (!step) return TaskStatus::Failure;

            if (can_place_directly_on_adjacent(ctx.world.grid, ctx.world.agent_position,
                                               ctx.world.carrying, step->cell)) {
                return TaskStatus::Success;
            }

            auto move = find_adjacent_placement_move(ctx.world, step->cell, extents_of(ctx));
            if (!move) return TaskStatus::Failure;

            push_navigate(ctx, std::move(move->path), move->target,
                          std::format("Move to position adjacent to {}", step->label));
            return TaskStatus::Success;
        });

    approach->add_child<Primitive>("ApproachAnchor")
        ->set_operator([](BlockWorldContext& ctx) {
            const StepDefinition* step = frontier_step(ctx);
            if (!step) return TaskStatus::Failure;

            const Vec3 anchor_top = ctx.world.grid.cell_top(ctx.anchor);
            if (same_position(ctx.world.agent_position, anchor_top)) {
                return TaskStatus::Success;
            }
            return navigate_to(ctx, anchor_top, std::format("Carry block to {} staging cell", step->label))
                ? TaskStatus::Success : TaskStatus::Failure;
        });

    build.add_child<Primitive>("PlaceBlock")
        ->add_condition("carrying", [](BlockWorldContext& ctx) { return ctx.world.carrying; })
        .set_operator([](BlockWorldContext& ctx) {
            const StepDefinition* step = frontier_step(ctx);
            if (!step) return TaskStatus::Failure;

            const bool direct = can_place_directly_on_adjacent(ctx.world.grid, ctx.world.agent_position,
                                                               ctx.world.carrying, step->cell);
            if (!world::apply_place(ctx.world, *ctx.oracle, step->cell)) {
                return TaskStatus::Failure;
            }

            std::string description = direct
                ? std::format("Place block on top of {}", step->label)
                : std::format("Stack block for {}", step->label);
            // Top face of the block just placed
            const Vec3 top = ctx.world.grid.cell_top(step->cell);
            ctx.action_queue.push_back(world::make_place(step->cell, top, std::move(description)));
            return TaskStatus::Success;
        })
        .set_effect([](BlockWorldContext& ctx) {
            ctx.frontier_index.reset();
            ctx.pending_step.reset();
        });
}

} // namespace

BlockWorldContext make_block_context(WorldState world, const StackerConfig& config,
                                     const NavOracle& oracle) {
    BlockWorldContext ctx;
    ctx.world = std::move(world);
    ctx.config = &config;
    ctx.oracle = &oracle;
    ctx.anchor = config.start_cell;
    return ctx;
}

HTNDomain<BlockWorldContext> build_block_domain(bool lookahead, bool rollback_on_failure) {
    HTNDomain<BlockWorldContext> domain("BlockStacker");
    domain.set_rollback_on_failure(rollback_on_failure);

    auto reach_goal = std::make_unique<Select>("ReachGoal");
    add_reach_goal(*reach_goal);

    auto build = std::make_unique<Sequence>("BuildStep");
    add_build_step(*build);

    auto* root = domain.set_root<Select>("AchieveGoal");
    if (lookahead) {
        root->add_child<GlobalPlanToGoal>(build.get(), reach_goal.get());
    }
    root->add_child(std::move(reach_goal));
    root->add_child(std::move(build));
    return domain;
}

} // namespace stacker::planning
