#include <catch2/catch_test_macros.hpp>
#include <stacker/planning/htn.hpp>

#include <string>
#include <vector>

using namespace stacker::planning;

namespace {

struct Counter {
    int value = 0;
    std::vector<std::string> trace;
};

using Primitive = HTNPrimitive<Counter>;
using Sequence = HTNSequence<Counter>;
using Select = HTNSelect<Counter>;

// Adds `amount` and records `name`
void add_step(HTNCompound<Counter>& parent, const std::string& name, int amount) {
    parent.add_child<Primitive>(name)->set_effect([name, amount](Counter& c) {
        c.value += amount;
        c.trace.push_back(name);
    });
}

void add_failing(HTNCompound<Counter>& parent, const std::string& name) {
    parent.add_child<Primitive>(name)->add_condition("never", [](Counter&) { return false; });
}

} // namespace

TEST_CASE("HTN primitive conditions short-circuit", "[planning][htn]") {
    Primitive task("Guarded");
    int evaluated = 0;
    task.add_condition("first", [&](Counter&) { ++evaluated; return false; })
        .add_condition("second", [&](Counter&) { ++evaluated; return true; })
        .set_effect([](Counter& c) { c.value = 99; });

    Counter ctx;
    HTNPlan plan;
    REQUIRE(task.decompose(ctx, plan, {}) == TaskStatus::Failure);
    REQUIRE(evaluated == 1);
    REQUIRE(ctx.value == 0);
    REQUIRE(plan.empty());
    REQUIRE(task.get_condition_count() == 2);
}

TEST_CASE("HTN primitive runs operator then effect", "[planning][htn]") {
    Primitive task("Work");
    task.set_operator([](Counter& c) { c.trace.push_back("operator"); return TaskStatus::Success; })
        .set_effect([](Counter& c) { c.trace.push_back("effect"); });

    Counter ctx;
    HTNPlan plan;
    REQUIRE(task.decompose(ctx, plan, {}) == TaskStatus::Success);
    REQUIRE(ctx.trace == std::vector<std::string>{"operator", "effect"});
    REQUIRE(plan == HTNPlan{"Work"});
}

TEST_CASE("HTN primitive operator failure restores the context", "[planning][htn]") {
    Primitive task("Partial");
    task.set_operator([](Counter& c) { c.value = 5; return TaskStatus::Failure; });

    Counter ctx;
    HTNPlan plan;

    SECTION("With rollback") {
        REQUIRE(task.decompose(ctx, plan, {}) == TaskStatus::Failure);
        REQUIRE(ctx.value == 0);
    }

    SECTION("Without rollback") {
        DecomposeOptions options;
        options.rollback_on_failure = false;
        REQUIRE(task.decompose(ctx, plan, options) == TaskStatus::Failure);
        REQUIRE(ctx.value == 5);
    }
    REQUIRE(plan.empty());
}

TEST_CASE("HTN sequence threads state through children", "[planning][htn]") {
    Sequence sequence("Chain");
    sequence.add_child<Primitive>("Double")->set_effect([](Counter& c) { c.value *= 2; });
    add_step(sequence, "AddOne", 1);
    sequence.add_child<Primitive>("Check")->add_condition("odd", [](Counter& c) { return c.value % 2 == 1; });

    Counter ctx;
    ctx.value = 3;
    HTNPlan plan;
    REQUIRE(sequence.decompose(ctx, plan, {}) == TaskStatus::Success);
    REQUIRE(ctx.value == 7);
    REQUIRE(plan == HTNPlan{"Double", "AddOne", "Check"});
    REQUIRE(sequence.get_child_count() == 3);
}

TEST_CASE("HTN sequence failure and rollback", "[planning][htn]") {
    Sequence sequence("Chain");
    add_step(sequence, "A", 1);
    add_step(sequence, "B", 10);
    add_failing(sequence, "C");

    Counter ctx;
    HTNPlan plan{"Earlier"};

    SECTION("Rollback restores context and plan") {
        REQUIRE(sequence.decompose(ctx, plan, {}) == TaskStatus::Failure);
        REQUIRE(ctx.value == 0);
        REQUIRE(ctx.trace.empty());
        REQUIRE(plan == HTNPlan{"Earlier"});
    }

    SECTION("Without rollback earlier children keep their effects") {
        DecomposeOptions options;
        options.rollback_on_failure = false;
        REQUIRE(sequence.decompose(ctx, plan, options) == TaskStatus::Failure);
        REQUIRE(ctx.value == 11);
        REQUIRE(plan == HTNPlan{"Earlier", "A", "B"});
    }
}

TEST_CASE("HTN select takes the first success", "[planning][htn]") {
    Select select("Choose");
    add_failing(select, "Never");
    add_step(select, "First", 1);
    add_step(select, "Second", 100);

    Counter ctx;
    HTNPlan plan;
    REQUIRE(select.decompose(ctx, plan, {}) == TaskStatus::Success);
    REQUIRE(ctx.value == 1);
    REQUIRE(plan == HTNPlan{"First"});

    Select empty("Empty");
    REQUIRE(empty.decompose(ctx, plan, {}) == TaskStatus::Failure);
}

TEST_CASE("HTN select recovers from a failed sequence branch", "[planning][htn]") {
    Select select("Root");
    auto* doomed = select.add_child<Sequence>("Doomed");
    add_step(*doomed, "Spend", 50);
    add_failing(*doomed, "Blocked");
    add_step(select, "Fallback", 1);

    Counter ctx;
    HTNPlan plan;
    REQUIRE(select.decompose(ctx, plan, {}) == TaskStatus::Success);
    REQUIRE(ctx.value == 1);
    REQUIRE(ctx.trace == std::vector<std::string>{"Fallback"});
    REQUIRE(plan == HTNPlan{"Fallback"});
}

TEST_CASE("HTN domain find_plan", "[planning][htn]") {
    HTNDomain<Counter> domain("Test");
    Counter ctx;

    SECTION("Empty domain fails") {
        REQUIRE_FALSE(domain.has_root());
        REQUIRE(domain.find_plan(ctx).status == TaskStatus::Failure);
    }

    SECTION("Root decomposition") {
        auto* root = domain.set_root<Sequence>("Root");
        add_step(*root, "One", 1);
        add_step(*root, "Two", 2);

        DecomposeResult result = domain.find_plan(ctx);
        REQUIRE(result.status == TaskStatus::Success);
        REQUIRE(result.plan == HTNPlan{"One", "Two"});
        REQUIRE(ctx.value == 3);
    }

    SECTION("Rollback option is forwarded") {
        domain.set_rollback_on_failure(false);
        REQUIRE_FALSE(domain.get_rollback_on_failure());

        auto* root = domain.set_root<Sequence>("Root");
        add_step(*root, "One", 1);
        add_failing(*root, "Stop");

        REQUIRE(domain.find_plan(ctx).status == TaskStatus::Failure);
        REQUIRE(ctx.value == 1);
    }
}
