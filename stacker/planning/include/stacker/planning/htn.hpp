#pragma once

#include <stacker/core/log.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace stacker::planning {

// ============================================================================
// Decomposition Status
// ============================================================================

enum class TaskStatus : uint8_t {
    Success,
    Failure
};

inline const char* to_string(TaskStatus status) {
    switch (status) {
        case TaskStatus::Success: return "Success";
        case TaskStatus::Failure: return "Failure";
        default: return "Unknown";
    }
}

// Names of the primitive tasks a decomposition ran, in order
using HTNPlan = std::vector<std::string>;

struct DecomposeOptions {
    // Restore the context when a Sequence or Primitive fails part-way
    bool rollback_on_failure = true;
};

// ============================================================================
// Task Interface
// ============================================================================

// Context must be copyable: rollback restores a copy taken before the task ran.
template<typename Context>
class HTNTask {
public:
    virtual ~HTNTask() = default;

    virtual TaskStatus decompose(Context& ctx, HTNPlan& plan, const DecomposeOptions& options) = 0;

    const std::string& get_name() const { return m_name; }

protected:
    std::string m_name = "Task";
};

template<typename Context>
using HTNTaskPtr = std::unique_ptr<HTNTask<Context>>;

// ============================================================================
// Primitive Task
// ============================================================================

// Conditions are checked in order and short-circuit; then the operator runs,
// then the effect. Conditions may cache lookups in the context for later tasks.
template<typename Context>
class HTNPrimitive : public HTNTask<Context> {
public:
    using ConditionFn = std::function<bool(Context&)>;
    using OperatorFn = std::function<TaskStatus(Context&)>;
    using EffectFn = std::function<void(Context&)>;

    explicit HTNPrimitive(std::string name) {
        this->m_name = std::move(name);
    }

    HTNPrimitive& add_condition(std::string name, ConditionFn condition) {
        m_conditions.push_back({std::move(name), std::move(condition)});
        return *this;
    }

    HTNPrimitive& set_operator(OperatorFn op) {
        m_operator = std::move(op);
        return *this;
    }

    HTNPrimitive& set_effect(EffectFn effect) {
        m_effect = std::move(effect);
        return *this;
    }

    size_t get_condition_count() const { return m_conditions.size(); }

    TaskStatus decompose(Context& ctx, HTNPlan& plan, const DecomposeOptions& options) override {
        if (!options.rollback_on_failure) {
            return run(ctx, plan);
        }

        Context saved = ctx;
        TaskStatus status = run(ctx, plan);
        if (status == TaskStatus::Failure) {
            ctx = std::move(saved);
        }
        return status;
    }

private:
    struct Condition {
        std::string name;
        ConditionFn fn;
    };

    TaskStatus run(Context& ctx, HTNPlan& plan) {
        for (auto& condition : m_conditions) {
            if (!condition.fn || !condition.fn(ctx)) {
                core::log(core::LogLevel::Trace, "[HTN] {}: condition '{}' failed",
                          this->m_name, condition.name);
                return TaskStatus::Failure;
            }
        }

        if (m_operator && m_operator(ctx) == TaskStatus::Failure) {
            core::log(core::LogLevel::Trace, "[HTN] {}: operator failed", this->m_name);
            return TaskStatus::Failure;
        }

        if (m_effect) {
            m_effect(ctx);
        }

        plan.push_back(this->m_name);
        return TaskStatus::Success;
    }

    std::vector<Condition> m_conditions;
    OperatorFn m_operator;
    EffectFn m_effect;
};

// ============================================================================
// Compound Tasks
// ============================================================================

template<typename Context>
class HTNCompound : public HTNTask<Context> {
public:
    explicit HTNCompound(std::string name) {
        this->m_name = std::move(name);
    }

    void add_child(HTNTaskPtr<Context> child) {
        if (child) {
            m_children.push_back(std::move(child));
        }
    }

    template<typename T, typename... Args>
    T* add_child(Args&&... args) {
        auto child = std::make_unique<T>(std::forward<Args>(args)...);
        T* ptr = child.get();
        m_children.push_back(std::move(child));
        return ptr;
    }

    size_t get_child_count() const { return m_children.size(); }

protected:
    std::vector<HTNTaskPtr<Context>> m_children;
};

// Every child must succeed, in order, each seeing the context its
// predecessors left behind
template<typename Context>
class HTNSequence : public HTNCompound<Context> {
public:
    explicit HTNSequence(std::string name = "Sequence")
        : HTNCompound<Context>(std::move(name)) {}

    TaskStatus decompose(Context& ctx, HTNPlan& plan, const DecomposeOptions& options) override {
        if (!options.rollback_on_failure) {
            for (auto& child : this->m_children) {
                if (child->decompose(ctx, plan, options) == TaskStatus::Failure) {
                    return TaskStatus::Failure;
                }
            }
            return TaskStatus::Success;
        }

        Context saved = ctx;
        const size_t plan_size = plan.size();
        for (auto& child : this->m_children) {
            if (child->decompose(ctx, plan, options) == TaskStatus::Failure) {
                core::log(core::LogLevel::Trace, "[HTN] {}: '{}' failed, rolling back",
                          this->m_name, child->get_name());
                ctx = std::move(saved);
                plan.resize(plan_size);
                return TaskStatus::Failure;
            }
        }
        return TaskStatus::Success;
    }
};

// First child to succeed wins
template<typename Context>
class HTNSelect : public HTNCompound<Context> {
public:
    explicit HTNSelect(std::string name = "Select")
        : HTNCompound<Context>(std::move(name)) {}

    TaskStatus decompose(Context& ctx, HTNPlan& plan, const DecomposeOptions& options) override {
        for (auto& child : this->m_children) {
            if (child->decompose(ctx, plan, options) == TaskStatus::Success) {
                return TaskStatus::Success;
            }
        }
        return TaskStatus::Failure;
    }
};

// ============================================================================
// Domain
// ============================================================================

struct DecomposeResult {
    TaskStatus status = TaskStatus::Failure;
    HTNPlan plan;
};

// Task tree built once and reused for every planning pass
template<typename Context>
class HTNDomain {
public:
    HTNDomain() = default;
    explicit HTNDomain(std::string name) : m_name(std::move(name)) {}

    void set_root(HTNTaskPtr<Context> root) {
        m_root = std::move(root);
    }

    template<typename T, typename... Args>
    T* set_root(Args&&... args) {
        auto root = std::make_unique<T>(std::forward<Args>(args)...);
        T* ptr = root.get();
        m_root = std::move(root);
        return ptr;
    }

    bool has_root() const { return m_root != nullptr; }

    void set_rollback_on_failure(bool enabled) { m_options.rollback_on_failure = enabled; }
    bool get_rollback_on_failure() const { return m_options.rollback_on_failure; }

    const std::string& get_name() const { return m_name; }

    // Decompose the root against ctx; ctx holds the resulting state
    DecomposeResult find_plan(Context& ctx) const {
        DecomposeResult result;
        if (!m_root) {
            core::log(core::LogLevel::Error, "[HTN] {}: domain has no root task", m_name);
            return result;
        }

        result.status = m_root->decompose(ctx, result.plan, m_options);
        core::log(core::LogLevel::Debug, "[HTN] {}: {} with {} primitive tasks",
                  m_name, to_string(result.status), result.plan.size());
        return result;
    }

private:
    std::string m_name = "Domain";
    HTNTaskPtr<Context> m_root;
    DecomposeOptions m_options;
};

} // namespace stacker::planning
