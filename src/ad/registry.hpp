#pragma once

/// \file registry.hpp
/// \brief The rule registry: the single table of differentiation rules shared by the
/// evaluator and the transformer.
///
/// A registry has a two-phase lifecycle. While it is *open*, rules can be registered. The
/// first lookup *freezes* it (as does an explicit call to freeze()), after which it is
/// read-only and registration fails with registry_frozen. A frozen registry is safe to read
/// from any number of threads concurrently.
///
/// The process-wide registry is obtained from global_registry(). By default it is a registry
/// holding the built-in rules (add, sub, mul, div, neg, pow, sin, cos, exp, log); it can be
/// redirected to another registry with set_global_registry() or ScopedRuleRegistry.

#include "rule.hpp"
#include <atomic>
#include <cstddef>
#include <mutex>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace fwdiff
{

class RuleRegistry {
  public:
    RuleRegistry() = default;

    RuleRegistry(RuleRegistry const&) = delete;
    RuleRegistry& operator=(RuleRegistry const&) = delete;

    /// \brief Register a rule for an operation.
    /// \throws duplicate_rule if the operation already has a rule; the registry is unchanged
    /// \throws registry_frozen if the registry has been frozen
    void register_rule(OpId op, std::size_t arity, RuleFunction compute);

    /// \brief Find the rule for an operation. Freezes the registry.
    /// \throws unsupported_operation if the operation has no rule
    Rule const& lookup(OpId const& op) const;

    /// \brief Look up the rule for op and apply it to the operands.
    Dual apply(OpId const& op, std::span<Dual const> operands, double callee_tangent = 0.0) const;

    bool contains(OpId const& op) const;

    std::size_t size() const;

    /// \brief Names of the registered operations, in sorted order.
    std::vector<std::string> operations() const;

    /// \brief End the registration phase.
    void freeze() const;

    bool is_frozen() const { return frozen_.load(std::memory_order_acquire); }

  private:
    mutable std::mutex mutex_;
    mutable std::atomic<bool> frozen_ = false;
    std::unordered_map<OpId, Rule> rules_;
};

/// \brief Register the built-in rules into an open registry.
void register_builtin_rules(RuleRegistry& registry);

/// \brief The process-wide registry.
RuleRegistry& global_registry();

/// \brief Redirect the process-wide registry; nullptr restores the default registry.
/// \returns the previously active registry (nullptr if it was the default)
RuleRegistry* set_global_registry(RuleRegistry* registry);

/// \brief Register a rule in the process-wide registry.
///
/// This is the extension point of the engine: once registered, an operation can be used by both
/// the evaluator (through call()) and the transformer, with no changes to either.
inline void register_rule(OpId op, std::size_t arity, RuleFunction compute)
{
  global_registry().register_rule(std::move(op), arity, std::move(compute));
}

/// \brief RAII guard that makes a registry the process-wide registry for its lifetime.
class ScopedRuleRegistry {
  public:
    explicit ScopedRuleRegistry(RuleRegistry& registry) : previous_(set_global_registry(&registry)) {}

    ScopedRuleRegistry(ScopedRuleRegistry const&) = delete;
    ScopedRuleRegistry& operator=(ScopedRuleRegistry const&) = delete;

    ~ScopedRuleRegistry() { set_global_registry(previous_); }

  private:
    RuleRegistry* previous_;
};

} // namespace fwdiff
