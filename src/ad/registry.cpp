#include "registry.hpp"
#include "ad_errors.hpp"
#include "common/trace.hpp"

#include <algorithm>

namespace fwdiff
{

void RuleRegistry::register_rule(OpId op, std::size_t arity, RuleFunction compute)
{
  std::lock_guard lock(mutex_);
  if (frozen_.load(std::memory_order_relaxed)) throw registry_frozen(op.name());
  if (rules_.contains(op)) throw duplicate_rule(op.name());

  TRACE_MODULE(REGISTRY, "registering rule", op, arity);
  Rule rule(op, arity, std::move(compute));
  rules_.emplace(std::move(op), std::move(rule));
}

Rule const& RuleRegistry::lookup(OpId const& op) const
{
  this->freeze();
  auto it = rules_.find(op);
  if (it == rules_.end()) throw unsupported_operation(op.name());
  return it->second;
}

Dual RuleRegistry::apply(OpId const& op, std::span<Dual const> operands, double callee_tangent) const
{
  return this->lookup(op).apply(operands, callee_tangent);
}

bool RuleRegistry::contains(OpId const& op) const
{
  std::lock_guard lock(mutex_);
  return rules_.contains(op);
}

std::size_t RuleRegistry::size() const
{
  std::lock_guard lock(mutex_);
  return rules_.size();
}

std::vector<std::string> RuleRegistry::operations() const
{
  std::lock_guard lock(mutex_);
  std::vector<std::string> result;
  result.reserve(rules_.size());
  for (auto const& [op, rule] : rules_)
  {
    result.push_back(op.name());
  }
  std::ranges::sort(result);
  return result;
}

void RuleRegistry::freeze() const
{
  if (frozen_.load(std::memory_order_acquire)) return;

  // Taking the lock orders the freeze after any registration already in progress
  std::lock_guard lock(mutex_);
  if (!frozen_.load(std::memory_order_relaxed))
  {
    TRACE_MODULE(REGISTRY, "freezing rule registry", rules_.size());
    frozen_.store(true, std::memory_order_release);
  }
}

namespace
{

RuleRegistry& default_registry()
{
  static RuleRegistry registry;
  static std::once_flag builtins;
  std::call_once(builtins, [] { register_builtin_rules(registry); });
  return registry;
}

std::atomic<RuleRegistry*> active_registry = nullptr;

} // namespace

RuleRegistry& global_registry()
{
  RuleRegistry* r = active_registry.load(std::memory_order_acquire);
  return r ? *r : default_registry();
}

RuleRegistry* set_global_registry(RuleRegistry* registry)
{
  return active_registry.exchange(registry, std::memory_order_acq_rel);
}

} // namespace fwdiff
