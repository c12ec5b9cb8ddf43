#include "stratexec/scope/execution_scope_manager.hpp"

#include "stratexec/errors/errors.hpp"

namespace stratexec {

ExecutionScopeManager::ExecutionScopeManager(
    ConfigLookupService& config, std::ostream& strategy_log_sink,
    std::shared_ptr<const TradeCalendar> calendar)
    : config_(config),
      log_sink_(strategy_log_sink),
      calendar_(std::move(calendar)) {}

// -----------------------------------------------------------------------------
// open(): claim the pair, then build the context outside the lock
// -----------------------------------------------------------------------------
ExecutionScopeManager::ScopeGuard ExecutionScopeManager::open(
    std::shared_ptr<const domain::ExecutionRequest> request,
    std::shared_ptr<StrategyInstance> instance) {
  auto scope = std::make_shared<ExecutionScope>();
  scope->account_id = request->account.account_id;
  scope->strategy_id = instance->strategyId();
  scope->request = request;
  scope->instance = instance;

  PairKey key{scope->account_id, scope->strategy_id};
  {
    std::lock_guard lock(mutex_);
    if (!open_.emplace(key, scope).second) {
      throw ScopeConflict("scope already open for account=" + key.first +
                          " strategy=" + key.second);
    }
  }

  // From here on the guard owns the claim and releases it even if building
  // the context throws.
  ScopeGuard guard(this, scope);
  scope->context = std::make_shared<StrategyContext>(
      std::move(request), std::move(instance), config_, log_sink_, calendar_);
  return guard;
}

bool ExecutionScopeManager::isOpen(const std::string& account_id,
                                   const std::string& strategy_id) const {
  std::lock_guard lock(mutex_);
  return open_.count(PairKey{account_id, strategy_id}) != 0;
}

std::size_t ExecutionScopeManager::openCount() const {
  std::lock_guard lock(mutex_);
  return open_.size();
}

// -----------------------------------------------------------------------------
// release(): close the context, then drop the pair from the table
// -----------------------------------------------------------------------------
void ExecutionScopeManager::release(
    const std::shared_ptr<ExecutionScope>& scope) noexcept {
  if (scope->context) {
    scope->context->close();
  }
  std::lock_guard lock(mutex_);
  auto it = open_.find(PairKey{scope->account_id, scope->strategy_id});
  if (it != open_.end() && it->second == scope) {
    open_.erase(it);
  }
}

void ExecutionScopeManager::ScopeGuard::close() noexcept {
  if (manager_ != nullptr && scope_) {
    manager_->release(scope_);
  }
  manager_ = nullptr;
}

}  // namespace stratexec
