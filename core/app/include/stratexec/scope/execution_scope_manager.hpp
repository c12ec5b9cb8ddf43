#pragma once

#include "stratexec/domain/execution_request.hpp"
#include "stratexec/strategy/strategy_context.hpp"
#include "stratexec/strategy/strategy_instance.hpp"

#include <cstddef>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace stratexec {

class ConfigLookupService;

// -----------------------------------------------------------------------------
// ExecutionScope — live binding of one invocation to its pair
// -----------------------------------------------------------------------------
//
// @details
// Every member is shared-owned so a runner thread abandoned after a timeout
// can keep using the request, context, and instance after the scope has
// been closed and removed from the manager.
// -----------------------------------------------------------------------------
struct ExecutionScope {
  std::string account_id;
  std::string strategy_id;
  std::shared_ptr<const domain::ExecutionRequest> request;
  std::shared_ptr<StrategyInstance> instance;
  std::shared_ptr<StrategyContext> context;
};

// -----------------------------------------------------------------------------
// ExecutionScopeManager — at most one open scope per (account, strategy)
// -----------------------------------------------------------------------------
//
// @brief  Opens scopes that bind a request, a fresh data adapter (inside a
//         fresh StrategyContext), and the pair's persistent StrategyInstance,
//         and guarantees they are closed on every exit path.
//
// @details
// open() returns a ScopeGuard. The guard's destructor closes the scope, so
// a normal return, an exception, or a timeout path that simply lets the
// guard go out of scope all release the binding. Closing:
//   1. closes the StrategyContext (later order submissions throw),
//   2. removes the pair from the open-scope table.
//
// Opening a scope for a pair that already has one throws ScopeConflict.
// The gateway's per-pair serialization makes this unreachable in normal
// operation; the check keeps the invariant explicit.
//
// Thread model:
//   open(), close, isOpen(), and openCount() are safe from any thread; the
//   open-scope table is guarded by a mutex held only for map operations.
//
// Ownership:
//   Owned by ExecutionGateway. Borrows the ConfigLookupService and the
//   strategy log sink handed to every context; shares the trade calendar
//   with them.
// -----------------------------------------------------------------------------
class ExecutionScopeManager {
 public:
  // ---------------------------------------------------------------------------
  // ScopeGuard — move-only RAII handle of one open scope
  // ---------------------------------------------------------------------------
  class ScopeGuard {
   public:
    ~ScopeGuard() { close(); }

    ScopeGuard(ScopeGuard&& other) noexcept
        : manager_(std::exchange(other.manager_, nullptr)),
          scope_(std::move(other.scope_)) {}
    ScopeGuard& operator=(ScopeGuard&&) = delete;
    ScopeGuard(const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

    const std::shared_ptr<ExecutionScope>& scope() const { return scope_; }
    StrategyContext& context() const { return *scope_->context; }

    // Idempotent; the destructor calls it.
    void close() noexcept;

   private:
    friend class ExecutionScopeManager;

    ScopeGuard(ExecutionScopeManager* manager,
               std::shared_ptr<ExecutionScope> scope)
        : manager_(manager), scope_(std::move(scope)) {}

    ExecutionScopeManager* manager_;
    std::shared_ptr<ExecutionScope> scope_;
  };

  explicit ExecutionScopeManager(
      ConfigLookupService& config, std::ostream& strategy_log_sink = std::cout,
      std::shared_ptr<const TradeCalendar> calendar = nullptr);

  ExecutionScopeManager(const ExecutionScopeManager&) = delete;
  ExecutionScopeManager& operator=(const ExecutionScopeManager&) = delete;
  ExecutionScopeManager(ExecutionScopeManager&&) = delete;
  ExecutionScopeManager& operator=(ExecutionScopeManager&&) = delete;

  // -------------------------------------------------------------------------
  // open(request, instance)
  // -------------------------------------------------------------------------
  //
  // @brief  Binds request + new context + instance to the pair
  //         (request.account.account_id, instance.strategyId()).
  //
  // @throws ScopeConflict if the pair already has an open scope.
  //
  // Side-effects:  Registers the pair as open until the guard closes.
  // -------------------------------------------------------------------------
  ScopeGuard open(std::shared_ptr<const domain::ExecutionRequest> request,
                  std::shared_ptr<StrategyInstance> instance);

  bool isOpen(const std::string& account_id,
              const std::string& strategy_id) const;
  std::size_t openCount() const;

 private:
  using PairKey = std::pair<std::string, std::string>;

  void release(const std::shared_ptr<ExecutionScope>& scope) noexcept;

  ConfigLookupService& config_;
  std::ostream& log_sink_;
  std::shared_ptr<const TradeCalendar> calendar_;

  mutable std::mutex mutex_;
  std::map<PairKey, std::shared_ptr<ExecutionScope>> open_;
};

}  // namespace stratexec
