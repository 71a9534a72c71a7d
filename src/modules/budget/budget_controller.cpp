// modules/budget/budget_controller.cpp
#include "budget/budget_controller.h"
#include "core/types/errors.h"

namespace agentrt {

BudgetController::BudgetController(int max_llm_calls)
    : budget_(std::make_unique<ExecutionBudget>(max_llm_calls > 0 ? max_llm_calls : -1)) {}

bool BudgetController::try_consume_llm_call() {
    return budget_->try_consume_llm_call();
}

void BudgetController::consume_llm_call() {
    if (!budget_->try_consume_llm_call()) {
        throw LlmCallsLimitExceededError(budget_->max_llm_calls);
    }
}

int BudgetController::llm_calls_used() const {
    return budget_->llm_calls_used.load();
}

Value BudgetController::snapshot() const {
    Value obj;
    obj["max_llm_calls"] = budget_->max_llm_calls;
    obj["llm_calls_used"] = budget_->llm_calls_used.load();
    obj["elapsed_sec"] = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - budget_->start_time).count();
    return obj;
}

} // namespace agentrt
