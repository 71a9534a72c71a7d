// modules/budget/budget_controller.h
#ifndef AGENTRT_MODULES_BUDGET_BUDGET_CONTROLLER_H
#define AGENTRT_MODULES_BUDGET_BUDGET_CONTROLLER_H

#include "core/types/budget.h"
#include "core/types/value.h"
#include <memory>

namespace agentrt {

// Guards the LLM-call budget of one invocation. A limit <= 0 means unlimited.
class BudgetController {
public:
    explicit BudgetController(int max_llm_calls = 500);

    // 尝试消耗一次 LLM 调用预算，失败返回 false
    bool try_consume_llm_call();

    // Same as try_consume_llm_call but throws LlmCallsLimitExceededError
    void consume_llm_call();

    int llm_calls_used() const;
    int max_llm_calls() const { return budget_->max_llm_calls; }

    Value snapshot() const;

private:
    std::unique_ptr<ExecutionBudget> budget_;
};

} // namespace agentrt

#endif // AGENTRT_MODULES_BUDGET_BUDGET_CONTROLLER_H
