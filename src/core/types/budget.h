#ifndef AGENTRT_CORE_TYPES_BUDGET_H
#define AGENTRT_CORE_TYPES_BUDGET_H

#include <atomic>
#include <chrono>

namespace agentrt {

// 单次调用（invocation）的执行预算，所有派生上下文共享
struct ExecutionBudget {
    int max_llm_calls = -1;      // -1 表示无限制

    // Shared across parallel branches
    std::atomic<int> llm_calls_used{0};
    std::chrono::steady_clock::time_point start_time; // reported as elapsed_sec in snapshots

    ExecutionBudget() : start_time(std::chrono::steady_clock::now()) {}
    explicit ExecutionBudget(int llm_calls)
        : max_llm_calls(llm_calls), start_time(std::chrono::steady_clock::now()) {}

    ExecutionBudget(const ExecutionBudget&) = delete;
    ExecutionBudget& operator=(const ExecutionBudget&) = delete;

    bool try_consume_llm_call() {
        int expected = llm_calls_used.load();
        do {
            if (max_llm_calls >= 0 && expected >= max_llm_calls) return false; // another branch took the last call
        } while (!llm_calls_used.compare_exchange_weak(expected, expected + 1));
        return true;
    }
};

} // namespace agentrt

#endif // AGENTRT_CORE_TYPES_BUDGET_H
