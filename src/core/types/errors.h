#ifndef AGENTRT_CORE_TYPES_ERRORS_H
#define AGENTRT_CORE_TYPES_ERRORS_H

#include <stdexcept>
#include <string>
#include <vector>

namespace agentrt {

struct Error : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Malformed event, state key or state value rejected by SessionStore::append_event
struct ValidationError : public Error {
    using Error::Error;
};

struct AlreadyExistsError : public Error {
    using Error::Error;
};

struct NotFoundError : public Error {
    using Error::Error;
};

// Session database failures (open, prepare, step, transaction)
struct StorageError : public Error {
    using Error::Error;
};

struct ToolError : public Error {
    using Error::Error;
};

struct ConfigError : public Error {
    using Error::Error;
};

struct LlmCallsLimitExceededError : public Error {
    explicit LlmCallsLimitExceededError(int limit)
        : Error("Max number of LLM calls limit of " + std::to_string(limit) + " exceeded"),
          limit(limit) {}
    int limit;
};

// Raised by ParallelAgent once every branch has finished and at least one failed
struct ParallelAgentError : public Error {
    struct BranchFailure {
        std::string branch;
        std::string message;
    };

    ParallelAgentError(const std::string& agent_name, std::vector<BranchFailure> failures)
        : Error(build_message(agent_name, failures)), failures(std::move(failures)) {}

    std::vector<BranchFailure> failures;

private:
    static std::string build_message(const std::string& agent_name,
                                     const std::vector<BranchFailure>& failures) {
        std::string msg = "Parallel agent '" + agent_name + "' failed in " +
                          std::to_string(failures.size()) + " branch(es):";
        for (const auto& f : failures) {
            msg += " [" + f.branch + "] " + f.message + ";";
        }
        return msg;
    }
};

} // namespace agentrt

#endif // AGENTRT_CORE_TYPES_ERRORS_H
