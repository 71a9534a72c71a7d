// modules/runner/event_stream.h
#ifndef AGENTRT_MODULES_RUNNER_EVENT_STREAM_H
#define AGENTRT_MODULES_RUNNER_EVENT_STREAM_H

#include "core/types/event.h"
#include "core/types/session.h"
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace agentrt {

struct RunResult {
    bool success = false;
    std::string message;
    std::string invocation_id;
    std::vector<Event> committed_events; // includes the user event
    SessionPtr session;                  // last committed session, also on failure
};

// Push-side callback: returning false stops the invocation
using EventConsumer = std::function<bool(const Event&)>;

// Pull-side view of one invocation. The invocation runs on a worker thread
// started by the first next(); after handing over an event the worker waits
// until the caller asks for the following one. Destroying the stream cancels
// the invocation and joins the worker.
class EventStream {
public:
    using Producer = std::function<RunResult(const EventConsumer&)>;

    explicit EventStream(Producer producer);
    ~EventStream();

    EventStream(EventStream&&) noexcept = default;
    EventStream& operator=(EventStream&&) = delete;
    EventStream(const EventStream&) = delete;
    EventStream& operator=(const EventStream&) = delete;

    // Blocks until the next event or the end of the invocation (nullopt)
    std::optional<Event> next();

    // The consumer returns false from now on; the worker finishes on its own
    void cancel();

    bool finished() const;
    // Valid once next() has returned nullopt; throws Error otherwise
    const RunResult& result() const;

private:
    struct State {
        Producer producer;
        mutable std::mutex mutex;
        std::condition_variable cv;
        std::optional<Event> slot;
        size_t requested = 0; // calls to next()
        size_t handed = 0;    // events given to the caller
        bool started = false;
        bool done = false;
        bool cancelled = false;
        RunResult result;
        std::exception_ptr error;
        std::thread worker;
    };

    static bool hand_over(State& state, const Event& event);

    std::unique_ptr<State> state_;
};

} // namespace agentrt

#endif // AGENTRT_MODULES_RUNNER_EVENT_STREAM_H
