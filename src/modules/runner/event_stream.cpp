// modules/runner/event_stream.cpp
#include "runner/event_stream.h"
#include "core/types/errors.h"

namespace agentrt {

EventStream::EventStream(Producer producer) : state_(std::make_unique<State>()) {
    state_->producer = std::move(producer);
}

EventStream::~EventStream() {
    if (!state_) {
        return; // moved from
    }
    cancel();
    if (state_->worker.joinable()) {
        state_->worker.join();
    }
}

bool EventStream::hand_over(State& state, const Event& event) {
    std::unique_lock<std::mutex> lock(state.mutex);
    if (state.cancelled) {
        return false;
    }
    state.slot = event;
    ++state.handed;
    state.cv.notify_all();
    // Resume the unit only when the caller asks for the following event
    state.cv.wait(lock, [&] { return state.cancelled || state.requested > state.handed; });
    return !state.cancelled;
}

std::optional<Event> EventStream::next() {
    State& state = *state_;
    std::unique_lock<std::mutex> lock(state.mutex);
    if (state.done && !state.slot) {
        return std::nullopt;
    }
    ++state.requested;

    if (!state.started) {
        state.started = true;
        State* raw = &state;
        state.worker = std::thread([raw] {
            RunResult result;
            std::exception_ptr error;
            try {
                result = raw->producer([raw](const Event& event) { return hand_over(*raw, event); });
            } catch (...) {
                error = std::current_exception();
            }
            std::lock_guard<std::mutex> guard(raw->mutex);
            raw->result = std::move(result);
            raw->error = error;
            raw->done = true;
            raw->cv.notify_all();
        });
    } else {
        state.cv.notify_all();
    }

    state.cv.wait(lock, [&] { return state.slot.has_value() || state.done; });
    if (state.slot) {
        std::optional<Event> event = std::move(state.slot);
        state.slot.reset();
        return event;
    }
    if (state.error) {
        std::rethrow_exception(state.error);
    }
    return std::nullopt;
}

void EventStream::cancel() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->cancelled = true;
    state_->cv.notify_all();
}

bool EventStream::finished() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->done;
}

const RunResult& EventStream::result() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (!state_->done) {
        throw Error("EventStream result requested before the invocation finished");
    }
    return state_->result;
}

} // namespace agentrt
