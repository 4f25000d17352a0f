#include "state_machine.h"

namespace holo_oracle {

class StateMachine::Impl {
public:
    Impl() : state_(State::Idle) {}

    State get_state() const {
        return state_;
    }

    bool on_start_listening() {
        switch (state_) {
            case State::Idle:
            case State::Listening:
                state_ = State::Listening;
                return true;
            case State::Processing:
            case State::Speaking:
                return false;
        }
        return false;
    }

    bool on_segment_event(const SegmentEvent& event) {
        if (state_ != State::Listening) {
            return false;
        }
        if (event.is_boundary() && event.valid_speech) {
            state_ = State::Processing;
            return true;
        }
        return false;
    }

    bool on_begin_processing() {
        if (state_ == State::Idle || state_ == State::Listening) {
            state_ = State::Processing;
            return true;
        }
        return false;
    }

    bool on_begin_speaking() {
        if (state_ == State::Processing) {
            state_ = State::Speaking;
            return true;
        }
        return false;
    }

    void on_finished() {
        state_ = State::Idle;
    }

private:
    State state_;
};

StateMachine::StateMachine() : pimpl_(std::make_unique<Impl>()) {}
StateMachine::~StateMachine() = default;

State StateMachine::get_state() const {
    return pimpl_->get_state();
}

bool StateMachine::on_start_listening() {
    return pimpl_->on_start_listening();
}

bool StateMachine::on_segment_event(const SegmentEvent& event) {
    return pimpl_->on_segment_event(event);
}

bool StateMachine::on_begin_processing() {
    return pimpl_->on_begin_processing();
}

bool StateMachine::on_begin_speaking() {
    return pimpl_->on_begin_speaking();
}

void StateMachine::on_finished() {
    pimpl_->on_finished();
}

void StateMachine::reset() {
    pimpl_->on_finished();
}

} // namespace holo_oracle
