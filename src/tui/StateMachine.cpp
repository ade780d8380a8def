#include "tui/StateMachine.hpp"

#include <cstdint>
#include <ctime>
#include <notcurses/notcurses.h>

#include "tui/KeyInput.hpp"
#include "tui/Signal.hpp"
#include "tui/State.hpp"

StateMachine::StateMachine() : current_state_(nullptr), running_(true) {}

StateMachine::~StateMachine() = default;

void StateMachine::AddState(const std::string& name, std::shared_ptr<State> state) {
    states_[name] = state;
}

void StateMachine::TransitionTo(const std::string& name, ncpp::NotCurses& nc, ncpp::Plane& stdplane) {
    std::unordered_map<std::string, std::shared_ptr<State>>::const_iterator it = states_.find(name);
    if (it == states_.cend()) {
        return;
    }

    if (current_state_ != nullptr) {
        current_state_->Exit(*this, nc, stdplane);
    }

    current_state_ = it->second;
    current_state_->Enter(*this, nc, stdplane);
}

std::shared_ptr<State> StateMachine::GetCurrentState() const {
    return current_state_;
}

void StateMachine::RequestStop() {
    running_ = false;
}

void StateMachine::Run(ncpp::NotCurses& nc, ncpp::Plane& stdplane) {
    running_ = true;

    const timespec poll_timeout{0, 100'000'000}; // 100ms

    while (running_) {
        if (current_state_ == nullptr) {
            break;
        }

        // Redraw before polling so background progress shows up without a keypress.
        current_state_->Draw(*this, nc, stdplane);
        nc.render();

        ncinput input_details{};
        uint32_t ch = notcurses_get(nc, &poll_timeout, &input_details);

        if (g_stop_requested.load(std::memory_order_relaxed)) {
            running_ = false;
            break;
        }

        if (static_cast<int32_t>(ch) == -1) {
            // Input error from notcurses_get; bail out to restore the terminal.
            running_ = false;
            break;
        }

        current_state_->Update(*this, nc, stdplane);
        if (!running_) {
            break;
        }

        if (ch == 0 || input_details.evtype == NCTYPE_RELEASE) {
            continue;
        }
        current_state_->HandleInput(*this, nc, stdplane, TranslateInput(ch, input_details));
    }

    if (current_state_ != nullptr) {
        current_state_->Exit(*this, nc, stdplane);
    }
}
