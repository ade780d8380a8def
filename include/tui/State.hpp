#ifndef TUI_STATE_HPP
#define TUI_STATE_HPP

#include <ncpp/NotCurses.hh>
#include <ncpp/Plane.hh>

#include "sweep/Key.hpp"

class StateMachine;

// Interface for a screen driven by the state machine.
class State {
public:
    virtual ~State() = default;

    // Called when the state becomes active.
    virtual void Enter(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) = 0;
    // Called when transitioning away from the state.
    virtual void Exit(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) = 0;
    // Paints the current frame onto the provided plane.
    virtual void Draw(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) = 0;
    // Called every loop iteration, with or without input, before the key is dispatched.
    virtual void Update(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) = 0;
    // Handles a single translated key press.
    virtual void HandleInput(StateMachine& machine,
                             ncpp::NotCurses& nc,
                             ncpp::Plane& stdplane,
                             const KeyEvent& key) = 0;
};

#endif // TUI_STATE_HPP
