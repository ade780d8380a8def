#ifndef SWEEP_BACKGROUNDTASK_HPP
#define SWEEP_BACKGROUNDTASK_HPP

#include <functional>
#include <string>

// Runs `task` on its own detached thread. Nobody joins it: the caller must hand the task
// shared ownership of everything it touches, and quitting the process abandons it mid-flight.
// Exceptions escaping the task are logged under `name` and dropped.
// Returns false (after logging) when the thread could not be started; `task` has not run then.
bool RunDetached(const std::string& name, std::function<void()> task);

#endif // SWEEP_BACKGROUNDTASK_HPP
