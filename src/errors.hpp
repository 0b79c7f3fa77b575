#pragma once

#include <stdexcept>
#include <string>

namespace conductor {

// Rejects a run (or a registration) before any task is started:
// cyclic or unresolvable predecessor graph, duplicate names, frozen registry.
class setup_error : public std::runtime_error {
public:
    explicit setup_error(const std::string& what)
        : std::runtime_error(what) {}
};

// Raised by the message broker once shutdown() has been called.
class broker_shutdown_error : public std::runtime_error {
public:
    broker_shutdown_error()
        : std::runtime_error("message broker is shut down") {}
};

} // namespace conductor
