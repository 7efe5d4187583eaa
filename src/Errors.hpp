#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Unknown node, street or incident id.
class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& what) : std::runtime_error(what) {}
};

// Both endpoints exist but no path connects them under the active constraints.
class UnreachableError : public std::runtime_error {
public:
    explicit UnreachableError(const std::string& what) : std::runtime_error(what) {}
};

class EmptyGraphError : public std::runtime_error {
public:
    explicit EmptyGraphError(const std::string& what) : std::runtime_error(what) {}
};

// Malformed query payload, rejected before it reaches the planner.
class InvalidRequestError : public std::runtime_error {
public:
    explicit InvalidRequestError(const std::string& what) : std::runtime_error(what) {}
};

// Graph input that breaks a node or street invariant.
class GraphDataError : public std::runtime_error {
public:
    explicit GraphDataError(const std::string& what) : std::runtime_error(what) {}
};

// Unreadable or out-of-range engine configuration.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};
#endif
