#ifndef KERNEL_ERRORS_H
#define KERNEL_ERRORS_H

#include <stdexcept>
#include <string>

// ---------- Simulation Errors ----------
// Operation on an agent or population that no longer has a live owner.
class DeadAgent : public std::logic_error {
public:
    explicit DeadAgent(const std::string& what) : std::logic_error(what) {}
};

// Metamorphose towards a species whose parameter layout differs.
class IncompatibleSpecies : public std::invalid_argument {
public:
    explicit IncompatibleSpecies(const std::string& what) : std::invalid_argument(what) {}
};

// Clock built with an end time before its start time.
class InvalidRange : public std::invalid_argument {
public:
    explicit InvalidRange(const std::string& what) : std::invalid_argument(what) {}
};

// Date outside the step window of a clock (strict accessors only).
class DateOutOfRange : public std::out_of_range {
public:
    explicit DateOutOfRange(const std::string& what) : std::out_of_range(what) {}
};

// Raised by a handle registry for a handle that is not (or no longer) registered.
class NoSuchHandle : public std::out_of_range {
public:
    explicit NoSuchHandle(const std::string& what) : std::out_of_range(what) {}
};

#endif // KERNEL_ERRORS_H
