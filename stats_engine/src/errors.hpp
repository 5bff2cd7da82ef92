#pragma once

#include <stdexcept>
#include <string>

// Market source unreachable, rate limited or returned garbage. Retryable.
class FetchError : public std::runtime_error {
public:
    explicit FetchError(const std::string& what) : std::runtime_error(what) {}
};

// A store or cache write/read failed. Aborts the asset's run.
class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string& what) : std::runtime_error(what) {}
};

// Every asset in a run failed on persistence.
class RunFatalError : public std::runtime_error {
public:
    explicit RunFatalError(const std::string& what) : std::runtime_error(what) {}
};
