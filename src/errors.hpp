#pragma once

#include <stdexcept>
#include <string>

// Window system unreachable. Sampler turns it into an idle sample.
class ProbeError : public std::runtime_error {
  public:
    explicit ProbeError(const std::string &what) : std::runtime_error(what) {}
};

// Activity log or category file could not be read or written.
class PersistenceError : public std::runtime_error {
  public:
    explicit PersistenceError(const std::string &what) : std::runtime_error(what) {}
};

// The prompt never produced a usable category for an app.
class UnresolvedCategoryError : public std::runtime_error {
  public:
    UnresolvedCategoryError(const std::string &app, const std::string &what)
        : std::runtime_error(what), m_App(app) {}

    const std::string &App() const {
        return m_App;
    }

  private:
    std::string m_App;
};

// Invalid or unsatisfiable date range.
class RangeError : public std::runtime_error {
  public:
    explicit RangeError(const std::string &what) : std::runtime_error(what) {}
};
