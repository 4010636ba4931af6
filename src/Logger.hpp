#pragma once

#include <string>

// Line-oriented logging to stdout/stderr. Debug output is enabled per
// instance instead of being looked up from the environment at each call site.
class Logger {
public:
    explicit Logger(bool debug = false) : debug_(debug) {}

    bool debugEnabled() const { return debug_; }

    void info(const std::string& message) const;
    void warn(const std::string& message) const;
    void error(const std::string& message) const;
    void debug(const std::string& message) const;

private:
    bool debug_;
};
