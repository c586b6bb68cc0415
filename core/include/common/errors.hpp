#pragma once

#include <stdexcept>
#include <string>

namespace cs {
    // Video cannot be opened or decoded. Fatal for the scan.
    class SourceError : public std::runtime_error {
    public:
        explicit SourceError(const std::string& what) : std::runtime_error(what) {}
    };

    // Template image missing, unreadable or zero-sized. Fatal before the first frame.
    class TemplateError : public std::runtime_error {
    public:
        explicit TemplateError(const std::string& what) : std::runtime_error(what) {}
    };

    // An upstream stage broke a chapter list guarantee (e.g. duplicate timestamps).
    class InvariantViolation : public std::logic_error {
    public:
        explicit InvariantViolation(const std::string& what) : std::logic_error(what) {}
    };
}
