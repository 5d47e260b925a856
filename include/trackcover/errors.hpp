#pragma once

#include <stdexcept>
#include <string>

namespace trackcover {

    // Corrupt, truncated or undecodable track content. Scoped to one file.
    class ParseFailure : public std::runtime_error {
      public:
        explicit ParseFailure(const std::string &what) : std::runtime_error(what) {}
    };

    class UnknownRegion : public std::runtime_error {
      public:
        explicit UnknownRegion(const std::string &name)
            : std::runtime_error("unknown region \"" + name + "\""), name_(name) {}
        UnknownRegion(const std::string &name, const std::string &what) : std::runtime_error(what), name_(name) {}

        const std::string &region() const { return name_; }

      private:
        std::string name_;
    };

    class EmptyCoverage : public std::runtime_error {
      public:
        explicit EmptyCoverage(const std::string &what) : std::runtime_error(what) {}
    };

    class ProjectionFailure : public std::runtime_error {
      public:
        explicit ProjectionFailure(const std::string &what) : std::runtime_error(what) {}
    };

    // Region area is zero or undefined, so no ratio exists.
    class ZeroAreaError : public std::domain_error {
      public:
        explicit ZeroAreaError(const std::string &what) : std::domain_error(what) {}
    };

    class ConfigError : public std::runtime_error {
      public:
        explicit ConfigError(const std::string &what) : std::runtime_error(what) {}
    };

} // namespace trackcover
