#pragma once
#include <stdexcept>
#include <string>

namespace suf
{
    // Invalid or unreadable run inputs: configuration, thermal profile, brumation calendar.
    class ConfigError : public std::runtime_error
    {
        public:
            explicit ConfigError(const std::string &what): std::runtime_error(what)
            {
            }
    };
} // namespace suf
