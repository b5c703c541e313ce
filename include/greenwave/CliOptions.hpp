#pragma once

#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace greenwave
{
    // --key value pairs following the command word.
    using Options = std::map<std::string, std::string>;

    inline bool parseOptions(int argc, const char *const *argv, Options &options)
    {
        for (int i = 2; i < argc; ++i)
        {
            const std::string key = argv[i];
            if (key.rfind("--", 0) != 0 || i + 1 >= argc)
            {
                std::cerr << "Unexpected argument: " << key << std::endl;
                return false;
            }
            options[key.substr(2)] = argv[++i];
        }
        return true;
    }

    // Throws std::invalid_argument when the value is not a number of type T.
    // Unsigned options reject negative input instead of wrapping around.
    template <typename T>
    T numericOption(const Options &options, const std::string &key, T fallback)
    {
        auto it = options.find(key);
        if (it == options.end())
        {
            return fallback;
        }

        if (std::is_unsigned<T>::value && it->second.find('-') != std::string::npos)
        {
            throw std::invalid_argument("--" + key + " expects a non-negative number, got '" + it->second + "'");
        }

        std::istringstream in(it->second);
        T value{};
        if (!(in >> value) || !in.eof())
        {
            throw std::invalid_argument("--" + key + " expects a number, got '" + it->second + "'");
        }
        return value;
    }

    inline std::string stringOption(const Options &options, const std::string &key, const std::string &fallback)
    {
        auto it = options.find(key);
        return it == options.end() ? fallback : it->second;
    }

} // namespace greenwave
