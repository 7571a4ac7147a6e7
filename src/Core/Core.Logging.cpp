module;

#include <iostream>
#include <mutex>
#include <string_view>

module Core:Logging.Impl;

import :Logging;

namespace Core::Log
{
    namespace
    {
        std::mutex s_LogMutex;

        struct Style
        {
            const char* Color;
            const char* Label;
        };

        constexpr Style StyleFor(Level level)
        {
            switch (level)
            {
            case Level::Info:    return {"\033[32m", "[INFO] "}; // Green
            case Level::Warning: return {"\033[33m", "[WARN] "}; // Yellow
            case Level::Error:   return {"\033[31m", "[ERR]  "}; // Red
            case Level::Debug:   return {"\033[36m", "[DBG]  "}; // Cyan
            }
            return {"\033[0m", "[INFO] "};
        }
    }

    void PrintColored(Level level, std::string_view msg)
    {
        const Style style = StyleFor(level);

        std::ostream& out = (level == Level::Warning || level == Level::Error) ? std::cerr : std::cout;

        std::lock_guard lock(s_LogMutex);
        out << style.Color << style.Label << msg << "\033[0m" << std::endl;
    }
}
