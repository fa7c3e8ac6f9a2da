module;

#include <atomic>
#include <iostream>
#include <mutex>
#include <string_view>

module Core:Logging.Impl;
import :Logging;

namespace Core::Log
{
    // Global lock to prevent scrambled output from multiple threads
    std::mutex s_LogMutex;
    std::atomic<Level> s_MinimumLevel{Level::Info};

    namespace
    {
        // Debug sits last in the enum but is the most verbose level.
        int Severity(Level level)
        {
            switch (level)
            {
            case Level::Debug:   return 0;
            case Level::Info:    return 1;
            case Level::Warning: return 2;
            case Level::Error:   return 3;
            }
            return 3;
        }
    }

    void SetMinimumLevel(Level level)
    {
        s_MinimumLevel.store(level, std::memory_order_relaxed);
    }

    Level GetMinimumLevel()
    {
        return s_MinimumLevel.load(std::memory_order_relaxed);
    }

    void PrintColored(Level level, std::string_view msg)
    {
        if (Severity(level) < Severity(GetMinimumLevel()))
            return;

        std::lock_guard lock(s_LogMutex);

        // ANSI Color Codes
        const char* color = "\033[0m";
        const char* label = "[INFO]";

        switch (level) {
        case Level::Info:    color = "\033[32m"; label = "[INFO] "; break; // Green
        case Level::Warning: color = "\033[33m"; label = "[WARN] "; break; // Yellow
        case Level::Error:   color = "\033[31m"; label = "[ERR]  "; break; // Red
        case Level::Debug:   color = "\033[36m"; label = "[DBG]  "; break; // Cyan
        }

        std::cout << color << label << msg << "\033[0m" << std::endl;
    }
}
