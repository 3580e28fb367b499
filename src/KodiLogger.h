#pragma once

#include "Logger.h"
#include <kodi/General.h>

// 把 ILogger 转发到 kodi::Log
class CKodiLogger : public ILogger
{
public:
    void Log(LogLevel level, const char *message) override
    {
        kodi::Log(ToAddonLog(level), "%s", message);
    }

private:
    static ADDON_LOG ToAddonLog(LogLevel level)
    {
        switch (level)
        {
        case LogLevel::LOG_DEBUG: return ADDON_LOG_DEBUG;
        case LogLevel::LOG_INFO: return ADDON_LOG_INFO;
        case LogLevel::LOG_WARNING: return ADDON_LOG_WARNING;
        case LogLevel::LOG_ERROR: return ADDON_LOG_ERROR;
        }
        return ADDON_LOG_DEBUG;
    }
};
