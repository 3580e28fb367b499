#include "Logger.h"
#include <cstdarg>
#include <cstdio>
#include <string>
#include <vector>

static std::string FormatMessage(const char *format, va_list args)
{
    char stack_buf[512];
    va_list copy;
    va_copy(copy, args);
    int len = vsnprintf(stack_buf, sizeof(stack_buf), format, copy);
    va_end(copy);

    if (len < 0)
        return format;
    if ((size_t)len < sizeof(stack_buf))
        return std::string(stack_buf, len);

    // 长消息 (例如完整的 URL) 走堆内存
    std::vector<char> heap_buf(len + 1);
    vsnprintf(heap_buf.data(), heap_buf.size(), format, args);
    return std::string(heap_buf.data(), len);
}

void ILogger::Debugf(const char *format, ...)
{
    va_list args;
    va_start(args, format);
    std::string msg = FormatMessage(format, args);
    va_end(args);
    Log(LogLevel::LOG_DEBUG, msg.c_str());
}

void ILogger::Infof(const char *format, ...)
{
    va_list args;
    va_start(args, format);
    std::string msg = FormatMessage(format, args);
    va_end(args);
    Log(LogLevel::LOG_INFO, msg.c_str());
}

void ILogger::Warningf(const char *format, ...)
{
    va_list args;
    va_start(args, format);
    std::string msg = FormatMessage(format, args);
    va_end(args);
    Log(LogLevel::LOG_WARNING, msg.c_str());
}

void ILogger::Errorf(const char *format, ...)
{
    va_list args;
    va_start(args, format);
    std::string msg = FormatMessage(format, args);
    va_end(args);
    Log(LogLevel::LOG_ERROR, msg.c_str());
}
