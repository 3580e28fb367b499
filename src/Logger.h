#pragma once

// ---------------------------------------------------------------------------
// ILogger: 日志输出接口
// ---------------------------------------------------------------------------
// Reader 和 Transport 只认识这个接口，Kodi 插件里由 CKodiLogger 实现。
// 指针可以为空，调用方必须先判断。
// ---------------------------------------------------------------------------

enum class LogLevel
{
    LOG_DEBUG,
    LOG_INFO,
    LOG_WARNING,
    LOG_ERROR
};

class ILogger
{
public:
    virtual ~ILogger() = default;

    // 唯一需要实现的函数，message 已经格式化完毕
    virtual void Log(LogLevel level, const char *message) = 0;

    // printf 风格的辅助函数
    void Debugf(const char *format, ...);
    void Infof(const char *format, ...);
    void Warningf(const char *format, ...);
    void Errorf(const char *format, ...);
};
