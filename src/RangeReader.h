#pragma once

#include "HttpTransport.h"
#include "Logger.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class CCurlTransport;

// ---------------------------------------------------------------------------
// 返回状态
// ---------------------------------------------------------------------------
// END_OF_DATA 是正常的 "没有更多数据" 信号，其余非 OK 值都是硬错误，
// 细节通过 CRangeReader::GetLastError() 获取。
// ---------------------------------------------------------------------------
enum class RangeStatus
{
    OK = 0,
    END_OF_DATA,
    INVALID_ARGUMENT,
    REQUEST_ERROR,    // URL 解析或请求构造失败
    TRANSPORT_ERROR,  // IHttpTransport::Do 失败
    BODY_ERROR,       // 响应体读取或关闭失败
    LENGTH_MISMATCH,  // Content-Length 与实际字节数不一致
    SIZE_UNAVAILABLE  // HEAD 拿不到长度
};

const char *RangeStatusToString(RangeStatus status);

// ---------------------------------------------------------------------------
// CRangeReader: 用 HTTP Range 请求实现的随机访问流
// ---------------------------------------------------------------------------
// 支持顺序 Read、Seek、按位置 ReadAt，以及 Size。每次网络请求至少取
// MinFetch 字节，最近一次取回的连续区间保存在唯一的缓存窗口里，后续
// 完全落在窗口内的读取不再访问网络。
//
// 注意：不是线程安全的，并发访问请使用各自独立的实例。
// ---------------------------------------------------------------------------
class CRangeReader
{
public:
    static constexpr int64_t DEFAULT_MIN_FETCH = 1024 * 1024;

    // transport 为空时使用默认的 CCurlTransport
    explicit CRangeReader(const std::string &url, std::shared_ptr<IHttpTransport> transport = nullptr);
    ~CRangeReader() = default;

    CRangeReader(const CRangeReader &) = delete;
    CRangeReader &operator=(const CRangeReader &) = delete;

    void SetLogger(std::shared_ptr<ILogger> logger);
    void SetKnownSize(int64_t size);
    void SetMinFetch(int64_t min_fetch) { m_min_fetch = min_fetch < 0 ? 0 : min_fetch; }

    const std::string &GetUrl() const { return m_url; }
    int64_t GetMinFetch() const { return m_min_fetch; }
    int64_t GetPosition() const { return m_offset; }
    bool HasKnownSize() const { return m_known_size.has_value(); }
    const std::string &GetLastError() const { return m_last_error; }

    // 核心读取接口

    // 从当前位置读取 size 字节，成功时前移位置
    RangeStatus Read(uint8_t *buffer, size_t size, size_t &read);

    // 在 offset 处读取 size 字节，不移动位置。读不满时返回 END_OF_DATA
    RangeStatus ReadAt(uint8_t *buffer, size_t size, int64_t offset, size_t &read);

    // 请求 length 字节 (可以大于 size，多出的部分只进缓存)，
    // 复制 min(取到的字节数, size) 到 buffer
    RangeStatus ReadRange(uint8_t *buffer, size_t size, int64_t offset, int64_t length, size_t &read);

    // whence: SEEK_SET / SEEK_CUR / SEEK_END
    RangeStatus Seek(int64_t offset, int whence, int64_t &position);

    // 已知则直接返回，否则发 HEAD 请求
    RangeStatus Size(int64_t &size);

    // "bytes=<from>-<to>"，length 为 0 时请求单个字节
    static std::string FormatRange(int64_t from, int64_t length);

private:
    RangeStatus NewRequest(const char *method, CHttpRequest &request);
    RangeStatus DrainAndClose(IHttpBody *body, RangeStatus status);
    RangeStatus LoadWindow(IHttpBody *body, int64_t expected, int64_t &loaded);
    RangeStatus Fail(RangeStatus status, const std::string &message);

    // 基础信息
    std::string m_url;
    std::optional<std::string> m_parsed_url;
    std::shared_ptr<IHttpTransport> m_transport;
    CCurlTransport *m_default_transport = nullptr; // 仅当 m_transport 由我们创建
    std::shared_ptr<ILogger> m_logger;

    int64_t m_min_fetch = DEFAULT_MIN_FETCH;
    std::optional<int64_t> m_known_size; // 一旦得到就不再改变
    int64_t m_offset = 0;                // Read() 使用的逻辑位置

    // 缓存窗口：最近一次成功取回的连续区间，没有窗口时 offset 为空。
    // m_window 的内存在多次请求之间复用
    std::optional<int64_t> m_window_offset;
    std::vector<uint8_t> m_window;

    std::string m_last_error;
};
