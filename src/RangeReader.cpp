#include "RangeReader.h"
#include "CurlTransport.h"
#include "UrlUtils.h"
#include <algorithm>
#include <cstdio>
#include <cstring>
#include <limits>

static const int64_t kMaxOffset = std::numeric_limits<int64_t>::max();

const char *RangeStatusToString(RangeStatus status)
{
    switch (status)
    {
    case RangeStatus::OK: return "OK";
    case RangeStatus::END_OF_DATA: return "END_OF_DATA";
    case RangeStatus::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
    case RangeStatus::REQUEST_ERROR: return "REQUEST_ERROR";
    case RangeStatus::TRANSPORT_ERROR: return "TRANSPORT_ERROR";
    case RangeStatus::BODY_ERROR: return "BODY_ERROR";
    case RangeStatus::LENGTH_MISMATCH: return "LENGTH_MISMATCH";
    case RangeStatus::SIZE_UNAVAILABLE: return "SIZE_UNAVAILABLE";
    }
    return "UNKNOWN";
}

CRangeReader::CRangeReader(const std::string &url, std::shared_ptr<IHttpTransport> transport)
    : m_url(url), m_transport(std::move(transport))
{
    if (!m_transport)
    {
        auto curl = std::make_shared<CCurlTransport>();
        m_default_transport = curl.get();
        m_transport = curl;
    }
}

void CRangeReader::SetLogger(std::shared_ptr<ILogger> logger)
{
    m_logger = std::move(logger);
    if (m_default_transport)
        m_default_transport->SetLogger(m_logger);
}

void CRangeReader::SetKnownSize(int64_t size)
{
    // 已经确定的大小不再改变
    if (size < 0 || m_known_size)
        return;
    m_known_size = size;
}

RangeStatus CRangeReader::Fail(RangeStatus status, const std::string &message)
{
    m_last_error = message;
    if (m_logger)
        m_logger->Errorf("RangeVFS: %s: %s", RangeStatusToString(status), message.c_str());
    return status;
}

std::string CRangeReader::FormatRange(int64_t from, int64_t length)
{
    // 不能超出 int64 上限
    if (length > kMaxOffset - from)
        length = kMaxOffset - from;
    int64_t to = (length == 0) ? from : from + (length - 1);
    std::string range;
    range.reserve(24);
    range += "bytes=";
    range += std::to_string(from);
    range += "-";
    range += std::to_string(to);
    return range;
}

RangeStatus CRangeReader::NewRequest(const char *method, CHttpRequest &request)
{
    // URL 只解析一次，之后复用
    if (!m_parsed_url)
    {
        std::string normalized;
        std::string error;
        if (!ParseResourceUrl(m_url, normalized, error))
            return Fail(RangeStatus::REQUEST_ERROR, error);
        m_parsed_url = normalized;
    }

    request = CHttpRequest();
    request.method = method;
    request.url = *m_parsed_url;
    return RangeStatus::OK;
}

RangeStatus CRangeReader::DrainAndClose(IHttpBody *body, RangeStatus status)
{
    if (!body)
        return status;

    // 不管状态码是多少都要读完并关闭，连接才能复用
    uint8_t discard[16 * 1024];
    bool drain_ok = true;
    for (;;)
    {
        ssize_t n = body->Read(discard, sizeof(discard));
        if (n == 0)
            break;
        if (n < 0)
        {
            drain_ok = false;
            break;
        }
    }
    bool close_ok = body->Close();

    if (status != RangeStatus::OK)
        return status; // 保留更早的错误 (包括 END_OF_DATA)
    if (!drain_ok)
        return Fail(RangeStatus::BODY_ERROR, "failed to drain response body");
    if (!close_ok)
        return Fail(RangeStatus::BODY_ERROR, "failed to close response body");
    return status;
}

RangeStatus CRangeReader::LoadWindow(IHttpBody *body, int64_t expected, int64_t &loaded)
{
    // 窗口被替换：清空但保留底层内存
    m_window.clear();
    loaded = 0;
    if (!body)
        return RangeStatus::OK;

    // expected 最多是请求的长度，不直接信任服务器的 Content-Length
    if (expected > 0 && (size_t)expected > m_window.capacity())
        m_window.reserve((size_t)expected);

    const size_t chunk = 64 * 1024;
    for (;;)
    {
        size_t old_size = m_window.size();
        m_window.resize(old_size + chunk);
        ssize_t n = body->Read(m_window.data() + old_size, chunk);
        if (n < 0)
        {
            m_window.resize(old_size);
            return Fail(RangeStatus::BODY_ERROR, "failed to read response body");
        }
        m_window.resize(old_size + (size_t)n);
        if (n == 0)
            break;
    }

    loaded = (int64_t)m_window.size();
    return RangeStatus::OK;
}

RangeStatus CRangeReader::ReadRange(uint8_t *buffer, size_t size, int64_t offset, int64_t length, size_t &read)
{
    read = 0;
    if (m_logger)
        m_logger->Debugf("RangeVFS: ReadAt len %lld off %lld", (long long)length, (long long)offset);

    if (offset < 0)
        return RangeStatus::END_OF_DATA;
    if (length < 0)
        length = 0;

    // 缓存命中判断用调用方真正要的区间，放大只影响网络请求
    int64_t wanted = length;
    int64_t fetch_length = length;
    if (m_min_fetch != 0)
        fetch_length = std::max(fetch_length, m_min_fetch);

    // 大小已知时截断到文件末尾，位于末尾或之后直接 EOF
    if (m_known_size)
    {
        int64_t remaining = *m_known_size - offset;
        if (remaining <= 0)
            return RangeStatus::END_OF_DATA;
        wanted = std::min(wanted, remaining);
        fetch_length = std::min(fetch_length, remaining);
    }

    // 游标上不封顶，区间末尾不能溢出
    wanted = std::min(wanted, kMaxOffset - offset);
    fetch_length = std::min(fetch_length, kMaxOffset - offset);

    // ---------------------------------------------------------
    // 1. 缓存窗口 (必须完全包含)
    // ---------------------------------------------------------
    if (m_window_offset)
    {
        int64_t win_start = *m_window_offset;
        int64_t win_size = (int64_t)m_window.size();
        int64_t win_end = (win_size > kMaxOffset - win_start) ? kMaxOffset : win_start + win_size;
        if (offset >= win_start && (offset - win_start) + wanted <= win_size)
        {
            if (m_logger)
                m_logger->Debugf("RangeVFS: cache hit: range (%lld-%lld) is within cache (%lld-%lld)",
                    (long long)offset, (long long)(offset + wanted), (long long)win_start, (long long)win_end);

            size_t to_copy = (size_t)std::min<int64_t>((int64_t)size, wanted);
            if (to_copy > 0)
                memcpy(buffer, m_window.data() + (offset - win_start), to_copy);
            read = to_copy;
            return RangeStatus::OK;
        }

        if (m_logger)
            m_logger->Debugf("RangeVFS: cache miss: range (%lld-%lld) is NOT within cache (%lld-%lld)",
                (long long)offset, (long long)(offset + wanted), (long long)win_start, (long long)win_end);
    }
    else if (m_logger)
    {
        m_logger->Debugf("RangeVFS: cache miss: cache empty");
    }

    // ---------------------------------------------------------
    // 2. 发送 Range 请求
    // ---------------------------------------------------------
    CHttpRequest request;
    RangeStatus status = NewRequest("GET", request);
    if (status != RangeStatus::OK)
        return status;

    std::string range = FormatRange(offset, fetch_length);
    request.AddHeader("Range", range);

    if (m_logger)
        m_logger->Infof("RangeVFS: Start HTTP GET with Range: %s", range.c_str());

    CHttpResponse response;
    std::string error;
    if (!m_transport->Do(request, response, error))
        return Fail(RangeStatus::TRANSPORT_ERROR, error);

    if (m_logger)
        m_logger->Infof("RangeVFS: Response status: %ld", response.status_code);

    if (response.status_code != 200 && response.status_code != 206)
    {
        if (m_logger)
            m_logger->Warningf("RangeVFS: %s returned %ld, treating as end of data", range.c_str(), response.status_code);
        return DrainAndClose(response.body.get(), RangeStatus::END_OF_DATA);
    }

    // 200 是完整文件，窗口从 0 开始；206 从请求的 offset 开始
    bool full_content = (response.status_code == 200);
    int64_t window_offset = full_content ? 0 : offset;

    int64_t loaded = 0;
    int64_t expected = std::min(response.content_length, fetch_length);
    status = LoadWindow(response.body.get(), expected, loaded);
    if (status != RangeStatus::OK)
    {
        m_window_offset.reset();
        return DrainAndClose(response.body.get(), status);
    }

    int64_t content_length = response.content_length;
    if (content_length <= 0)
    {
        // Content-Length 没有设置，以实际读到的为准
        content_length = loaded;
    }
    else if (loaded != content_length)
    {
        m_window_offset.reset();
        status = Fail(RangeStatus::LENGTH_MISMATCH,
            "read " + std::to_string(loaded) + " bytes but content length indicated " + std::to_string(content_length));
        return DrainAndClose(response.body.get(), status);
    }

    m_window_offset = window_offset;

    if (full_content && !m_known_size)
    {
        // 200 = 完整文件，记下总大小
        m_known_size = content_length;
        if (m_logger)
            m_logger->Debugf("RangeVFS: learned size %lld from full response", (long long)content_length);
    }

    if (m_logger)
        m_logger->Debugf("RangeVFS: loaded %lld bytes into cache at %lld", (long long)content_length, (long long)window_offset);

    status = DrainAndClose(response.body.get(), RangeStatus::OK);
    if (status != RangeStatus::OK)
        return status;

    int64_t available = (window_offset - offset) + content_length;
    if (available <= 0)
        return RangeStatus::END_OF_DATA;

    int64_t n = std::min(available, fetch_length);
    size_t to_copy = (size_t)std::min<int64_t>(n, (int64_t)size);
    if (to_copy > 0)
        memcpy(buffer, m_window.data() + (offset - window_offset), to_copy);
    read = to_copy;
    return RangeStatus::OK;
}

RangeStatus CRangeReader::ReadAt(uint8_t *buffer, size_t size, int64_t offset, size_t &read)
{
    RangeStatus status = ReadRange(buffer, size, offset, (int64_t)size, read);
    read = std::min(read, size);
    if (read != size && status == RangeStatus::OK)
    {
        // ReadAt 要么读满，要么说明原因
        status = RangeStatus::END_OF_DATA;
    }
    return status;
}

RangeStatus CRangeReader::Read(uint8_t *buffer, size_t size, size_t &read)
{
    if (m_logger)
        m_logger->Debugf("RangeVFS: got read len %zu", size);

    RangeStatus status = ReadAt(buffer, size, m_offset, read);
    if (status == RangeStatus::OK)
        m_offset += (int64_t)read;
    return status;
}

RangeStatus CRangeReader::Seek(int64_t offset, int whence, int64_t &position)
{
    if (m_logger)
        m_logger->Debugf("RangeVFS: got seek %lld %d", (long long)offset, whence);

    position = 0;
    switch (whence)
    {
    case SEEK_SET:
        m_offset = offset;
        break;
    case SEEK_CUR:
        if ((offset > 0 && m_offset > kMaxOffset - offset) ||
            (offset < 0 && m_offset < std::numeric_limits<int64_t>::min() - offset))
        {
            m_last_error = "seek overflows position " + std::to_string(m_offset);
            return RangeStatus::INVALID_ARGUMENT;
        }
        m_offset += offset;
        break;
    case SEEK_END:
    {
        int64_t length = 0;
        RangeStatus status = Size(length);
        if (status != RangeStatus::OK)
            return status;

        if (offset > 0 || offset < -length)
            return RangeStatus::END_OF_DATA; // 位置不变
        m_offset = length + offset;
        break;
    }
    default:
        m_last_error = "invalid whence " + std::to_string(whence);
        return RangeStatus::INVALID_ARGUMENT;
    }

    position = m_offset;
    return RangeStatus::OK;
}

RangeStatus CRangeReader::Size(int64_t &size)
{
    size = 0;
    if (m_known_size)
    {
        size = *m_known_size;
        return RangeStatus::OK;
    }

    CHttpRequest request;
    RangeStatus status = NewRequest("HEAD", request);
    if (status != RangeStatus::OK)
        return status;

    CHttpResponse response;
    std::string error;
    if (!m_transport->Do(request, response, error))
        return Fail(RangeStatus::TRANSPORT_ERROR, error);

    status = DrainAndClose(response.body.get(), RangeStatus::OK);
    if (status != RangeStatus::OK)
        return status;

    if (response.status_code < 200 || response.status_code >= 300)
        return Fail(RangeStatus::SIZE_UNAVAILABLE, "HEAD returned status " + std::to_string(response.status_code));

    int64_t length = response.content_length;
    if (m_logger)
        m_logger->Debugf("RangeVFS: url: %s, size %lld", request.url.c_str(), (long long)length);
    if (length < 0)
        return Fail(RangeStatus::SIZE_UNAVAILABLE, "no content length for Size()");

    m_known_size = length;
    size = length;
    return RangeStatus::OK;
}
