#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <sys/types.h>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// HTTP 传输层接口
// ---------------------------------------------------------------------------
// CRangeReader 只通过 IHttpTransport 发请求。生产环境使用 CCurlTransport，
// 测试里使用内存假实现。
// ---------------------------------------------------------------------------

struct CHttpRequest
{
    std::string method = "GET"; // "GET" or "HEAD"
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;

    void AddHeader(const std::string &name, const std::string &value)
    {
        headers.emplace_back(name, value);
    }

    // 不区分大小写，找不到返回空串
    std::string GetHeader(const std::string &name) const;
};

// 响应体：必须读完并关闭，连接才能被复用
class IHttpBody
{
public:
    virtual ~IHttpBody() = default;

    // >0: 读到的字节数, 0: 读完, -1: 出错
    virtual ssize_t Read(uint8_t *buffer, size_t size) = 0;
    virtual bool Close() = 0;
};

struct CHttpResponse
{
    long status_code = 0;
    int64_t content_length = -1; // -1 未知
    std::unique_ptr<IHttpBody> body;
};

class IHttpTransport
{
public:
    virtual ~IHttpTransport() = default;

    // 返回 false 表示传输层错误，error 里是原因
    virtual bool Do(const CHttpRequest &request, CHttpResponse &response, std::string &error) = 0;
};

// ---------------------------------------------------------------------------
// CMemoryBody: 已经下载到内存里的响应体
// ---------------------------------------------------------------------------
class CMemoryBody : public IHttpBody
{
public:
    CMemoryBody() = default;
    explicit CMemoryBody(std::vector<uint8_t> data) : m_data(std::move(data)) {}

    ssize_t Read(uint8_t *buffer, size_t size) override;
    bool Close() override;

    bool IsClosed() const { return m_closed; }

private:
    std::vector<uint8_t> m_data;
    size_t m_read_pos = 0;
    bool m_closed = false;
};
