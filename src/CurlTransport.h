#pragma once

#include "HttpTransport.h"
#include "Logger.h"
#include <curl/curl.h>
#include <memory>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// CCurlTransport: 基于 libcurl easy 接口的 IHttpTransport
// ---------------------------------------------------------------------------
// 每个实例持有一个 easy handle，请求之间只做 curl_easy_reset，
// 这样 libcurl 可以复用 TCP 连接。不做重试，不是线程安全的。
// ---------------------------------------------------------------------------
class CCurlTransport : public IHttpTransport
{
public:
    CCurlTransport();
    ~CCurlTransport() override;

    CCurlTransport(const CCurlTransport &) = delete;
    CCurlTransport &operator=(const CCurlTransport &) = delete;

    bool Do(const CHttpRequest &request, CHttpResponse &response, std::string &error) override;

    void SetLogger(std::shared_ptr<ILogger> logger) { m_logger = std::move(logger); }
    ILogger *GetLogger() const { return m_logger.get(); }

    // 凭据只发给 origin_url 所在的 host，跳转到其他 host 时不发送
    void SetCredentials(const std::string &origin_url, const std::string &username, const std::string &password);

    // -----------------------------------------------------------------------
    // Network Timeouts & Limits
    // -----------------------------------------------------------------------
    long m_net_connect_timeout_sec = 10;
    long m_net_low_speed_time_sec = 15;
    long m_net_total_timeout_sec = 20; // 单次请求总超时 (0 = 不限制)
    long m_net_max_redirects = 5;
    bool m_verify_ssl = false;
    std::string m_user_agent = "vfs.stream.range/1.0";

protected:
    void SetupBaseCurlOptions(CURL *curl, const std::string &target_url);

    static size_t BodyWriteCallback(void *contents, size_t size, size_t nmemb, void *userp);

private:
    CURL *m_curl = nullptr;
    // 注册在 m_curl 上，生命周期要和句柄一样长
    char m_errbuf[CURL_ERROR_SIZE] = {0};
    std::shared_ptr<ILogger> m_logger;

    std::string m_auth_host;
    std::string m_username;
    std::string m_password;
};
