#include "CurlTransport.h"
#include "UrlUtils.h"
#include <cctype>
#include <mutex>

static std::once_flag g_curl_global_once;

// 调试回调：用于打印发送的请求头以及连接信息
static int DebugCallback(CURL *handle, curl_infotype type, char *data, size_t size, void *userptr)
{
    ILogger *logger = (ILogger *)userptr;
    if (!logger)
        return 0;

    if (type == CURLINFO_HEADER_OUT || type == CURLINFO_HEADER_IN) {
        // HEADER_OUT 是整个请求头块，逐行输出
        std::string block(data, size);
        size_t pos = 0;
        while (pos < block.size()) {
            size_t eol = block.find('\n', pos);
            if (eol == std::string::npos) eol = block.size();
            std::string line = block.substr(pos, eol - pos);
            while (!line.empty() && (isspace((unsigned char)line.back()))) {
                line.pop_back();
            }
            if (!line.empty()) {
                logger->Debugf("RangeVFS: %s %s", type == CURLINFO_HEADER_OUT ? "[Req Header] >>" : "[Resp Header] <<", line.c_str());
            }
            pos = eol + 1;
        }
    }
    // 连接信息，验证 TCP 复用
    else if (type == CURLINFO_TEXT) {
        std::string text(data, size);
        if (text.find("Connected to") != std::string::npos ||
            text.find("Re-using existing connection") != std::string::npos ||
            text.find("Connection #") != std::string::npos)
        {
            while (!text.empty() && (isspace((unsigned char)text.back()))) {
                text.pop_back();
            }
            logger->Debugf("RangeVFS: [Connection Info] %s", text.c_str());
        }
    }
    return 0;
}

CCurlTransport::CCurlTransport()
{
    std::call_once(g_curl_global_once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
    m_curl = curl_easy_init();
}

CCurlTransport::~CCurlTransport()
{
    if (m_curl)
    {
        curl_easy_cleanup(m_curl);
        m_curl = nullptr;
    }
}

void CCurlTransport::SetCredentials(const std::string &origin_url, const std::string &username, const std::string &password)
{
    m_auth_host = ExtractHost(origin_url);
    m_username = username;
    m_password = password;
}

size_t CCurlTransport::BodyWriteCallback(void *contents, size_t size, size_t nmemb, void *userp)
{
    std::vector<uint8_t> *body = (std::vector<uint8_t> *)userp;
    size_t real_size = size * nmemb;
    const uint8_t *bytes = (const uint8_t *)contents;
    body->insert(body->end(), bytes, bytes + real_size);
    return real_size;
}

void CCurlTransport::SetupBaseCurlOptions(CURL *curl, const std::string &target_url)
{
    // Common settings
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L); // Multithreading safety
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 1L);

    curl_easy_setopt(curl, CURLOPT_USERAGENT, m_user_agent.c_str());
    // Content-Length 必须和实际字节数一致，禁止压缩
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "identity");
    curl_easy_setopt(curl, CURLOPT_AUTOREFERER, 0L);

    if (m_logger)
    {
        curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
        curl_easy_setopt(curl, CURLOPT_DEBUGFUNCTION, DebugCallback);
        curl_easy_setopt(curl, CURLOPT_DEBUGDATA, m_logger.get());
    }

    // URL & Auth
    curl_easy_setopt(curl, CURLOPT_URL, target_url.c_str());

    // 跨域跳转后不发送凭据 (libcurl 默认行为，这里只在起始 host 一致时设置)
    std::string host_target = ExtractHost(target_url);
    bool should_send_auth = !m_username.empty() && (m_auth_host.empty() || m_auth_host == host_target);

    if (should_send_auth)
    {
        curl_easy_setopt(curl, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
        curl_easy_setopt(curl, CURLOPT_USERNAME, m_username.c_str());
        curl_easy_setopt(curl, CURLOPT_PASSWORD, m_password.c_str());
    }
    else
    {
        curl_easy_setopt(curl, CURLOPT_HTTPAUTH, CURLAUTH_ANY);
    }

    // SSL & Redirects
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, m_verify_ssl ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, m_verify_ssl ? 2L : 0L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, m_net_max_redirects);

    // Network & Timeouts
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, m_net_connect_timeout_sec);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, m_net_total_timeout_sec);

    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 15L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 5L);
    curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);
    curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, 256L * 1024L);

    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, m_net_low_speed_time_sec);
}

bool CCurlTransport::Do(const CHttpRequest &request, CHttpResponse &response, std::string &error)
{
    if (!m_curl)
    {
        error = "curl_easy_init() failed";
        return false;
    }

    curl_easy_reset(m_curl);

    m_errbuf[0] = 0;
    curl_easy_setopt(m_curl, CURLOPT_ERRORBUFFER, m_errbuf);

    SetupBaseCurlOptions(m_curl, request.url);

    if (request.method == "HEAD")
    {
        curl_easy_setopt(m_curl, CURLOPT_NOBODY, 1L);
    }
    else if (request.method != "GET")
    {
        curl_easy_setopt(m_curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    struct curl_slist *headers = NULL;
    for (const auto &h : request.headers)
    {
        std::string line = h.first + ": " + h.second;
        headers = curl_slist_append(headers, line.c_str());
    }
    if (headers)
        curl_easy_setopt(m_curl, CURLOPT_HTTPHEADER, headers);

    std::vector<uint8_t> body;
    curl_easy_setopt(m_curl, CURLOPT_WRITEFUNCTION, CCurlTransport::BodyWriteCallback);
    curl_easy_setopt(m_curl, CURLOPT_WRITEDATA, &body);

    CURLcode res = curl_easy_perform(m_curl);

    if (headers) { curl_slist_free_all(headers); headers = NULL; }

    if (res != CURLE_OK)
    {
        error = m_errbuf[0] ? std::string(m_errbuf) : std::string(curl_easy_strerror(res));
        if (m_logger)
            m_logger->Errorf("RangeVFS: %s %s failed. Code=%d. Detail: %s", request.method.c_str(), request.url.c_str(), res, error.c_str());
        return false;
    }

    long response_code = 0;
    curl_easy_getinfo(m_curl, CURLINFO_RESPONSE_CODE, &response_code);

    curl_off_t cl = -1;
    if (curl_easy_getinfo(m_curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &cl) != CURLE_OK)
        cl = -1;

    response.status_code = response_code;
    response.content_length = (int64_t)cl;
    response.body.reset(new CMemoryBody(std::move(body)));
    return true;
}
