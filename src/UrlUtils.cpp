#include "UrlUtils.h"
#include <curl/curl.h>

bool ParseResourceUrl(const std::string &url, std::string &normalized, std::string &error)
{
    CURLU *h = curl_url();
    if (!h)
    {
        error = "curl_url() failed";
        return false;
    }

    bool ok = false;
    CURLUcode rc = curl_url_set(h, CURLUPART_URL, url.c_str(), 0);
    if (rc == CURLUE_OK)
    {
        char *full = NULL;
        rc = curl_url_get(h, CURLUPART_URL, &full, 0);
        if (rc == CURLUE_OK && full)
        {
            normalized = full;
            ok = true;
        }
        curl_free(full);
    }

    if (!ok)
    {
        error = "invalid url '" + url + "': " + curl_url_strerror(rc);
    }
    curl_url_cleanup(h);
    return ok;
}

std::string StripKodiOptions(const std::string &url)
{
    size_t pipe_pos = url.find('|');
    if (pipe_pos != std::string::npos)
        return url.substr(0, pipe_pos);
    return url;
}

std::string MapDavProtocol(const std::string &url)
{
    std::string result = url;
    if (result.rfind("dav://", 0) == 0)
        result.replace(0, 6, "http://");
    else if (result.rfind("davs://", 0) == 0)
        result.replace(0, 7, "https://");
    return result;
}

std::string ExtractHost(const std::string &url)
{
    size_t protocol_pos = url.find("://");
    if (protocol_pos == std::string::npos) return "";
    size_t start = protocol_pos + 3;

    // Check for user:pass@
    size_t at_pos = url.find('@', start);
    size_t slash_pos = url.find('/', start);

    // If @ exists and is before /, start after @
    if (at_pos != std::string::npos && (slash_pos == std::string::npos || at_pos < slash_pos))
    {
        start = at_pos + 1;
    }

    size_t end = url.find('/', start);
    if (end == std::string::npos) return url.substr(start);
    return url.substr(start, end - start);
}
