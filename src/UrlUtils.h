#pragma once

#include <string>

// 用 libcurl URL API 解析并规范化地址，失败时 error 为原因
bool ParseResourceUrl(const std::string &url, std::string &normalized, std::string &error);

// Kodi 会在 URL 后面追加 "|option=value"，libcurl 不认识，必须去掉
std::string StripKodiOptions(const std::string &url);

// dav:// -> http://, davs:// -> https://
std::string MapDavProtocol(const std::string &url);

// 提取 host (去掉 user:pass@)，用于判断跳转是否跨域
std::string ExtractHost(const std::string &url);
