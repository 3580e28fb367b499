#include "HttpTransport.h"
#include <algorithm>
#include <cctype>
#include <cstring>

static bool EqualsNoCase(const std::string &a, const std::string &b)
{
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); i++)
    {
        if (tolower((unsigned char)a[i]) != tolower((unsigned char)b[i]))
            return false;
    }
    return true;
}

std::string CHttpRequest::GetHeader(const std::string &name) const
{
    for (const auto &h : headers)
    {
        if (EqualsNoCase(h.first, name))
            return h.second;
    }
    return "";
}

ssize_t CMemoryBody::Read(uint8_t *buffer, size_t size)
{
    if (m_closed)
        return -1;

    size_t remaining = m_data.size() - m_read_pos;
    size_t to_copy = std::min(size, remaining);
    if (to_copy > 0)
    {
        memcpy(buffer, m_data.data() + m_read_pos, to_copy);
        m_read_pos += to_copy;
    }
    return (ssize_t)to_copy;
}

bool CMemoryBody::Close()
{
    m_closed = true;
    // 释放内存，body 可能比较大
    std::vector<uint8_t>().swap(m_data);
    m_read_pos = 0;
    return true;
}
