#include "client.h"
#include "CurlTransport.h"
#include "KodiLogger.h"
#include "UrlUtils.h"
#include <kodi/General.h>
#include <kodi/Network.h>
#include <cstdio>
#include <memory>

// 导出标准 C 接口
ADDONCREATOR(CRangeVFSAddon)

// 所有 reader 共用一个日志输出
static std::shared_ptr<ILogger> GetAddonLogger()
{
    static std::shared_ptr<ILogger> logger = std::make_shared<CKodiLogger>();
    return logger;
}

// ---------------------------------------------------------------------------
// 实现
// ---------------------------------------------------------------------------

CClientVFS::CClientVFS(const kodi::addon::IInstanceInfo &instance)
    : kodi::addon::CInstanceVFS(instance)
{
    kodi::Log(ADDON_LOG_INFO, "Range Stream VFS: Loaded");
}

ADDON_STATUS CRangeVFSAddon::CreateInstance(const kodi::addon::IInstanceInfo &instance,
                                            KODI_ADDON_INSTANCE_HDL &hdl)
{
    if (instance.IsType(ADDON_INSTANCE_VFS))
    {
        kodi::Log(ADDON_LOG_INFO, "Creating Range Stream VFS Instance");
        hdl = new CClientVFS(instance);
        return ADDON_STATUS_OK;
    }
    return ADDON_STATUS_UNKNOWN;
}

// 辅助函数：手动获取配置 (绕过头文件问题)
static int MyGetSettingInt(const std::string& settingName, int defaultValue)
{
    using namespace kodi::addon;
    int settingValue = defaultValue;
    if (CPrivateBase::m_interface &&
        CPrivateBase::m_interface->toKodi &&
        CPrivateBase::m_interface->toKodi->kodi_addon)
    {
        CPrivateBase::m_interface->toKodi->kodi_addon->get_setting_int(
          CPrivateBase::m_interface->toKodi->kodiBase, settingName.c_str(), &settingValue);
    }
    return settingValue;
}

static bool MyGetSettingBool(const std::string& settingName, bool defaultValue)
{
    using namespace kodi::addon;
    bool settingValue = defaultValue;
    if (CPrivateBase::m_interface &&
        CPrivateBase::m_interface->toKodi &&
        CPrivateBase::m_interface->toKodi->kodi_addon)
    {
        CPrivateBase::m_interface->toKodi->kodi_addon->get_setting_bool(
          CPrivateBase::m_interface->toKodi->kodiBase, settingName.c_str(), &settingValue);
    }
    return settingValue;
}

CRangeReader* CClientVFS::CreateReader(const kodi::addon::VFSUrl &url)
{
    // libcurl 不处理 '|' 及其后的选项，也不认识 dav://
    std::string file_url = MapDavProtocol(StripKodiOptions(url.GetURL()));

    auto transport = std::make_shared<CCurlTransport>();
    transport->SetLogger(GetAddonLogger());
    transport->m_user_agent = kodi::network::GetUserAgent();
    transport->m_verify_ssl = MyGetSettingBool("verify_ssl", false);
    transport->m_net_connect_timeout_sec = MyGetSettingInt("connect_timeout", 10);

    // Fail Fast (Quick Timeout)
    if (MyGetSettingBool("fail_fast", false))
    {
        transport->m_net_connect_timeout_sec = 3;
        transport->m_net_low_speed_time_sec = 3;
        transport->m_net_total_timeout_sec = 10;
    }

    if (!url.GetUsername().empty())
        transport->SetCredentials(file_url, url.GetUsername(), url.GetPassword());

    CRangeReader *reader = new CRangeReader(file_url, transport);
    reader->SetLogger(GetAddonLogger());
    reader->SetMinFetch((int64_t)MyGetSettingInt("min_fetch_kb", 1024) * 1024);

    kodi::Log(ADDON_LOG_DEBUG, "RangeVFS: Config -> MinFetch=%lld KB, ConnectTimeout=%ld s, TotalTimeout=%ld s, VerifySSL=%d",
        (long long)(reader->GetMinFetch() >> 10), transport->m_net_connect_timeout_sec,
        transport->m_net_total_timeout_sec, transport->m_verify_ssl);

    return reader;
}

kodi::addon::VFSFileHandle CClientVFS::Open(const kodi::addon::VFSUrl &url)
{
    std::string safeUrl = url.GetRedacted();
    kodi::Log(ADDON_LOG_DEBUG, "RangeVFS: Open %s", safeUrl.c_str());

    CRangeReader *reader = CreateReader(url);

    // 提前拿到大小，Kodi 需要它来显示进度条
    int64_t size = 0;
    RangeStatus status = reader->Size(size);
    if (status == RangeStatus::REQUEST_ERROR || status == RangeStatus::TRANSPORT_ERROR)
    {
        kodi::Log(ADDON_LOG_ERROR, "RangeVFS: Open failed (%s): %s", RangeStatusToString(status), reader->GetLastError().c_str());
        delete reader;
        return nullptr; // 打开失败
    }
    if (status != RangeStatus::OK)
    {
        // 服务器不支持 HEAD 也可以继续，第一次 200 响应会带回大小
        kodi::Log(ADDON_LOG_WARNING, "RangeVFS: Size unknown on open (%s): %s", RangeStatusToString(status), reader->GetLastError().c_str());
    }

    kodi::Log(ADDON_LOG_INFO, "RangeVFS: 打开文件成功 (Open success), 大小: %lld. URL: %s", (long long)size, safeUrl.c_str());
    return (kodi::addon::VFSFileHandle)reader;
}

ssize_t CClientVFS::Read(kodi::addon::VFSFileHandle context, uint8_t *buffer, size_t uiBufSize)
{
    CRangeReader *reader = (CRangeReader *)context;
    if (!reader)
        return -1;

    size_t read = 0;
    RangeStatus status = reader->Read(buffer, uiBufSize, read);
    if (status == RangeStatus::OK)
        return (ssize_t)read;

    if (status == RangeStatus::END_OF_DATA)
    {
        // 文件末尾的不完整读取：Kodi 需要拿到这部分数据，下一次再返回 0
        if (read > 0)
        {
            int64_t position = 0;
            if (reader->Seek((int64_t)read, SEEK_CUR, position) != RangeStatus::OK)
                return -1;
        }
        return (ssize_t)read;
    }

    kodi::Log(ADDON_LOG_ERROR, "RangeVFS: Read 失败 (%s): %s", RangeStatusToString(status), reader->GetLastError().c_str());
    return -1;
}

int64_t CClientVFS::Seek(kodi::addon::VFSFileHandle context, int64_t position, int whence)
{
    CRangeReader *reader = (CRangeReader *)context;
    if (!reader)
        return -1;

    int64_t new_position = 0;
    RangeStatus status = reader->Seek(position, whence, new_position);
    if (status != RangeStatus::OK)
    {
        kodi::Log(ADDON_LOG_DEBUG, "RangeVFS: Seek(%lld, %d) rejected (%s)", (long long)position, whence, RangeStatusToString(status));
        return -1;
    }
    return new_position;
}

int64_t CClientVFS::GetPosition(kodi::addon::VFSFileHandle context)
{
    CRangeReader *reader = (CRangeReader *)context;
    return reader ? reader->GetPosition() : 0;
}

int64_t CClientVFS::GetLength(kodi::addon::VFSFileHandle context)
{
    CRangeReader *reader = (CRangeReader *)context;
    if (!reader)
        return 0;

    int64_t size = 0;
    if (reader->Size(size) != RangeStatus::OK)
        return 0;
    return size;
}

int CClientVFS::GetChunkSize(kodi::addon::VFSFileHandle context)
{
    CRangeReader *reader = (CRangeReader *)context;
    if (!reader || reader->GetMinFetch() <= 0)
        return 64 * 1024;
    return (int)reader->GetMinFetch();
}

bool CClientVFS::Close(kodi::addon::VFSFileHandle context)
{
    CRangeReader *reader = (CRangeReader *)context;
    if (reader)
    {
        kodi::Log(ADDON_LOG_DEBUG, "RangeVFS: 调用 Close(), 当前逻辑位置=%lld", (long long)reader->GetPosition());
        delete reader; // 必须在这里释放内存
        return true;
    }
    return false;
}

int CClientVFS::Stat(const kodi::addon::VFSUrl &url, kodi::vfs::FileStatus &buffer)
{
    // 必须实现获取文件大小，否则 Kodi 无法处理进度条
    std::unique_ptr<CRangeReader> reader(CreateReader(url));

    int64_t size = 0;
    RangeStatus status = reader->Size(size);
    if (status != RangeStatus::OK)
    {
        kodi::Log(ADDON_LOG_DEBUG, "RangeVFS: Stat failed (%s): %s", RangeStatusToString(status), reader->GetLastError().c_str());
        return -1;
    }

    std::string file_url = StripKodiOptions(url.GetURL());
    buffer.SetSize(size);
    buffer.SetIsDirectory(!file_url.empty() && file_url.back() == '/');
    buffer.SetModificationTime(978310860); // fallback
    return 0;
}

bool CClientVFS::Exists(const kodi::addon::VFSUrl &url)
{
    kodi::vfs::FileStatus status;
    return Stat(url, status) == 0;
}
