#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>

#include "util/files.hpp"
#include "util/log.hpp"

namespace files
{
namespace fs = std::filesystem;

static bool ensure_parent_dir(const std::string &path)
{
    std::error_code ec;
    fs::path        dir = fs::path(path).parent_path();
    if (dir.empty())
        return true;  // file in CWD

    if (!fs::exists(dir, ec))
    {
        if (!fs::create_directories(dir, ec))
        {
            LOG_ERROR("create_directories(%s) failed: %s", dir.string().c_str(),
                      ec.message().c_str());
            return false;
        }
    }
    return true;
}

bool read_file(const std::string &path, std::vector<std::uint8_t> &out)
{
    out.clear();
    std::FILE *f = std::fopen(path.c_str(), "rb");
    if (!f)
    {
        LOG_ERROR("open(%s) failed: %s", path.c_str(), std::strerror(errno));
        return false;
    }

    std::uint8_t buf[64 * 1024];
    while (true)
    {
        std::size_t n = std::fread(buf, 1, sizeof(buf), f);
        out.insert(out.end(), buf, buf + n);
        if (n < sizeof(buf))
            break;
    }
    const bool failed = std::ferror(f) != 0;
    std::fclose(f);
    if (failed)
    {
        LOG_ERROR("read(%s) failed", path.c_str());
        return false;
    }
    return true;
}

bool write_file(const std::string &path, const std::vector<std::uint8_t> &data)
{
    if (!ensure_parent_dir(path))
        return false;

    std::FILE *f = std::fopen(path.c_str(), "wb");
    if (!f)
    {
        LOG_ERROR("open(%s) failed: %s", path.c_str(), std::strerror(errno));
        return false;
    }
    const std::size_t n  = data.empty() ? 0 : std::fwrite(data.data(), 1, data.size(), f);
    const bool        ok = (n == data.size()) && std::fclose(f) == 0;
    if (n != data.size())
        std::fclose(f);
    if (!ok)
    {
        LOG_ERROR("write(%s) failed: %s", path.c_str(), std::strerror(errno));
        return false;
    }
    return true;
}

std::string expand_user(const std::string &p)
{
    // expand leading '~' or '~/' to $HOME
    if (!p.empty() && p[0] == '~' && (p.size() == 1 || p[1] == '/'))
    {
        const char *home = std::getenv("HOME");
        if (home && (*home))  // non-empty
        {
            return (p.size() == 1) ? std::string(home) : std::string(home) + p.substr(1);
        }
    }
    return p;
}

}  // namespace files
