#include "sdbg/util/file-system.hh"
#include "sdbg/util/error.hh"
#include "sdbg/util/file-descriptor.hh"

#include <fcntl.h>
#include <sys/stat.h>

namespace sdbg {

Path absPath(PathView path)
{
    std::filesystem::path p(path);
    if (p.is_relative()) {
        std::error_code ec;
        auto cwd = std::filesystem::current_path(ec);
        if (ec)
            throw SysError(ec.value(), "getting the current directory");
        p = cwd / p;
    }

    auto res = p.lexically_normal().string();
    if (res.size() > 1 && res.back() == '/')
        res.pop_back();
    return res;
}

Path dirOf(PathView path)
{
    auto slash = path.rfind('/');
    if (slash == path.npos)
        return ".";
    return slash == 0 ? "/" : Path(path.substr(0, slash));
}

bool pathExists(const std::filesystem::path & path)
{
    struct stat st;
    if (lstat(path.c_str(), &st) == 0)
        return true;
    if (errno == ENOENT || errno == ENOTDIR)
        return false;
    throw SysError("getting status of '%s'", path.string());
}

std::string readFile(const Path & path)
{
    AutoCloseFD fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (!fd)
        throw SysError("opening file '%s'", path);
    return drainFD(fd.get());
}

void createDirs(const std::filesystem::path & path)
{
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec)
        throw SysError(ec.value(), "creating directory '%s'", path.string());
}

} // namespace sdbg
