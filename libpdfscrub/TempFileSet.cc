#include <pdfscrub/TempFileSet.hh>

#include <qpdf/QUtil.hh>

#include <cstdio>
#include <stdlib.h>
#include <unistd.h>

using namespace pdfscrub;

TempFileSet::TempFileSet(std::string const& directory) :
    directory(directory.empty() ? "." : directory)
{
}

TempFileSet::~TempFileSet()
{
    for (auto const& path: this->paths) {
        (void)remove(path.c_str());
    }
}

std::string
TempFileSet::create()
{
    std::string path_template = this->directory + "/pdfscrub-XXXXXX";
    std::vector<char> buf(path_template.begin(), path_template.end());
    buf.push_back('\0');
    int fd = mkstemp(buf.data());
    if (fd < 0) {
        QUtil::throw_system_error("create temporary file in " + this->directory);
    }
    close(fd);
    this->paths.emplace_back(buf.data());
    return this->paths.back();
}

std::vector<std::string> const&
TempFileSet::getPaths() const
{
    return this->paths;
}

std::vector<std::string>
TempFileSet::cleanup()
{
    std::vector<std::string> remaining;
    for (auto const& path: this->paths) {
        if ((remove(path.c_str()) != 0) && QUtil::file_can_be_opened(path.c_str())) {
            remaining.push_back(path);
        }
    }
    this->paths.clear();
    return remaining;
}
