#include "archive/zip_format.hpp"

#include "util/path_utils.hpp"

#include <ctime>
#include <sys/stat.h>

namespace filepipe {

namespace {
constexpr std::uint32_t kMsDosDir = 0x10;
constexpr std::uint32_t kMsDosReadOnly = 0x01;
} // namespace

std::uint32_t ZipFileHeader::Mode() const {
    std::uint32_t mode = 0;
    switch (creator_version >> 8) {
        case kZipCreatorUnix:
        case kZipCreatorMacOsX:
            mode = external_attrs >> 16;
            break;
        case kZipCreatorNtfs:
        case kZipCreatorFat:
            if (external_attrs & kMsDosDir) {
                mode = S_IFDIR | 0777;
            } else {
                mode = 0666;
            }
            if (external_attrs & kMsDosReadOnly) mode &= ~0222u;
            break;
        default:
            break;
    }
    if (IsDir()) mode = (mode & ~static_cast<std::uint32_t>(S_IFMT)) | S_IFDIR;
    if ((mode & S_IFMT) == 0) mode |= S_IFREG;
    return mode;
}

void ZipFileHeader::SetMode(std::uint32_t mode) {
    creator_version = static_cast<std::uint16_t>((creator_version & 0xff) | (kZipCreatorUnix << 8));
    external_attrs = mode << 16;
    if (S_ISDIR(mode)) external_attrs |= kMsDosDir;
    if ((mode & 0200) == 0) external_attrs |= kMsDosReadOnly;
}

FileInfo ZipFileHeader::ToFileInfo() const {
    FileInfo info;
    info.name = BaseName(name);
    info.size = uncompressed_size;
    info.mode = Mode();
    info.mtime = modified != 0 ? modified : MsDosToUnix(modified_date, modified_time);
    return info;
}

ZipFileHeader ZipFileHeader::FromFileInfo(const FileInfo& info) {
    ZipFileHeader fh;
    fh.name = info.name;
    fh.uncompressed_size = info.size;
    fh.modified = info.mtime;
    fh.SetMode(info.mode);
    if (info.IsDir()) {
        fh.uncompressed_size = 0;
        if (fh.name.empty() || fh.name.back() != '/') fh.name.push_back('/');
    }
    return fh;
}

void UnixToMsDos(std::int64_t t, std::uint16_t& date, std::uint16_t& time) {
    const std::time_t tt = static_cast<std::time_t>(t);
    std::tm tm{};
    if (!::gmtime_r(&tt, &tm) || tm.tm_year < 80) {
        tm = std::tm{};
        tm.tm_year = 80;
        tm.tm_mon = 0;
        tm.tm_mday = 1;
    }
    date = static_cast<std::uint16_t>(tm.tm_mday + ((tm.tm_mon + 1) << 5) + ((tm.tm_year - 80) << 9));
    time = static_cast<std::uint16_t>(tm.tm_sec / 2 + (tm.tm_min << 5) + (tm.tm_hour << 11));
}

std::int64_t MsDosToUnix(std::uint16_t date, std::uint16_t time) {
    std::tm tm{};
    tm.tm_mday = date & 0x1f;
    tm.tm_mon = ((date >> 5) & 0xf) - 1;
    tm.tm_year = (date >> 9) + 80;
    tm.tm_hour = time >> 11;
    tm.tm_min = (time >> 5) & 0x3f;
    tm.tm_sec = 2 * (time & 0x1f);
    return static_cast<std::int64_t>(::timegm(&tm));
}

} // namespace filepipe
