#include "util/DirectoryScanner.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <sys/syscall.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <dirent.h>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <vector>

namespace rfidaudio::util {

// Linux dirent64 structure for getdents64 syscall
struct linux_dirent64 {
    uint64_t d_ino;           // Inode number
    int64_t  d_off;           // Offset to next structure
    uint16_t d_reclen;        // Size of this dirent
    uint8_t  d_type;          // File type
    char     d_name[];        // Filename (null-terminated)
};

DirectoryScanner::ListResult DirectoryScanner::list_directory(const std::filesystem::path& dir) {
    ListResult result;

    // Normalize: strip trailing slashes to prevent // in paths
    std::string dir_str = dir.string();
    while (dir_str.length() > 1 && dir_str.back() == '/') {
        dir_str.pop_back();
    }

    int fd = open(dir_str.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        result.error_message = "cannot open directory " + dir_str + ": " + std::strerror(errno);
        return result;
    }

    std::vector<char> buffer(BUFFER_SIZE);
    result.ok = true;

    while (true) {
        long nread = syscall(SYS_getdents64, fd, buffer.data(), buffer.size());

        if (nread == -1) {
            result.ok = false;
            result.error_message = "getdents64 failed for " + dir_str + ": " + std::strerror(errno);
            break;
        }

        if (nread == 0) {
            break;
        }

        for (long pos = 0; pos < nread;) {
            auto* d = reinterpret_cast<linux_dirent64*>(buffer.data() + pos);
            pos += d->d_reclen;

            if (std::strcmp(d->d_name, ".") == 0 || std::strcmp(d->d_name, "..") == 0) {
                continue;
            }

            bool regular = (d->d_type == DT_REG);
            if (d->d_type == DT_UNKNOWN || d->d_type == DT_LNK) {
                // Filesystem doesn't report d_type, or entry is a symlink: follow it
                struct stat entry_stat;
                regular = fstatat(fd, d->d_name, &entry_stat, 0) == 0 && S_ISREG(entry_stat.st_mode);
            }

            if (regular && Platform::is_audio_extension(d->d_name)) {
                result.audio_files.push_back(dir_str + "/" + d->d_name);
            } else {
                result.skipped++;
            }
        }
    }

    close(fd);

    if (result.ok) {
        Logger::debug("DirectoryScanner: " + dir_str + ": " +
                      std::to_string(result.audio_files.size()) + " audio files, " +
                      std::to_string(result.skipped) + " skipped");
    }
    return result;
}

}  // namespace rfidaudio::util
