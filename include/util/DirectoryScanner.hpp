#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace rfidaudio::util {

/**
 * DirectoryScanner: Directory listing using the getdents64 syscall.
 *
 * Reads one directory level with a single large buffer and uses the d_type
 * field to avoid a stat() per entry. Entries are returned in kernel order;
 * callers that need a stable order sort the result themselves.
 */
class DirectoryScanner {
public:
    /**
     * Result of listing a single directory.
     */
    struct ListResult {
        std::vector<std::string> audio_files;  // Full paths of playable regular files
        size_t skipped = 0;                    // Subdirectories and non-audio entries
        bool ok = false;
        std::string error_message;
    };

    /**
     * Lists the immediate entries of a directory (non-recursive).
     *
     * @param dir Directory to list
     * @return ListResult; ok is false if the directory could not be opened or read
     */
    [[nodiscard]] static ListResult list_directory(const std::filesystem::path& dir);

private:
    static constexpr size_t BUFFER_SIZE = 64 * 1024;
};

}  // namespace rfidaudio::util
