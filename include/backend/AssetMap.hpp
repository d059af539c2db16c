#pragma once

#include "model/CardId.hpp"
#include <filesystem>
#include <istream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace rfidaudio::backend {

class AssetResolver {
public:
    virtual ~AssetResolver() = default;

    virtual std::optional<std::filesystem::path> resolve(const model::CardId& id) const = 0;
};

class MappingError : public std::runtime_error {
public:
    MappingError(const std::string& msg, size_t line_number)
        : std::runtime_error(msg), line_number_(line_number) {}

    // 1-based; 0 when the file itself could not be read
    size_t line_number() const { return line_number_; }

private:
    size_t line_number_;
};

/**
 * Card identifier to asset path table, loaded from a mapping file.
 *
 * One entry per line: "<identifier><whitespace><path>". Blank lines and
 * lines starting with '#' are skipped. A repeated identifier keeps the last
 * path. Relative paths resolve against base_dir.
 */
class AssetMap : public AssetResolver {
public:
    AssetMap() = default;
    explicit AssetMap(std::filesystem::path base_dir) : base_dir_(std::move(base_dir)) {}

    static AssetMap load(const std::filesystem::path& mapping_file,
                         const std::filesystem::path& base_dir);
    static AssetMap parse(std::istream& in,
                          const std::filesystem::path& base_dir,
                          const std::string& source_name = "<mapping>");

    void set(const std::string& identifier, const std::string& path);

    std::optional<std::filesystem::path> resolve(const model::CardId& id) const override;

    const std::map<std::string, std::string>& entries() const { return entries_; }
    const std::filesystem::path& base_dir() const { return base_dir_; }
    size_t size() const { return entries_.size(); }

private:
    std::filesystem::path base_dir_;
    std::map<std::string, std::string> entries_;
};

}  // namespace rfidaudio::backend
