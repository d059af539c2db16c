#include "backend/AssetMap.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>

namespace rfidaudio::backend {

namespace {

constexpr const char* WHITESPACE = " \t\r\n\v\f";

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(WHITESPACE);
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(WHITESPACE);
    return s.substr(start, end - start + 1);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

}  // namespace

AssetMap AssetMap::load(const std::filesystem::path& mapping_file,
                        const std::filesystem::path& base_dir) {
    util::Logger::info("AssetMap: Loading " + mapping_file.string());

    std::ifstream file(mapping_file);
    if (!file) {
        throw MappingError("Cannot open mapping file " + mapping_file.string(), 0);
    }
    return parse(file, base_dir, mapping_file.string());
}

AssetMap AssetMap::parse(std::istream& in,
                         const std::filesystem::path& base_dir,
                         const std::string& source_name) {
    AssetMap map(base_dir);

    std::string raw;
    size_t line_number = 0;
    while (std::getline(in, raw)) {
        line_number++;
        std::string line = trim(raw);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') continue;

        auto sep = line.find_first_of(WHITESPACE);
        if (sep == std::string::npos) {
            std::string msg = source_name + ":" + std::to_string(line_number) +
                              ": malformed mapping line \"" + line + "\"";
            util::Logger::error("AssetMap: " + msg);
            throw MappingError(msg, line_number);
        }

        std::string identifier = line.substr(0, sep);
        std::string path = trim(line.substr(sep));

        if (map.entries_.count(to_lower(identifier))) {
            util::Logger::warn("AssetMap: " + source_name + ":" + std::to_string(line_number) +
                               ": identifier " + identifier + " repeated, later entry wins");
        }
        map.set(identifier, path);
    }

    if (in.bad()) {
        throw MappingError("Read error in mapping file " + source_name, line_number);
    }

    util::Logger::info("AssetMap: " + std::to_string(map.size()) + " cards mapped from " + source_name);
    return map;
}

void AssetMap::set(const std::string& identifier, const std::string& path) {
    entries_[to_lower(identifier)] = path;
}

std::optional<std::filesystem::path> AssetMap::resolve(const model::CardId& id) const {
    auto it = entries_.find(to_lower(id.hex));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    // operator/ keeps absolute right-hand paths as they are
    return base_dir_ / it->second;
}

}  // namespace rfidaudio::backend
