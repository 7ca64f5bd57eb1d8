#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace ferry::wire {

// One entry of a directory listing. path is server-relative and starts with '/'.
struct ListItem {
    std::string name;
    std::string path;
    int64_t size = 0;
    int64_t mod_time = 0;  // epoch seconds
    bool is_dir = false;
    std::string mode;      // "drwxr-xr-x" style
};

struct FileStat : ListItem {
    uint32_t mode_num = 0;  // permission bits only
};

void to_json(nlohmann::json& j, const ListItem& item);
void from_json(const nlohmann::json& j, ListItem& item);
void to_json(nlohmann::json& j, const FileStat& stat);
void from_json(const nlohmann::json& j, FileStat& stat);

} // namespace ferry::wire
