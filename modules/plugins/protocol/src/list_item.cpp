#include "list_item.h"

namespace ferry::wire {

void to_json(nlohmann::json& j, const ListItem& item) {
    j = nlohmann::json{
        {"name", item.name},
        {"path", item.path},
        {"size", item.size},
        {"modTime", item.mod_time},
        {"isDir", item.is_dir},
        {"mode", item.mode},
    };
}

void from_json(const nlohmann::json& j, ListItem& item) {
    item.name = j.value("name", std::string());
    item.path = j.value("path", std::string());
    item.size = j.value("size", int64_t{0});
    item.mod_time = j.value("modTime", int64_t{0});
    item.is_dir = j.value("isDir", false);
    item.mode = j.value("mode", std::string());
}

void to_json(nlohmann::json& j, const FileStat& stat) {
    to_json(j, static_cast<const ListItem&>(stat));
    j["modeNum"] = stat.mode_num;
}

void from_json(const nlohmann::json& j, FileStat& stat) {
    from_json(j, static_cast<ListItem&>(stat));
    stat.mode_num = j.value("modeNum", uint32_t{0});
}

} // namespace ferry::wire
