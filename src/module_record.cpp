#include "module_record.hpp"

namespace module_concat {

using json = nlohmann::json;

std::string ModuleRecord::directory() const {
    size_t slash = id.find_last_of('/');
    if (slash == std::string::npos) return "";
    return id.substr(0, slash);
}

std::string ModuleRecord::top_level_name() const {
    size_t slash = id.find('/');
    if (slash != std::string::npos) return id.substr(0, slash);
    size_t dot = id.find_last_of('.');
    if (dot == std::string::npos || dot == 0) return id;
    return id.substr(0, dot);
}

json ModuleRecord::to_json() const {
    return json{
        {"id", id},
        {"imports", imports},
        {"classes", classes},
        {"functions", functions},
        {"size", content.size()}
    };
}

bool ModuleTable::add(ModuleRecord record) {
    if (index_.count(record.id)) return false;
    index_.emplace(record.id, records_.size());
    records_.push_back(std::move(record));
    return true;
}

const ModuleRecord* ModuleTable::find(const std::string& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) return nullptr;
    return &records_[it->second];
}

std::optional<size_t> ModuleTable::index_of(const std::string& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

} // namespace module_concat
