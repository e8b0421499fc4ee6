#include "part_registry.h"
#include <spdlog/spdlog.h>

void PartRegistry::insert(const std::string& key, Part part){
    if(part.quantity <= 0){
        spdlog::info("[PLAN] skip {} (quantity {})", key, part.quantity);
        return;
    }
    auto it = index_.find(key);
    if(it != index_.end()){
        parts_[it->second].quantity += part.quantity;
        return;
    }
    part.key = key;
    index_.emplace(key, parts_.size());
    parts_.push_back(std::move(part));
}

const Part* PartRegistry::find(const std::string& key) const {
    auto it = index_.find(key);
    return it == index_.end() ? nullptr : &parts_[it->second];
}

Part* PartRegistry::find(const std::string& key){
    auto it = index_.find(key);
    return it == index_.end() ? nullptr : &parts_[it->second];
}
