#pragma once
#include <string>
#include <unordered_map>
#include <vector>
#include "frame_types.h"

// Ordered part map keyed by identity. Re-inserting a key adds the quantity.
class PartRegistry {
public:
    void insert(const std::string& key, Part part);

    const Part* find(const std::string& key) const;
    Part* find(const std::string& key);
    bool contains(const std::string& key) const { return index_.count(key) != 0; }

    std::vector<Part>& parts() { return parts_; }
    const std::vector<Part>& parts() const { return parts_; }
    size_t size() const { return parts_.size(); }
    bool empty() const { return parts_.empty(); }

    std::vector<Part>::iterator begin() { return parts_.begin(); }
    std::vector<Part>::iterator end() { return parts_.end(); }
    std::vector<Part>::const_iterator begin() const { return parts_.begin(); }
    std::vector<Part>::const_iterator end() const { return parts_.end(); }

private:
    std::vector<Part> parts_;
    std::unordered_map<std::string, size_t> index_;
};
