// src/ping_builder_registry.cpp

#include "ping_builder_registry.hpp"

#include <mutex>

namespace beacon {

void PingBuilderRegistry::add(std::shared_ptr<PingBuilder> builder) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto type = builder->type();
    builders_[std::move(type)] = std::move(builder);
}

std::shared_ptr<PingBuilder> PingBuilderRegistry::find(const std::string& type) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = builders_.find(type);
    return it == builders_.end() ? nullptr : it->second;
}

bool PingBuilderRegistry::contains(const std::string& type) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return builders_.count(type) > 0;
}

std::vector<std::shared_ptr<PingBuilder>> PingBuilderRegistry::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::shared_ptr<PingBuilder>> result;
    result.reserve(builders_.size());
    for (const auto& [type, builder] : builders_) {
        result.push_back(builder);
    }
    return result;
}

size_t PingBuilderRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return builders_.size();
}

void PingBuilderRegistry::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    builders_.clear();
}

} // namespace beacon
