// src/ping_builder_registry.hpp
// Type name -> ping builder map.

#pragma once

#include "beacon/ping_builder.hpp"

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace beacon {

// The map itself is lock-guarded so registration and the synchronous guard
// checks can run on caller threads. The builders it hands out must only be
// mutated from the telemetry worker.
class PingBuilderRegistry {
public:
    // Last write wins on a duplicate type.
    void add(std::shared_ptr<PingBuilder> builder);

    // nullptr when absent.
    std::shared_ptr<PingBuilder> find(const std::string& type) const;
    bool contains(const std::string& type) const;

    std::vector<std::shared_ptr<PingBuilder>> snapshot() const;
    size_t size() const;
    void clear();

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<PingBuilder>> builders_;
};

} // namespace beacon
