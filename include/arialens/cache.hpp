// Copyright 2025 Siddhant Biradar
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include "types.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>

namespace arialens {

using Clock = std::chrono::steady_clock;
using ClockFn = std::function<Clock::time_point()>;

// Serialized snapshot kept for later pages
struct CacheEntry {
    std::string key;
    std::string source_url;
    std::shared_ptr<const json> snapshot;
    Clock::time_point created_at;
    Clock::time_point last_accessed_at;
    std::chrono::seconds ttl{0};

    bool is_expired(Clock::time_point now) const { return now - last_accessed_at > ttl; }
};

// In-memory snapshot store with sliding expiration. Expired entries are
// dropped lazily on create() and get(); there is no background reaper.
class SnapshotCache {
public:

    explicit SnapshotCache(std::chrono::seconds default_ttl = std::chrono::seconds(300),
                           ClockFn clock = nullptr);

    // Store a snapshot and return its key ("nav_" + 8 hex digits)
    std::string create(const std::string &source_url, json snapshot,
                       std::optional<std::chrono::seconds> ttl = std::nullopt);
    std::string create(const std::string &source_url, std::shared_ptr<const json> snapshot,
                       std::optional<std::chrono::seconds> ttl = std::nullopt);

    // Look up a live entry, refreshing its access time
    std::optional<CacheEntry> get(const std::string &key);

    // True if the key existed
    bool remove(const std::string &key);
    void clear();

    // Stored entries, including expired ones not yet swept
    size_t size() const;

private:

    std::chrono::seconds default_ttl_;
    ClockFn clock_;
    std::mt19937 rng_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, CacheEntry> entries_;

    void sweep(Clock::time_point now);
    std::string generate_key();
};

} // namespace arialens
