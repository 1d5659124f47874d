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

#include "arialens/cache.hpp"
#include "arialens/log.hpp"
#include <cstdint>
#include <cstdio>

namespace arialens {

SnapshotCache::SnapshotCache(std::chrono::seconds default_ttl, ClockFn clock)
    : default_ttl_(default_ttl), clock_(std::move(clock)), rng_(std::random_device{}()) {
    if (!clock_)
        clock_ = [] { return Clock::now(); };
}

std::string SnapshotCache::create(const std::string &source_url, json snapshot,
                                  std::optional<std::chrono::seconds> ttl) {
    return create(source_url, std::make_shared<const json>(std::move(snapshot)), ttl);
}

std::string SnapshotCache::create(const std::string &source_url,
                                  std::shared_ptr<const json> snapshot,
                                  std::optional<std::chrono::seconds> ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_();
    sweep(now);

    CacheEntry entry;
    entry.key = generate_key();
    entry.source_url = source_url;
    entry.snapshot = std::move(snapshot);
    entry.created_at = now;
    entry.last_accessed_at = now;
    entry.ttl = ttl.value_or(default_ttl_);

    std::string key = entry.key;
    entries_.emplace(key, std::move(entry));
    log_debug("Cached snapshot " + key + " for " + (source_url.empty() ? "<none>" : source_url));
    return key;
}

std::optional<CacheEntry> SnapshotCache::get(const std::string &key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_();
    sweep(now);

    auto it = entries_.find(key);
    if (it == entries_.end())
        return std::nullopt;

    it->second.last_accessed_at = now;
    return it->second;
}

bool SnapshotCache::remove(const std::string &key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.erase(key) > 0;
}

void SnapshotCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

size_t SnapshotCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void SnapshotCache::sweep(Clock::time_point now) {
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.is_expired(now)) {
            log_debug("Expired snapshot " + it->first);
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

std::string SnapshotCache::generate_key() {
    std::uniform_int_distribution<uint32_t> dist;
    std::string key;
    do {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "nav_%08x", static_cast<unsigned>(dist(rng_)));
        key = buf;
    } while (entries_.count(key) > 0);
    return key;
}

} // namespace arialens
