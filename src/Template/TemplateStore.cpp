/**
 * @file TemplateStore.cpp
 * @brief Template cache with lazy, deduplicated loading
 */

#include <KanaReco/Template/TemplateStore.h>
#include <KanaReco/Template/TemplateRegistry.h>

#include <algorithm>
#include <cstdio>
#include <exception>

namespace Kana::Reco::Template {

std::optional<CharacterTemplate> LoadFromRegistry(const std::string& character) {
    return FindRegisteredTemplate(character);
}

TemplateStore::TemplateStore(const TemplateStoreParams& params, TemplateLoader loader)
    : params_(params)
    , loader_(std::move(loader))
{
    if (params_.basicCharacters.empty()) {
        params_.basicCharacters = DefaultBasicCharacters();
    }
    protected_.insert(params_.basicCharacters.begin(), params_.basicCharacters.end());

    std::lock_guard<std::mutex> lock(mutex_);
    PreloadBasicLocked();
}

// =============================================================================
// Loading
// =============================================================================

std::shared_future<CharacterTemplate> TemplateStore::LoadAsync(const std::string& character) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto cached = cache_.find(character);
    if (cached != cache_.end()) {
        std::promise<CharacterTemplate> ready;
        ready.set_value(cached->second);
        return ready.get_future().share();
    }

    auto inFlight = pending_.find(character);
    if (inFlight != pending_.end()) {
        return inFlight->second.handle;
    }

    // Deferred: the first waiter runs the load, later waiters join it
    uint64_t loadId = nextLoadId_++;
    std::shared_future<CharacterTemplate> handle =
        std::async(std::launch::deferred, [this, character, loadId]() {
            return PerformLoad(character, loadId);
        }).share();

    pending_.emplace(character, PendingLoad{handle, loadId});
    return handle;
}

CharacterTemplate TemplateStore::Get(const std::string& character) {
    return LoadAsync(character).get();
}

CharacterTemplate TemplateStore::PerformLoad(const std::string& character, uint64_t loadId) {
    CharacterTemplate tmpl = MakeFallbackTemplate();
    bool found = false;

    try {
        std::optional<CharacterTemplate> loaded = loader_ ? loader_(character) : std::nullopt;
        if (loaded) {
            tmpl = *loaded;
            found = true;
        }
    } catch (const std::exception& e) {
        fprintf(stderr, "[TemplateStore] Loader failed for '%s': %s\n", character.c_str(), e.what());
    } catch (...) {
        fprintf(stderr, "[TemplateStore] Loader failed for '%s': unknown error\n", character.c_str());
    }

    if (params_.verbose) {
        if (found) {
            fprintf(stderr, "[TemplateStore] Loaded template '%s'\n", character.c_str());
        } else {
            fprintf(stderr, "[TemplateStore] No template for '%s', using fallback\n", character.c_str());
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    InsertLocked(character, tmpl);

    // A Clear() may have replaced the pending entry with a newer load
    auto it = pending_.find(character);
    if (it != pending_.end() && it->second.id == loadId) {
        pending_.erase(it);
    }
    ++completedLoads_;

    return tmpl;
}

void TemplateStore::InsertLocked(const std::string& character, const CharacterTemplate& tmpl) {
    auto inserted = cache_.emplace(character, tmpl);
    if (inserted.second) {
        insertionOrder_.push_back(character);
    }
}

void TemplateStore::PreloadBasicLocked() {
    for (const auto& character : params_.basicCharacters) {
        try {
            std::optional<CharacterTemplate> tmpl = loader_ ? loader_(character) : std::nullopt;
            if (tmpl) {
                InsertLocked(character, *tmpl);
            }
        } catch (const std::exception& e) {
            fprintf(stderr, "[TemplateStore] Preload failed for '%s': %s\n", character.c_str(), e.what());
        } catch (...) {
            fprintf(stderr, "[TemplateStore] Preload failed for '%s': unknown error\n", character.c_str());
        }
    }
}

// =============================================================================
// Cache State
// =============================================================================

bool TemplateStore::IsCached(const std::string& character) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.count(character) > 0;
}

bool TemplateStore::IsProtected(const std::string& character) const {
    return protected_.count(character) > 0;
}

std::vector<std::string> TemplateStore::CachedCharacters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return insertionOrder_;
}

size_t TemplateStore::Cleanup(size_t maxCacheSize) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (cache_.size() <= maxCacheSize) {
        return 0;
    }

    const size_t toRemove = cache_.size() - maxCacheSize;
    size_t removed = 0;

    auto it = insertionOrder_.begin();
    while (it != insertionOrder_.end() && removed < toRemove) {
        if (protected_.count(*it) > 0) {
            ++it;
            continue;
        }
        cache_.erase(*it);
        it = insertionOrder_.erase(it);
        ++removed;
    }

    if (params_.verbose) {
        fprintf(stderr, "[TemplateStore] Cleanup: evicted %zu of %zu requested (limit %zu)\n",
                removed, toRemove, maxCacheSize);
    }
    return removed;
}

void TemplateStore::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
    insertionOrder_.clear();
    pending_.clear();
    PreloadBasicLocked();

    if (params_.verbose) {
        fprintf(stderr, "[TemplateStore] Cache cleared, %zu basic templates reloaded\n", cache_.size());
    }
}

TemplateCacheStats TemplateStore::GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    TemplateCacheStats stats;
    stats.cachedTemplates = cache_.size();
    stats.pendingLoads = pending_.size();
    stats.totalSupported = GetTemplateRegistry().size();
    stats.completedLoads = completedLoads_;
    return stats;
}

std::vector<TemplateInfo> TemplateStore::GetAllTemplateInfo() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<TemplateInfo> infos;
    infos.reserve(GetTemplateRegistry().size());
    for (const auto& [character, tmpl] : GetTemplateRegistry()) {
        TemplateInfo info;
        info.character = character;
        info.tmpl = tmpl;
        info.supported = true;
        info.loaded = cache_.count(character) > 0;
        infos.push_back(std::move(info));
    }
    return infos;
}

} // namespace Kana::Reco::Template
