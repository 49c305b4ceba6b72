#pragma once

/**
 * @file TemplateStore.h
 * @brief Template cache with lazy, deduplicated loading
 *
 * - A protected set of basic characters is resident from construction
 * - Any other character is loaded on first request
 * - Concurrent requests for a character share one in-flight load
 * - Cleanup() evicts unprotected entries in insertion order
 *
 * Loads never fail: a missing template, or a loader that throws,
 * resolves to MakeFallbackTemplate().
 *
 * Thread safety: all public methods may be called concurrently. Handles
 * returned by LoadAsync() must be waited on before the store is destroyed.
 */

#include <KanaReco/Template/CharacterTemplate.h>
#include <KanaReco/Core/Constants.h>

#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace Kana::Reco::Template {

/**
 * @brief Source of template data for non-resident characters
 *
 * Returns an empty optional when the character is unknown.
 */
using TemplateLoader = std::function<std::optional<CharacterTemplate>(const std::string&)>;

/**
 * @brief Loader backed by the built-in registry
 */
std::optional<CharacterTemplate> LoadFromRegistry(const std::string& character);

/**
 * @brief Template store configuration
 */
struct TemplateStoreParams {
    std::vector<std::string> basicCharacters;   ///< Protected, preloaded characters (empty = DefaultBasicCharacters())
    size_t maxCacheSize = DEFAULT_MAX_TEMPLATE_CACHE;   ///< Default limit used by Cleanup()
    bool verbose = false;                       ///< Log loads and evictions to stderr

    TemplateStoreParams& SetBasicCharacters(const std::vector<std::string>& v) { basicCharacters = v; return *this; }
    TemplateStoreParams& SetMaxCacheSize(size_t v) { maxCacheSize = v; return *this; }
    TemplateStoreParams& SetVerbose(bool v) { verbose = v; return *this; }
};

/**
 * @brief Cache occupancy
 */
struct TemplateCacheStats {
    size_t cachedTemplates = 0;     ///< Resident entries
    size_t pendingLoads = 0;        ///< Loads currently in flight
    size_t totalSupported = 0;      ///< Size of the built-in registry
    size_t completedLoads = 0;      ///< Load operations executed since construction
};

/**
 * @brief Shared, read-mostly template cache
 *
 * Usage:
 * @code
 * TemplateStore store;
 * auto handle = store.LoadAsync("か");   // does not block
 * CharacterTemplate tmpl = handle.get(); // runs or joins the load
 * @endcode
 */
class TemplateStore {
public:
    explicit TemplateStore(const TemplateStoreParams& params = TemplateStoreParams(),
                           TemplateLoader loader = LoadFromRegistry);

    TemplateStore(const TemplateStore&) = delete;
    TemplateStore& operator=(const TemplateStore&) = delete;

    /**
     * @brief Request a template without blocking
     *
     * Returns a ready handle for resident characters. Otherwise returns the
     * handle of the in-flight load for this character, creating it if there
     * is none. The load executes on the first thread that waits on the
     * handle; other waiters block until it completes and receive the same
     * template.
     */
    std::shared_future<CharacterTemplate> LoadAsync(const std::string& character);

    /**
     * @brief Blocking lookup, never fails
     */
    CharacterTemplate Get(const std::string& character);

    bool IsCached(const std::string& character) const;
    bool IsProtected(const std::string& character) const;

    /// Resident characters in insertion order
    std::vector<std::string> CachedCharacters() const;

    /**
     * @brief Evict unprotected entries until at most maxCacheSize remain
     *
     * Entries are removed in insertion order, not by recency. Protected
     * entries are never removed, so the result may exceed the limit.
     *
     * @return Number of evicted entries
     */
    size_t Cleanup(size_t maxCacheSize);

    /// Cleanup() with the configured limit
    size_t Cleanup() { return Cleanup(params_.maxCacheSize); }

    /**
     * @brief Drop all entries and pending loads, then preload the basic set
     */
    void Clear();

    TemplateCacheStats GetStats() const;

    /**
     * @brief Every registered character with its cache state
     */
    std::vector<TemplateInfo> GetAllTemplateInfo() const;

    const TemplateStoreParams& GetParams() const { return params_; }

private:
    struct PendingLoad {
        std::shared_future<CharacterTemplate> handle;
        uint64_t id = 0;
    };

    CharacterTemplate PerformLoad(const std::string& character, uint64_t loadId);
    void InsertLocked(const std::string& character, const CharacterTemplate& tmpl);
    void PreloadBasicLocked();

    TemplateStoreParams params_;
    TemplateLoader loader_;
    std::unordered_set<std::string> protected_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, CharacterTemplate> cache_;
    std::vector<std::string> insertionOrder_;
    std::unordered_map<std::string, PendingLoad> pending_;
    uint64_t nextLoadId_ = 1;
    size_t completedLoads_ = 0;
};

} // namespace Kana::Reco::Template
