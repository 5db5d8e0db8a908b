#pragma once
#include <cmath>
#include <cstdint>
#include <map>
#include <mutex>
#include <memory>

#include "PdfSceneRasterizer.h"

namespace pdfraster
{
    // ============================================
    // PAGE RENDER CACHE
    // Rendered targets by (document, page, scale), least recently used
    // evicted first. Bounded by entry count and by pixel memory.
    // ============================================

    struct PageCacheKey
    {
        uint64_t docId;
        int pageIndex;
        int64_t scaleKey;   // scale in 1/1000

        static int64_t QuantizeScale(double scale)
        {
            return static_cast<int64_t>(std::llround(scale * 1000.0));
        }

        bool operator<(const PageCacheKey& other) const
        {
            if (docId != other.docId) return docId < other.docId;
            if (pageIndex != other.pageIndex) return pageIndex < other.pageIndex;
            return scaleKey < other.scaleKey;
        }

        bool operator==(const PageCacheKey& other) const
        {
            return docId == other.docId && pageIndex == other.pageIndex && scaleKey == other.scaleKey;
        }
    };

    class PageRenderCache
    {
    public:
        PageRenderCache(size_t capacity, size_t maxMemory)
            : _capacity(capacity), _maxMemory(maxMemory)
        {
        }

        PageRenderCache(const PageRenderCache&) = delete;
        PageRenderCache& operator=(const PageRenderCache&) = delete;

        bool get(const PageCacheKey& key, PdfRenderTargetPtr& out)
        {
            std::lock_guard<std::mutex> lock(_mutex);

            auto it = _cache.find(key);
            if (it != _cache.end())
            {
                it->second.lastAccess = ++_tick;
                out = it->second.target;
                ++_hits;
                return true;
            }

            ++_misses;
            return false;
        }

        // A target larger than the whole memory budget is not kept
        void store(const PageCacheKey& key, const PdfRenderTargetPtr& target)
        {
            if (!target || _capacity == 0)
                return;

            size_t newSize = target->memorySize();
            if (newSize > _maxMemory)
                return;

            std::lock_guard<std::mutex> lock(_mutex);

            auto it = _cache.find(key);
            if (it != _cache.end())
            {
                _totalMemory -= it->second.memorySize;
                _cache.erase(it);
            }

            while (!_cache.empty() &&
                (_cache.size() >= _capacity || _totalMemory + newSize > _maxMemory))
            {
                evictOldest();
            }

            CachedPage page;
            page.target = target;
            page.lastAccess = ++_tick;
            page.memorySize = newSize;

            _cache[key] = std::move(page);
            _totalMemory += newSize;
        }

        bool contains(const PageCacheKey& key) const
        {
            std::lock_guard<std::mutex> lock(_mutex);
            return _cache.count(key) != 0;
        }

        void clearDocument(uint64_t docId)
        {
            std::lock_guard<std::mutex> lock(_mutex);

            for (auto it = _cache.begin(); it != _cache.end(); )
            {
                if (it->first.docId == docId)
                {
                    _totalMemory -= it->second.memorySize;
                    it = _cache.erase(it);
                }
                else
                {
                    ++it;
                }
            }
        }

        void clear()
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _cache.clear();
            _totalMemory = 0;
            _hits = 0;
            _misses = 0;
        }

        // Stats
        size_t hitCount() const { std::lock_guard<std::mutex> lock(_mutex); return _hits; }
        size_t missCount() const { std::lock_guard<std::mutex> lock(_mutex); return _misses; }
        size_t cacheSize() const { std::lock_guard<std::mutex> lock(_mutex); return _cache.size(); }
        size_t memoryUsage() const { std::lock_guard<std::mutex> lock(_mutex); return _totalMemory; }

        size_t capacity() const { return _capacity; }
        size_t maxMemory() const { return _maxMemory; }

    private:
        struct CachedPage
        {
            PdfRenderTargetPtr target;
            uint64_t lastAccess = 0;
            size_t memorySize = 0;
        };

        void evictOldest()
        {
            if (_cache.empty()) return;

            auto oldest = _cache.begin();
            for (auto it = _cache.begin(); it != _cache.end(); ++it)
            {
                if (it->second.lastAccess < oldest->second.lastAccess)
                    oldest = it;
            }

            _totalMemory -= oldest->second.memorySize;
            _cache.erase(oldest);
        }

        std::map<PageCacheKey, CachedPage> _cache;
        mutable std::mutex _mutex;
        size_t _capacity;
        size_t _maxMemory;
        size_t _totalMemory = 0;
        uint64_t _tick = 0;
        size_t _hits = 0;
        size_t _misses = 0;
    };
}
