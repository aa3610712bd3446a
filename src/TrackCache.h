/**
 * @file TrackCache.h
 * @brief On-disk cache of downloaded track audio, keyed by track id
 *
 * Each entry is one file under the cache directory. Writes go to a
 * temporary ".part" file that is renamed into place, so a reader never
 * sees partial bytes. Bookkeeping (size, last access, pins) is kept in an
 * in-memory index guarded by a single mutex.
 *
 * Eviction is least-recently-used against a byte budget (and an optional
 * entry-count cap). Pinned entries (current and next track) are never
 * evicted; pins are held through CacheHandle.
 */

#ifndef STATIONPLAY_TRACK_CACHE_H
#define STATIONPLAY_TRACK_CACHE_H

#include "Models.h"
#include "Status.h"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct CachedAudio {
    std::vector<uint8_t> bytes;
    AudioEncoding encoding = AudioEncoding::UNKNOWN;
};

class TrackCache;

/**
 * @brief Pin on a cache entry; the entry cannot be evicted while held
 *
 * Move-only. Safe to outlive the TrackCache that issued it.
 */
class CacheHandle {
public:
    CacheHandle() = default;
    ~CacheHandle();

    CacheHandle(CacheHandle&& other) noexcept;
    CacheHandle& operator=(CacheHandle&& other) noexcept;
    CacheHandle(const CacheHandle&) = delete;
    CacheHandle& operator=(const CacheHandle&) = delete;

    bool valid() const { return static_cast<bool>(m_index); }
    const std::string& id() const { return m_id; }

    void release();

private:
    friend class TrackCache;
    struct Index;

    CacheHandle(std::shared_ptr<Index> index, std::string id, uint64_t generation)
        : m_index(std::move(index)), m_id(std::move(id)), m_generation(generation) {}

    std::shared_ptr<Index> m_index;
    std::string m_id;
    uint64_t m_generation = 0;
};

class TrackCache {
public:
    /**
     * @param directory Where blobs are stored (created by open())
     * @param capacityBytes Byte budget for all entries
     * @param maxEntries Entry-count cap, 0 = unlimited
     */
    TrackCache(std::filesystem::path directory, uint64_t capacityBytes,
               size_t maxEntries = 0);

    // Non-copyable
    TrackCache(const TrackCache&) = delete;
    TrackCache& operator=(const TrackCache&) = delete;

    /**
     * @brief Create the directory and index blobs left by a previous run
     */
    Status open();

    /**
     * @brief Store audio for id, evicting LRU entries to make room
     * @param pinOut If non-null, receives a pin taken atomically with the insert
     * @return CACHE_IO_FAILURE if the blob could not be written
     */
    Status put(const std::string& id, const std::vector<uint8_t>& bytes,
               AudioEncoding encoding, CacheHandle* pinOut = nullptr);

    /**
     * @brief Read a cached entry and mark it most recently used
     * @return std::nullopt if absent or unreadable (unreadable entries are dropped)
     */
    std::optional<CachedAudio> get(const std::string& id);

    // Pin an entry if present; invalid handle otherwise
    CacheHandle pin(const std::string& id);

    bool contains(const std::string& id) const;
    void remove(const std::string& id);
    void evictIfNeeded();

    uint64_t totalBytes() const;
    size_t entryCount() const;
    uint64_t capacityBytes() const { return m_capacityBytes; }
    const std::filesystem::path& directory() const { return m_directory; }

    // Blob file name for an id (reversible percent-encoding + extension)
    static std::string fileNameFor(const std::string& id, AudioEncoding encoding);
    static std::optional<std::string> idFromFileName(const std::string& fileName);

private:
    using Index = CacheHandle::Index;

    // Evict LRU unpinned entries (never `keep`) until `incoming` more bytes
    // fit. Caller holds the index mutex.
    void evictLocked(uint64_t incoming, const std::string& keep);

    std::filesystem::path m_directory;
    uint64_t m_capacityBytes;
    size_t m_maxEntries;
    std::shared_ptr<Index> m_index;
    std::atomic<uint64_t> m_tempCounter{0};
};

#endif // STATIONPLAY_TRACK_CACHE_H
