/**
 * @file TrackCache.cpp
 * @brief On-disk track audio cache implementation
 */

#include "TrackCache.h"
#include "LogLevel.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

struct CacheHandle::Index {
    struct Entry {
        fs::path path;
        AudioEncoding encoding = AudioEncoding::UNKNOWN;
        uint64_t size = 0;
        Clock::time_point lastAccess;
        uint64_t accessSeq = 0;     // Monotonic LRU ordering
        uint64_t generation = 0;    // Distinguishes a re-stored id from the dropped entry
        int pins = 0;
    };

    std::mutex mutex;
    std::unordered_map<std::string, Entry> entries;
    uint64_t totalBytes = 0;
    uint64_t nextSeq = 1;
    uint64_t nextGeneration = 1;

    void touch(Entry& entry) {
        entry.lastAccess = Clock::now();
        entry.accessSeq = nextSeq++;
    }

    // Caller holds the mutex. A pin on an entry that was since dropped is a no-op.
    void unpinLocked(const std::string& id, uint64_t generation) {
        auto it = entries.find(id);
        if (it != entries.end() && it->second.generation == generation &&
            it->second.pins > 0) {
            it->second.pins--;
        }
    }

    void unpin(const std::string& id, uint64_t generation) {
        std::lock_guard<std::mutex> lock(mutex);
        unpinLocked(id, generation);
    }
};

// ============================================
// CacheHandle
// ============================================

CacheHandle::~CacheHandle() {
    release();
}

CacheHandle::CacheHandle(CacheHandle&& other) noexcept
    : m_index(std::move(other.m_index))
    , m_id(std::move(other.m_id))
    , m_generation(other.m_generation)
{
    other.m_index.reset();
}

CacheHandle& CacheHandle::operator=(CacheHandle&& other) noexcept {
    if (this != &other) {
        release();
        m_index = std::move(other.m_index);
        m_id = std::move(other.m_id);
        m_generation = other.m_generation;
        other.m_index.reset();
    }
    return *this;
}

void CacheHandle::release() {
    if (m_index) {
        m_index->unpin(m_id, m_generation);
        m_index.reset();
    }
}

// ============================================
// File naming
// ============================================

std::string TrackCache::fileNameFor(const std::string& id, AudioEncoding encoding) {
    static const char* hex = "0123456789ABCDEF";
    std::string name;
    name.reserve(id.size() + 8);
    for (unsigned char c : id) {
        if (std::isalnum(c) || c == '-' || c == '_') {
            name += static_cast<char>(c);
        } else {
            name += '%';
            name += hex[c >> 4];
            name += hex[c & 0x0F];
        }
    }
    name += '.';
    name += encodingExtension(encoding);
    return name;
}

std::optional<std::string> TrackCache::idFromFileName(const std::string& fileName) {
    size_t dot = fileName.rfind('.');
    if (dot == std::string::npos || dot == 0) return std::nullopt;

    std::string id;
    for (size_t i = 0; i < dot; i++) {
        char c = fileName[i];
        if (c == '%') {
            if (i + 2 >= dot) return std::nullopt;
            if (!std::isxdigit(static_cast<unsigned char>(fileName[i + 1])) ||
                !std::isxdigit(static_cast<unsigned char>(fileName[i + 2]))) {
                return std::nullopt;
            }
            id += static_cast<char>(std::stoi(fileName.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            id += c;
        }
    }
    return id;
}

// ============================================
// Constructor / open
// ============================================

TrackCache::TrackCache(fs::path directory, uint64_t capacityBytes, size_t maxEntries)
    : m_directory(std::move(directory))
    , m_capacityBytes(capacityBytes)
    , m_maxEntries(maxEntries)
    , m_index(std::make_shared<Index>())
{
}

Status TrackCache::open() {
    std::error_code ec;
    fs::create_directories(m_directory, ec);
    if (ec) {
        return Status::error(ErrorCode::CACHE_IO_FAILURE,
                             "cannot create " + m_directory.string() + ": " + ec.message());
    }

    struct Found {
        std::string id;
        Index::Entry entry;
        fs::file_time_type mtime;
    };
    std::vector<Found> found;

    for (fs::directory_iterator it(m_directory, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        std::string name = it->path().filename().string();

        // Interrupted writes from a previous run
        if (name.size() > 5 && name.compare(name.size() - 5, 5, ".part") == 0) {
            std::error_code rmEc;
            fs::remove(it->path(), rmEc);
            LOG_DEBUG("[Cache] Removed stale partial file " << name);
            continue;
        }

        auto id = idFromFileName(name);
        if (!id) continue;

        Found f;
        f.id = *id;
        f.entry.path = it->path();
        f.entry.encoding = encodingFromExtension(it->path().extension().string());
        f.entry.size = it->file_size(ec);
        f.mtime = it->last_write_time(ec);
        if (ec) {
            ec.clear();
            continue;
        }
        found.push_back(std::move(f));
    }
    if (ec) {
        return Status::error(ErrorCode::CACHE_IO_FAILURE,
                             "cannot scan " + m_directory.string() + ": " + ec.message());
    }

    // Oldest first so LRU order follows modification time
    std::sort(found.begin(), found.end(),
              [](const Found& a, const Found& b) { return a.mtime < b.mtime; });

    {
        std::lock_guard<std::mutex> lock(m_index->mutex);
        m_index->entries.clear();
        m_index->totalBytes = 0;
        for (auto& f : found) {
            m_index->touch(f.entry);
            f.entry.generation = m_index->nextGeneration++;
            m_index->totalBytes += f.entry.size;
            m_index->entries[f.id] = std::move(f.entry);
        }
        evictLocked(0, std::string());
    }

    LOG_INFO("[Cache] " << m_directory.string() << ": " << entryCount() << " entries, "
             << totalBytes() / 1024 << " KiB of " << m_capacityBytes / 1024 << " KiB");
    return Status::success();
}

// ============================================
// put / get
// ============================================

Status TrackCache::put(const std::string& id, const std::vector<uint8_t>& bytes,
                       AudioEncoding encoding, CacheHandle* pinOut) {
    if (id.empty()) {
        return Status::error(ErrorCode::CACHE_IO_FAILURE, "empty track id");
    }

    {
        std::lock_guard<std::mutex> lock(m_index->mutex);
        auto it = m_index->entries.find(id);
        if (it != m_index->entries.end()) {
            // Someone else already stored it; one entry per id
            m_index->touch(it->second);
            if (pinOut) {
                it->second.pins++;
                *pinOut = CacheHandle(m_index, id, it->second.generation);
            }
            return Status::success();
        }
    }

    const fs::path finalPath = m_directory / fileNameFor(id, encoding);
    const fs::path tempPath = m_directory /
        ("." + fileNameFor(id, encoding) + "." + std::to_string(++m_tempCounter) + ".part");

    // Write outside the lock; only the rename is published
    {
        std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Status::error(ErrorCode::CACHE_IO_FAILURE,
                                 "cannot create " + tempPath.string() + ": " + std::strerror(errno));
        }
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            out.close();
            std::error_code rmEc;
            fs::remove(tempPath, rmEc);
            return Status::error(ErrorCode::CACHE_IO_FAILURE,
                                 "write failed for " + tempPath.string());
        }
    }

    std::lock_guard<std::mutex> lock(m_index->mutex);

    auto existing = m_index->entries.find(id);
    if (existing != m_index->entries.end()) {
        // Lost a race with a concurrent put of the same id
        std::error_code rmEc;
        fs::remove(tempPath, rmEc);
        m_index->touch(existing->second);
        if (pinOut) {
            existing->second.pins++;
            *pinOut = CacheHandle(m_index, id, existing->second.generation);
        }
        return Status::success();
    }

    evictLocked(bytes.size(), id);

    std::error_code ec;
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::error_code rmEc;
        fs::remove(tempPath, rmEc);
        return Status::error(ErrorCode::CACHE_IO_FAILURE,
                             "cannot rename into " + finalPath.string() + ": " + ec.message());
    }

    Index::Entry entry;
    entry.path = finalPath;
    entry.encoding = encoding;
    entry.size = bytes.size();
    entry.generation = m_index->nextGeneration++;
    m_index->touch(entry);
    if (pinOut) entry.pins = 1;
    const uint64_t generation = entry.generation;

    m_index->entries[id] = std::move(entry);
    m_index->totalBytes += bytes.size();

    if (m_index->totalBytes > m_capacityBytes) {
        LOG_WARN("[Cache] Over budget (" << m_index->totalBytes << " > " << m_capacityBytes
                 << " bytes): remaining entries are pinned");
    }

    if (pinOut) {
        *pinOut = CacheHandle(m_index, id, generation);
    }

    LOG_DEBUG("[Cache] Stored " << id << " (" << bytes.size() << " bytes, "
              << encodingName(encoding) << ")");
    return Status::success();
}

std::optional<CachedAudio> TrackCache::get(const std::string& id) {
    CachedAudio audio;
    fs::path path;
    uint64_t generation = 0;

    {
        std::lock_guard<std::mutex> lock(m_index->mutex);
        auto it = m_index->entries.find(id);
        if (it == m_index->entries.end()) return std::nullopt;

        m_index->touch(it->second);
        it->second.pins++;  // Held for the duration of the read
        generation = it->second.generation;
        path = it->second.path;
        audio.encoding = it->second.encoding;
    }

    std::ifstream in(path, std::ios::binary);
    bool readOk = false;
    if (in) {
        audio.bytes.assign(std::istreambuf_iterator<char>(in),
                           std::istreambuf_iterator<char>());
        readOk = !in.bad();
    }

    std::lock_guard<std::mutex> lock(m_index->mutex);
    m_index->unpinLocked(id, generation);
    auto it = m_index->entries.find(id);
    if (it == m_index->entries.end() || it->second.generation != generation) {
        // Dropped or replaced while reading; the bytes read are still whole
        return readOk ? std::optional<CachedAudio>(std::move(audio)) : std::nullopt;
    }
    if (!readOk || audio.bytes.size() != it->second.size) {
        // Outstanding handles on this generation become no-ops
        LOG_WARN("[Cache] Unreadable entry " << id << " at " << path.string()
                 << ", dropping it");
        m_index->totalBytes -= it->second.size;
        std::error_code rmEc;
        fs::remove(it->second.path, rmEc);
        m_index->entries.erase(it);
        return std::nullopt;
    }
    return audio;
}

CacheHandle TrackCache::pin(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_index->mutex);
    auto it = m_index->entries.find(id);
    if (it == m_index->entries.end()) return CacheHandle();
    it->second.pins++;
    return CacheHandle(m_index, id, it->second.generation);
}

bool TrackCache::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_index->mutex);
    return m_index->entries.count(id) > 0;
}

void TrackCache::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_index->mutex);
    auto it = m_index->entries.find(id);
    if (it == m_index->entries.end()) return;

    std::error_code ec;
    fs::remove(it->second.path, ec);
    if (ec) {
        LOG_WARN("[Cache] Failed to remove " << it->second.path.string() << ": " << ec.message());
    }
    m_index->totalBytes -= it->second.size;
    m_index->entries.erase(it);
}

void TrackCache::evictIfNeeded() {
    std::lock_guard<std::mutex> lock(m_index->mutex);
    evictLocked(0, std::string());
}

uint64_t TrackCache::totalBytes() const {
    std::lock_guard<std::mutex> lock(m_index->mutex);
    return m_index->totalBytes;
}

size_t TrackCache::entryCount() const {
    std::lock_guard<std::mutex> lock(m_index->mutex);
    return m_index->entries.size();
}

// ============================================
// Eviction
// ============================================

void TrackCache::evictLocked(uint64_t incoming, const std::string& keep) {
    // `keep` names the entry being inserted, whatever its size
    const size_t incomingEntries = keep.empty() ? 0 : 1;

    auto overBudget = [&]() {
        if (m_index->totalBytes + incoming > m_capacityBytes) return true;
        if (m_maxEntries > 0 && m_index->entries.size() + incomingEntries > m_maxEntries) return true;
        return false;
    };

    while (overBudget()) {
        auto victim = m_index->entries.end();
        for (auto it = m_index->entries.begin(); it != m_index->entries.end(); ++it) {
            if (it->second.pins > 0 || it->first == keep) continue;
            if (victim == m_index->entries.end() ||
                it->second.accessSeq < victim->second.accessSeq) {
                victim = it;
            }
        }
        if (victim == m_index->entries.end()) break;  // Everything left is pinned

        std::error_code ec;
        fs::remove(victim->second.path, ec);
        if (ec) {
            LOG_WARN("[Cache] Failed to remove " << victim->second.path.string()
                     << ": " << ec.message());
        }
        LOG_DEBUG("[Cache] Evicted " << victim->first << " (" << victim->second.size << " bytes)");
        m_index->totalBytes -= victim->second.size;
        m_index->entries.erase(victim);
    }
}
