/**
 * @file cache.cpp
 * @brief Recognition result cache keyed by image content hash
 */

#include "cache.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace platerec {

namespace {

struct DigestChunk {
    const uint8_t* data;
    size_t size;
};

std::string sha256_hex(const std::vector<DigestChunk>& chunks)
{
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1;
    for (const DigestChunk& chunk : chunks) {
        ok = ok && EVP_DigestUpdate(ctx, chunk.data, chunk.size) == 1;
    }
    ok = ok && EVP_DigestFinal_ex(ctx, digest, &digest_len) == 1;
    EVP_MD_CTX_free(ctx);

    if (!ok) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digest_len; ++i) {
        oss << std::setw(2) << static_cast<unsigned int>(digest[i]);
    }
    return oss.str();
}

} // anonymous namespace

std::string compute_sha256_hex(const uint8_t* data, size_t size)
{
    return sha256_hex({DigestChunk{data, size}});
}

std::string compute_image_hash(const CapturedImage& image)
{
    // Little-endian width and height precede the pixels
    uint8_t dims[8];
    for (int i = 0; i < 4; ++i) {
        dims[i] = static_cast<uint8_t>(image.width >> (8 * i));
        dims[4 + i] = static_cast<uint8_t>(image.height >> (8 * i));
    }

    return sha256_hex({DigestChunk{dims, sizeof(dims)},
                       DigestChunk{image.data(), image.byte_count()}});
}

RecognitionCache::RecognitionCache(const CacheConfig& config, const Clock* clock)
    : config_(config)
    , clock_(clock ? *clock : Clock::steady())
    , hits_(0)
    , misses_(0)
{
}

bool RecognitionCache::get(const std::string& key, PlateResult& result)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = index_.find(key);
    if (it == index_.end()) {
        misses_++;
        return false;
    }

    if (clock_.now_ms() > it->second->expires_at_ms) {
        erase_locked(it);
        misses_++;
        return false;
    }

    hits_++;
    result = it->second->result;
    return true;
}

void RecognitionCache::set(const std::string& key, const PlateResult& result)
{
    std::lock_guard<std::mutex> lock(mutex_);
    const int64_t now = clock_.now_ms();

    // Upsert: a replaced entry is re-inserted as the newest
    auto it = index_.find(key);
    if (it != index_.end()) {
        erase_locked(it);
    }

    while (!entries_.empty() && entries_.size() >= config_.max_entries) {
        index_.erase(entries_.front().key);
        entries_.pop_front();
    }

    CacheEntry entry;
    entry.key = key;
    entry.result = result;
    entry.created_at_ms = now;
    entry.expires_at_ms = now + config_.ttl_ms;

    entries_.push_back(entry);
    index_[key] = std::prev(entries_.end());
}

bool RecognitionCache::remove(const std::string& key)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = index_.find(key);
    if (it == index_.end()) {
        return false;
    }
    erase_locked(it);
    return true;
}

void RecognitionCache::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    index_.clear();
    hits_ = 0;
    misses_ = 0;
}

bool RecognitionCache::contains(const std::string& key) const
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = index_.find(key);
    return it != index_.end() && clock_.now_ms() <= it->second->expires_at_ms;
}

size_t RecognitionCache::cleanup()
{
    std::lock_guard<std::mutex> lock(mutex_);
    const int64_t now = clock_.now_ms();
    size_t removed = 0;

    for (auto it = entries_.begin(); it != entries_.end(); ) {
        if (now > it->expires_at_ms) {
            index_.erase(it->key);
            it = entries_.erase(it);
            removed++;
        }
        else {
            ++it;
        }
    }

    return removed;
}

CacheStats RecognitionCache::stats() const
{
    std::lock_guard<std::mutex> lock(mutex_);

    CacheStats s;
    s.hits = hits_;
    s.misses = misses_;
    s.size = entries_.size();

    const uint64_t total = hits_ + misses_;
    s.hit_rate = total > 0 ? static_cast<double>(hits_) / total : 0.0;
    return s;
}

size_t RecognitionCache::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void RecognitionCache::erase_locked(std::unordered_map<std::string, EntryList::iterator>::iterator it)
{
    entries_.erase(it->second);
    index_.erase(it);
}

} // namespace platerec
