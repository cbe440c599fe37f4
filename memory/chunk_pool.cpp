#include "chunk_pool.hpp"

#include <algorithm>
#include <cstdlib>
#include <new>
#include <utility>

#include "pr.hpp"

namespace bytesutil {

namespace {
    void validate_config(const ChunkPool::Config& config) {
        if (config.chunk_size == 0) {
            throw std::invalid_argument("ChunkPool chunk_size must be greater than 0");
        }
        if (config.max_capacity_bytes < config.chunk_size) {
            throw std::invalid_argument("ChunkPool max_capacity_bytes is smaller than one chunk");
        }
        if (config.preallocate_chunks > config.max_capacity_bytes / config.chunk_size) {
            throw std::invalid_argument("ChunkPool preallocation exceeds max_capacity_bytes");
        }
    }
}

ChunkPool::ChunkPool(const Config& config)
    : config_(config) {
    validate_config(config_);
    if (config_.preallocate_chunks > 0) {
        preallocate(config_.preallocate_chunks);
    }
}

// 析构无法抛异常：借出的 chunk 之后会归还到已释放的池，只能终止进程
ChunkPool::~ChunkPool() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_use_chunks_ != 0) {
        BU_ERROR("ChunkPool destroyed with %zu chunks still in use", in_use_chunks_);
        std::abort();
    }
}

ChunkPool& ChunkPool::default_pool() {
    static ChunkPool instance;  // 静态局部变量，保证只初始化一次
    return instance;
}

// 先在锁外批量创建，再加锁并入空闲链表，减少锁持有时间
void ChunkPool::preallocate(size_t count) {
    std::vector<ChunkPtr> fresh;
    fresh.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        fresh.push_back(std::make_unique<Chunk>(config_.chunk_size));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& c : fresh) {
        idle_.push_back(std::move(c));
    }
    stats_.total_allocations += count;
    BU_DEBUG("Preallocated %zu chunks of %zu bytes", count, config_.chunk_size);
}

// 快路径：从空闲链表取；慢路径：锁外新建后二次校验容量
ChunkPtr ChunkPool::acquire() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!idle_.empty()) {
            ChunkPtr chunk = std::move(idle_.back());
            idle_.pop_back();

            ++in_use_chunks_;
            ++stats_.total_acquires;
            stats_.peak_in_use_chunks = std::max(stats_.peak_in_use_chunks, in_use_chunks_);
            return chunk;
        }

        if ((in_use_chunks_ + 1) * config_.chunk_size > config_.max_capacity_bytes) {
            ++stats_.allocation_failures;
            BU_ERROR("Chunk pool exhausted: %zu chunks in use, limit %zu bytes",
                     in_use_chunks_, config_.max_capacity_bytes);
            throw PoolExhaustedError("Allocation would exceed maximum pool capacity: " +
                                     std::to_string(config_.max_capacity_bytes));
        }
    }

    ChunkPtr chunk;
    try {
        chunk = std::make_unique<Chunk>(config_.chunk_size);
    } catch (const std::bad_alloc&) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++stats_.allocation_failures;
        }
        BU_ERROR("Failed to allocate chunk of %zu bytes", config_.chunk_size);
        throw;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    // 锁外分配期间其他线程可能已借出更多 chunk
    if ((in_use_chunks_ + 1) * config_.chunk_size > config_.max_capacity_bytes) {
        ++stats_.allocation_failures;
        BU_ERROR("Chunk pool exhausted after recheck: %zu chunks in use", in_use_chunks_);
        throw PoolExhaustedError("Allocation would exceed maximum pool capacity (after recheck)");
    }

    ++in_use_chunks_;
    ++stats_.total_allocations;
    ++stats_.total_acquires;
    stats_.peak_in_use_chunks = std::max(stats_.peak_in_use_chunks, in_use_chunks_);
    return chunk;
}

void ChunkPool::release(ChunkPtr chunk) {
    if (!chunk) return;

    // 非本池规格的 chunk 不入池，随 chunk 析构释放
    if (chunk->capacity() != config_.chunk_size) {
        BU_WARN("Dropping chunk of capacity %zu, pool chunk size is %zu",
                chunk->capacity(), config_.chunk_size);
        return;
    }

    chunk->clear();

    ChunkPtr overflow;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.total_releases;
        if (in_use_chunks_ > 0) {
            --in_use_chunks_;
        }

        if (idle_.size() < config_.max_idle_chunks) {
            idle_.push_back(std::move(chunk));
        } else {
            overflow = std::move(chunk);
        }
    }

    // 空闲链表已满，在锁外释放
    if (overflow) {
        BU_DEBUG("Idle list full (%zu), freeing chunk", config_.max_idle_chunks);
    }
}

PoolStats ChunkPool::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    PoolStats s = stats_;
    s.in_use_chunks = in_use_chunks_;
    s.idle_chunks = idle_.size();
    return s;
}

void ChunkPool::clear() {
    std::vector<ChunkPtr> drop;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drop.swap(idle_);
    }
    BU_DEBUG("Cleared %zu idle chunks", drop.size());
}

} // namespace bytesutil
