#ifndef BYTESUTIL_CHUNK_POOL_HPP
#define BYTESUTIL_CHUNK_POOL_HPP

#include <cstddef>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "chunk.hpp"

namespace bytesutil {

// 内存池耗尽错误：使用中的字节数将超过配置的最大容量
class PoolExhaustedError : public std::runtime_error {
public:
    explicit PoolExhaustedError(const std::string& msg)
        : std::runtime_error(msg) {}
};

// 默认块大小 4K
constexpr size_t DEFAULT_CHUNK_SIZE = 4096;

// 内存池统计信息
struct PoolStats {
    size_t total_allocations = 0;      // 新建 chunk 次数（池未命中）
    size_t total_acquires = 0;         // acquire 成功次数
    size_t total_releases = 0;         // release 次数（不含空指针）
    size_t allocation_failures = 0;    // 分配失败次数（容量超限或系统内存不足）
    size_t in_use_chunks = 0;          // 当前借出的 chunk 数
    size_t idle_chunks = 0;            // 当前空闲的 chunk 数
    size_t peak_in_use_chunks = 0;     // 借出数量峰值
};

// 固定规格的 chunk 回收池，acquire/release 可在多线程中并发调用。
// acquire 返回独占的 ChunkPtr，release 通过移动取回所有权，
// 调用方在 release 之后不再持有该 chunk。
class ChunkPool {
public:
    struct Config {
        size_t chunk_size = DEFAULT_CHUNK_SIZE;         // 每个 chunk 的容量 C
        size_t max_capacity_bytes = 128 * 1024 * 1024;  // 借出字节数上限（默认 128MB）
        size_t max_idle_chunks = 1024;                  // 空闲链表上限，超出的 chunk 直接释放
        size_t preallocate_chunks = 0;                  // 构造时预分配的 chunk 数
    };

    ChunkPool() : ChunkPool(Config()) {}
    explicit ChunkPool(const Config& config);
    ~ChunkPool();

    ChunkPool(const ChunkPool&) = delete;
    ChunkPool& operator=(const ChunkPool&) = delete;
    ChunkPool(ChunkPool&&) = delete;
    ChunkPool& operator=(ChunkPool&&) = delete;

    // 进程级默认池（默认配置），首次调用时创建
    static ChunkPool& default_pool();

    // 取出一个 used == 0 的 chunk；空闲链表为空时新建
    ChunkPtr acquire();

    // 归还 chunk；空指针忽略
    void release(ChunkPtr chunk);

    size_t chunk_size() const noexcept { return config_.chunk_size; }
    const Config& config() const noexcept { return config_; }

    PoolStats stats() const;

    // 释放所有空闲 chunk（借出中的不受影响）
    void clear();

private:
    void preallocate(size_t count);

    const Config config_;
    std::vector<ChunkPtr> idle_;
    mutable std::mutex mutex_;
    size_t in_use_chunks_ = 0;
    PoolStats stats_;
};

} // namespace bytesutil

#endif // BYTESUTIL_CHUNK_POOL_HPP
