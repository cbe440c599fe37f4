#ifndef BYTESUTIL_BUFFER_POOL_HPP
#define BYTESUTIL_BUFFER_POOL_HPP

#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

#include "chunk_pool.hpp"
#include "chunked_buffer.hpp"

namespace bytesutil {

struct BufferPoolStats {
    size_t created = 0;          // 新建 buffer 次数
    size_t total_acquires = 0;
    size_t total_releases = 0;
    size_t idle_buffers = 0;
};

using BufferPtr = std::unique_ptr<ChunkedBuffer>;

// ChunkedBuffer 回收池，所有 buffer 共用同一个 ChunkPool。
// release 自行 reset buffer，调用方无需先 reset；
// 在池外丢弃 buffer 时由其析构归还 chunk。
class BufferPool {
public:
    struct Config {
        size_t max_idle_buffers = 256;
    };

    explicit BufferPool(ChunkPool& chunks) : BufferPool(chunks, Config()) {}
    BufferPool(ChunkPool& chunks, const Config& config);
    ~BufferPool() = default;

    BufferPool(const BufferPool&) = delete;
    BufferPool& operator=(const BufferPool&) = delete;

    // 使用 ChunkPool::default_pool() 的进程级实例
    static BufferPool& default_pool();

    // 返回空 buffer（复用或新建）
    BufferPtr acquire();

    // 先 reset 再入池。reset 失败（仍有 reader）时抛 BufferInUseError，
    // buffer 仍归调用方所有；属于其他 ChunkPool 的 buffer 抛 std::invalid_argument。
    void release(BufferPtr&& buffer);

    ChunkPool& chunk_pool() const noexcept { return chunks_; }
    BufferPoolStats stats() const;

private:
    ChunkPool& chunks_;
    const Config config_;
    std::vector<BufferPtr> idle_;
    mutable std::mutex mutex_;
    BufferPoolStats stats_;
};

} // namespace bytesutil

#endif // BYTESUTIL_BUFFER_POOL_HPP
