#ifndef BYTESUTIL_CHUNKED_BUFFER_HPP
#define BYTESUTIL_CHUNKED_BUFFER_HPP

#include <atomic>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

#include "byte_stream.hpp"
#include "chunk.hpp"
#include "chunk_pool.hpp"
#include "streaming_reader.hpp"

namespace bytesutil {

// 仍有 reader 打开时 reset / 归还 buffer
class BufferInUseError : public std::logic_error {
public:
    explicit BufferInUseError(const std::string& msg)
        : std::logic_error(msg) {}
};

// 只追加的逻辑字节流，由 ChunkPool 提供的定长 chunk 顺序组成。
// 写入结束后除最后一个 chunk 外都是满的，length() == 各 chunk used 之和。
// 单一写者；不可拷贝也不可移动（reader 持有其地址）。
class ChunkedBuffer : public ByteSink {
public:
    ChunkedBuffer();
    explicit ChunkedBuffer(ChunkPool& pool);
    ~ChunkedBuffer() override;

    ChunkedBuffer(const ChunkedBuffer&) = delete;
    ChunkedBuffer& operator=(const ChunkedBuffer&) = delete;
    ChunkedBuffer(ChunkedBuffer&&) = delete;
    ChunkedBuffer& operator=(ChunkedBuffer&&) = delete;

    // 追加 len 字节，必要时从池中取新 chunk；返回 len。
    // 池耗尽或内存不足时异常向上传播，已写入的部分保留。
    size_t write(const char* data, size_t len) override;
    size_t write(std::string_view data) { return write(data.data(), data.size()); }

    size_t length() const noexcept { return length_; }
    size_t chunk_count() const noexcept { return chunks_.size(); }
    bool empty() const noexcept { return length_ == 0; }

    // 占用的内存（按 chunk 容量计）
    size_t size_bytes() const noexcept { return chunks_.size() * pool_->chunk_size(); }
    size_t chunk_size() const noexcept { return pool_->chunk_size(); }
    ChunkPool& pool() const noexcept { return *pool_; }

    const Chunk& chunk(size_t index) const;

    size_t open_reader_count() const noexcept {
        return open_readers_.load(std::memory_order_acquire);
    }

    // 从头开始的 reader，快照当前内容
    StreamingReader open_reader() const;

    // 归还所有 chunk 并清零；有 reader 打开时抛 BufferInUseError 且不做任何修改
    void reset();

    // 按 chunk 顺序把全部内容写入 sink，返回写出的字节数
    size_t copy_to(ByteSink& sink) const;

    // 从逻辑偏移 offset 处拷贝 len 字节，越界抛 std::out_of_range
    void read_at(char* dst, size_t len, size_t offset) const;

    std::string to_string() const;

    // 以一次 writev 写出 offset 之后的数据。
    // 返回写出字节数；EAGAIN 返回 0；其他错误返回 -1 并保留 errno
    ssize_t write_to_fd(int fd, size_t offset = 0) const;

    // 一次 read 读入最后一个 chunk 的剩余空间（满了则先取新 chunk）。
    // 返回读入字节数；EOF 返回 0；出错（含 EAGAIN）返回 -1 并保留 errno
    ssize_t read_from_fd(int fd);

private:
    friend class StreamingReader;

    Chunk& append_chunk();

    ChunkPool* pool_;
    std::vector<ChunkPtr> chunks_;
    size_t length_ = 0;
    mutable std::atomic<size_t> open_readers_{0};
};

} // namespace bytesutil

#endif // BYTESUTIL_CHUNKED_BUFFER_HPP
