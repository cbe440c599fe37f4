#ifndef BYTESUTIL_STREAMING_READER_HPP
#define BYTESUTIL_STREAMING_READER_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

#include "byte_stream.hpp"

namespace bytesutil {

class ChunkedBuffer;

// 在已关闭（或被移动走）的 reader 上读取
class ReaderClosedError : public std::logic_error {
public:
    explicit ReaderClosedError(const std::string& msg)
        : std::logic_error(msg) {}
};

// ChunkedBuffer 上的顺序读游标，不拷贝 chunk 内容到新的连续内存。
//
// 打开时记录快照（chunk 数量与最后一个 chunk 的 used），之后对 buffer 的
// 写入对本 reader 不可见。reader 存在期间 buffer 拒绝 reset，
// 因此 reader 不能比 buffer 活得更久；析构或 close() 时解除登记。
//
// 状态：Reading(chunk_index, offset) -> Exhausted(chunk_index == 快照 chunk 数)，
// close() 之后为 Closed。
class StreamingReader : public ByteSource {
public:
    // 默认构造得到已关闭的 reader
    StreamingReader() = default;
    ~StreamingReader() override;

    StreamingReader(StreamingReader&& other) noexcept;
    StreamingReader& operator=(StreamingReader&& other) noexcept;

    StreamingReader(const StreamingReader&) = delete;
    StreamingReader& operator=(const StreamingReader&) = delete;

    // 拷贝最多 len 字节到 dst，可跨 chunk；流结束返回 0
    size_t read(char* dst, size_t len) override;

    // 零拷贝：返回游标处最长的连续片段并越过它，流结束返回空视图。
    // 视图在 buffer reset 之前有效。
    std::string_view next_segment();

    // 跳过最多 n 字节，返回实际跳过的字节数
    size_t skip(size_t n);

    size_t position() const noexcept { return position_; }
    size_t size() const noexcept { return snapshot_length_; }
    size_t remaining() const noexcept { return snapshot_length_ - position_; }
    bool exhausted() const noexcept { return buffer_ == nullptr || chunk_index_ >= snapshot_chunks_; }
    bool is_open() const noexcept { return buffer_ != nullptr; }

    // 解除与 buffer 的关联，可重复调用
    void close() noexcept;

private:
    friend class ChunkedBuffer;
    explicit StreamingReader(const ChunkedBuffer* buffer);

    size_t chunk_limit(size_t index) const noexcept;
    void advance(size_t n) noexcept;
    void ensure_open(const char* op) const;

    const ChunkedBuffer* buffer_ = nullptr;
    size_t chunk_index_ = 0;
    size_t offset_ = 0;
    size_t position_ = 0;
    size_t snapshot_chunks_ = 0;
    size_t snapshot_last_used_ = 0;
    size_t snapshot_length_ = 0;
};

} // namespace bytesutil

#endif // BYTESUTIL_STREAMING_READER_HPP
