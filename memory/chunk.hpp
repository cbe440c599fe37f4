#ifndef BYTESUTIL_CHUNK_HPP
#define BYTESUTIL_CHUNK_HPP

#include <cstddef>
#include <memory>

namespace bytesutil {

// 固定容量的内存块：capacity 在构造后不变，[0, used) 为有效数据
class Chunk {
public:
    explicit Chunk(size_t cap);

    // 禁止拷贝和移动：所有权只通过 ChunkPtr 转移，capacity 始终与池规格一致
    Chunk(const Chunk&) = delete;
    Chunk& operator=(const Chunk&) = delete;
    Chunk(Chunk&&) = delete;
    Chunk& operator=(Chunk&&) = delete;

    ~Chunk() = default;

    size_t capacity() const noexcept { return capacity_; }
    size_t used() const noexcept { return used_; }
    size_t available() const noexcept { return capacity_ - used_; }
    bool full() const noexcept { return used_ == capacity_; }
    bool empty() const noexcept { return used_ == 0; }

    const char* data() const noexcept { return data_.get(); }

    // 追加数据，最多写满剩余空间，返回实际写入字节数
    size_t append(const char* src, size_t len) noexcept;

    // 直接写入接口：调用方向 write_ptr() 写入 n 字节后调用 commit(n)
    char* write_ptr() noexcept { return data_.get() + used_; }
    void commit(size_t n);

    // 清空有效数据（不释放内存）
    void clear() noexcept { used_ = 0; }

private:
    const size_t capacity_;
    size_t used_;
    std::unique_ptr<char[]> data_;
};

using ChunkPtr = std::unique_ptr<Chunk>;

} // namespace bytesutil

#endif // BYTESUTIL_CHUNK_HPP
