#include "chunked_buffer.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <utility>

#include <limits.h>
#include <sys/uio.h>
#include <unistd.h>

#include "pr.hpp"

namespace bytesutil {

namespace {
    constexpr size_t MAX_IOVECS = IOV_MAX;
}

ChunkedBuffer::ChunkedBuffer()
    : ChunkedBuffer(ChunkPool::default_pool()) {
}

ChunkedBuffer::ChunkedBuffer(ChunkPool& pool)
    : pool_(&pool) {
}

// 析构无法抛异常：reader 仍在使用 chunk 时只能终止进程
ChunkedBuffer::~ChunkedBuffer() {
    size_t readers = open_readers_.load(std::memory_order_acquire);
    if (readers != 0) {
        BU_ERROR("ChunkedBuffer destroyed with %zu open readers", readers);
        std::abort();
    }
    for (auto& chunk : chunks_) {
        pool_->release(std::move(chunk));
    }
}

// 取新 chunk 并追加到序列尾部；push_back 失败时把 chunk 还给池
Chunk& ChunkedBuffer::append_chunk() {
    ChunkPtr chunk = pool_->acquire();
    try {
        chunks_.push_back(std::move(chunk));
    } catch (const std::bad_alloc&) {
        pool_->release(std::move(chunk));
        BU_ERROR("Failed to grow chunk list beyond %zu entries", chunks_.size());
        throw;
    }
    return *chunks_.back();
}

size_t ChunkedBuffer::write(const char* data, size_t len) {
    if (len == 0) {
        return 0;
    }
    if (data == nullptr) {
        BU_ERROR("Null data pointer with length %zu", len);
        throw std::invalid_argument("ChunkedBuffer::write null data");
    }

    const char* src = data;
    size_t remaining = len;
    while (remaining > 0) {
        Chunk* tail = chunks_.empty() ? nullptr : chunks_.back().get();
        if (tail == nullptr || tail->full()) {
            tail = &append_chunk();
        }

        size_t n = tail->append(src, remaining);
        src += n;
        remaining -= n;
        length_ += n;
    }
    return len;
}

const Chunk& ChunkedBuffer::chunk(size_t index) const {
    if (index >= chunks_.size()) {
        throw std::out_of_range("Chunk index " + std::to_string(index) +
                                " out of range, chunk count " + std::to_string(chunks_.size()));
    }
    return *chunks_[index];
}

StreamingReader ChunkedBuffer::open_reader() const {
    return StreamingReader(this);
}

void ChunkedBuffer::reset() {
    size_t readers = open_readers_.load(std::memory_order_acquire);
    if (readers != 0) {
        BU_ERROR("Reset with %zu open readers", readers);
        throw BufferInUseError("ChunkedBuffer reset while " + std::to_string(readers) +
                               " reader(s) are open");
    }

    if (chunks_.empty()) {
        return;
    }

    size_t released = chunks_.size();
    for (auto& chunk : chunks_) {
        pool_->release(std::move(chunk));
    }
    chunks_.clear();
    length_ = 0;
    BU_DEBUG("Buffer reset, %zu chunks returned to pool", released);
}

size_t ChunkedBuffer::copy_to(ByteSink& sink) const {
    size_t total = 0;
    for (const auto& chunk : chunks_) {
        write_all(sink, chunk->data(), chunk->used());
        total += chunk->used();
    }
    return total;
}

void ChunkedBuffer::read_at(char* dst, size_t len, size_t offset) const {
    if (offset > length_ || len > length_ - offset) {
        BU_ERROR("read_at(len=%zu, offset=%zu) beyond length %zu", len, offset, length_);
        throw std::out_of_range("ChunkedBuffer::read_at beyond buffer length " +
                                std::to_string(length_));
    }

    // 除最后一个外每个 chunk 都满，可直接由偏移定位
    const size_t cs = chunk_size();
    size_t index = offset / cs;
    size_t in_chunk = offset % cs;
    while (len > 0) {
        const Chunk& c = *chunks_[index];
        size_t n = std::min(len, c.used() - in_chunk);
        std::memcpy(dst, c.data() + in_chunk, n);
        dst += n;
        len -= n;
        ++index;
        in_chunk = 0;
    }
}

std::string ChunkedBuffer::to_string() const {
    std::string out;
    out.reserve(length_);
    for (const auto& chunk : chunks_) {
        out.append(chunk->data(), chunk->used());
    }
    return out;
}

ssize_t ChunkedBuffer::write_to_fd(int fd, size_t offset) const {
    if (fd < 0) {
        BU_ERROR("Invalid file descriptor: %d", fd);
        errno = EBADF;
        return -1;
    }
    if (offset > length_) {
        BU_ERROR("write_to_fd offset %zu beyond length %zu", offset, length_);
        throw std::out_of_range("ChunkedBuffer::write_to_fd offset beyond buffer length");
    }
    if (offset == length_) {
        BU_DEBUG("No data to write to fd %d", fd);
        return 0;
    }

    const size_t cs = chunk_size();
    size_t index = offset / cs;
    size_t in_chunk = offset % cs;

    std::vector<iovec> iov;
    iov.reserve(std::min(chunks_.size() - index, MAX_IOVECS));
    for (; index < chunks_.size() && iov.size() < MAX_IOVECS; ++index) {
        const Chunk& c = *chunks_[index];
        iovec v;
        v.iov_base = const_cast<char*>(c.data()) + in_chunk;
        v.iov_len = c.used() - in_chunk;
        iov.push_back(v);
        in_chunk = 0;
    }

    ssize_t n = 0;
    do {
        n = ::writev(fd, iov.data(), static_cast<int>(iov.size()));
    } while (n == -1 && errno == EINTR);

    if (n >= 0) {
        BU_DEBUG("Wrote %zd bytes to fd %d from offset %zu", n, fd, offset);
        return n;
    }

    int err = errno;
    if (err == EAGAIN || err == EWOULDBLOCK) {
        BU_DEBUG("Write would block on fd %d", fd);
        return 0;
    }
    BU_ERROR("Write failed on fd %d: %s", fd, strerror(err));
    errno = err;
    return -1;
}

ssize_t ChunkedBuffer::read_from_fd(int fd) {
    if (fd < 0) {
        BU_ERROR("Invalid fd: %d", fd);
        errno = EBADF;
        return -1;
    }

    bool fresh = chunks_.empty() || chunks_.back()->full();
    Chunk& tail = fresh ? append_chunk() : *chunks_.back();

    ssize_t n = 0;
    do {
        n = ::read(fd, tail.write_ptr(), tail.available());
    } while (n == -1 && errno == EINTR);

    if (n > 0) {
        tail.commit(static_cast<size_t>(n));
        length_ += static_cast<size_t>(n);
        return n;
    }

    int err = errno;
    // 不保留空 chunk
    if (fresh) {
        ChunkPtr empty_chunk = std::move(chunks_.back());
        chunks_.pop_back();
        pool_->release(std::move(empty_chunk));
    }

    if (n == 0) {
        BU_DEBUG("EOF on fd %d", fd);
        return 0;
    }
    if (err != EAGAIN && err != EWOULDBLOCK) {
        BU_ERROR("Read failed on fd %d: %s", fd, strerror(err));
    }
    errno = err;
    return -1;
}

} // namespace bytesutil
