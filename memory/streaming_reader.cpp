#include "streaming_reader.hpp"

#include <algorithm>
#include <cstring>
#include <utility>

#include "chunked_buffer.hpp"
#include "pr.hpp"

namespace bytesutil {

StreamingReader::StreamingReader(const ChunkedBuffer* buffer)
    : buffer_(buffer)
    , snapshot_chunks_(buffer->chunks_.size())
    , snapshot_last_used_(buffer->chunks_.empty() ? 0 : buffer->chunks_.back()->used())
    , snapshot_length_(buffer->length_) {
    buffer_->open_readers_.fetch_add(1, std::memory_order_acq_rel);
}

StreamingReader::~StreamingReader() {
    close();
}

StreamingReader::StreamingReader(StreamingReader&& other) noexcept
    : buffer_(other.buffer_)
    , chunk_index_(other.chunk_index_)
    , offset_(other.offset_)
    , position_(other.position_)
    , snapshot_chunks_(other.snapshot_chunks_)
    , snapshot_last_used_(other.snapshot_last_used_)
    , snapshot_length_(other.snapshot_length_) {
    // 登记计数随所有权一起转移，源对象不再持有 buffer
    other.buffer_ = nullptr;
    other.close();
}

StreamingReader& StreamingReader::operator=(StreamingReader&& other) noexcept {
    if (this != &other) {
        close();

        buffer_ = other.buffer_;
        chunk_index_ = other.chunk_index_;
        offset_ = other.offset_;
        position_ = other.position_;
        snapshot_chunks_ = other.snapshot_chunks_;
        snapshot_last_used_ = other.snapshot_last_used_;
        snapshot_length_ = other.snapshot_length_;

        other.buffer_ = nullptr;
        other.close();
    }
    return *this;
}

void StreamingReader::close() noexcept {
    if (buffer_ != nullptr) {
        buffer_->open_readers_.fetch_sub(1, std::memory_order_acq_rel);
        buffer_ = nullptr;
    }
    chunk_index_ = 0;
    offset_ = 0;
    position_ = 0;
    snapshot_chunks_ = 0;
    snapshot_last_used_ = 0;
    snapshot_length_ = 0;
}

// 快照内除最后一个 chunk 外都是满的
size_t StreamingReader::chunk_limit(size_t index) const noexcept {
    if (index + 1 == snapshot_chunks_) {
        return snapshot_last_used_;
    }
    return buffer_->chunks_[index]->capacity();
}

void StreamingReader::advance(size_t n) noexcept {
    offset_ += n;
    position_ += n;
    while (chunk_index_ < snapshot_chunks_ && offset_ >= chunk_limit(chunk_index_)) {
        ++chunk_index_;
        offset_ = 0;
    }
}

void StreamingReader::ensure_open(const char* op) const {
    if (buffer_ == nullptr) {
        BU_ERROR("%s on closed StreamingReader", op);
        throw ReaderClosedError(std::string(op) + " on closed StreamingReader");
    }
}

size_t StreamingReader::read(char* dst, size_t len) {
    ensure_open("read");

    size_t copied = 0;
    while (copied < len && chunk_index_ < snapshot_chunks_) {
        const Chunk& chunk = *buffer_->chunks_[chunk_index_];
        size_t n = std::min(len - copied, chunk_limit(chunk_index_) - offset_);
        std::memcpy(dst + copied, chunk.data() + offset_, n);
        copied += n;
        advance(n);
    }
    return copied;
}

std::string_view StreamingReader::next_segment() {
    ensure_open("next_segment");

    if (chunk_index_ >= snapshot_chunks_) {
        return std::string_view();
    }

    const Chunk& chunk = *buffer_->chunks_[chunk_index_];
    size_t n = chunk_limit(chunk_index_) - offset_;
    std::string_view segment(chunk.data() + offset_, n);
    advance(n);
    return segment;
}

size_t StreamingReader::skip(size_t n) {
    ensure_open("skip");

    size_t skipped = 0;
    while (skipped < n && chunk_index_ < snapshot_chunks_) {
        size_t step = std::min(n - skipped, chunk_limit(chunk_index_) - offset_);
        skipped += step;
        advance(step);
    }
    return skipped;
}

} // namespace bytesutil
