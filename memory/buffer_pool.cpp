#include "buffer_pool.hpp"

#include <stdexcept>
#include <utility>

#include "pr.hpp"

namespace bytesutil {

BufferPool::BufferPool(ChunkPool& chunks, const Config& config)
    : chunks_(chunks)
    , config_(config) {
}

BufferPool& BufferPool::default_pool() {
    static BufferPool instance(ChunkPool::default_pool());
    return instance;
}

BufferPtr BufferPool::acquire() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!idle_.empty()) {
            BufferPtr buffer = std::move(idle_.back());
            idle_.pop_back();
            ++stats_.total_acquires;
            return buffer;
        }
    }

    BufferPtr buffer = std::make_unique<ChunkedBuffer>(chunks_);

    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.created;
    ++stats_.total_acquires;
    return buffer;
}

void BufferPool::release(BufferPtr&& buffer) {
    if (!buffer) return;

    if (&buffer->pool() != &chunks_) {
        BU_ERROR("Buffer belongs to a different chunk pool");
        throw std::invalid_argument("BufferPool::release buffer from a different ChunkPool");
    }

    // reset 抛异常时 buffer 未被移走，所有权留在调用方
    buffer->reset();

    BufferPtr owned = std::move(buffer);
    BufferPtr overflow;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.total_releases;
        if (idle_.size() < config_.max_idle_buffers) {
            idle_.push_back(std::move(owned));
        } else {
            overflow = std::move(owned);
        }
    }

    if (overflow) {
        BU_DEBUG("Idle buffer list full (%zu), dropping buffer", config_.max_idle_buffers);
    }
}

BufferPoolStats BufferPool::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    BufferPoolStats s = stats_;
    s.idle_buffers = idle_.size();
    return s;
}

} // namespace bytesutil
