#include "chunk.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>

#include "pr.hpp"

namespace bytesutil {

// 创建指定容量的内存块，内容不做零初始化（只有 [0, used) 可读）
Chunk::Chunk(size_t cap)
    : capacity_(cap)
    , used_(0)
    , data_(new char[cap]) {
    if (cap == 0) {
        throw std::invalid_argument("Chunk capacity must be greater than 0");
    }
}

size_t Chunk::append(const char* src, size_t len) noexcept {
    size_t n = std::min(len, capacity_ - used_);
    if (n > 0) {
        std::memcpy(data_.get() + used_, src, n);
        used_ += n;
    }
    return n;
}

void Chunk::commit(size_t n) {
    if (n > capacity_ - used_) {
        BU_ERROR("Commit of %zu bytes exceeds available space %zu", n, capacity_ - used_);
        throw std::out_of_range("Chunk commit exceeds capacity: " + std::to_string(n));
    }
    used_ += n;
}

} // namespace bytesutil
