#include "byte_stream.hpp"

#include <cerrno>
#include <cstring>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unistd.h>

#include "pr.hpp"

namespace bytesutil {

void write_all(ByteSink& sink, const char* data, size_t len) {
    size_t n = sink.write(data, len);
    if (n != len) {
        BU_ERROR("Short write: sink accepted %zu of %zu bytes", n, len);
        throw std::runtime_error("ByteSink short write: " + std::to_string(n) + " of " +
                                 std::to_string(len) + " bytes");
    }
}

size_t copy_stream(ByteSource& source, ByteSink& sink, size_t scratch_size) {
    if (scratch_size == 0) {
        throw std::invalid_argument("copy_stream scratch_size must be greater than 0");
    }

    std::unique_ptr<char[]> scratch(new char[scratch_size]);
    size_t total = 0;
    while (true) {
        size_t n = source.read(scratch.get(), scratch_size);
        if (n == 0) {
            break;
        }
        write_all(sink, scratch.get(), n);
        total += n;
    }
    return total;
}

size_t StringSink::write(const char* data, size_t len) {
    out_.append(data, len);
    return len;
}

size_t OstreamSink::write(const char* data, size_t len) {
    os_.write(data, static_cast<std::streamsize>(len));
    if (!os_) {
        BU_ERROR("Output stream failed after writing %zu bytes", len);
        throw std::ios_base::failure("OstreamSink write failed");
    }
    return len;
}

size_t FdSink::write(const char* data, size_t len) {
    if (fd_ < 0) {
        BU_ERROR("Invalid fd: %d", fd_);
        throw std::system_error(EBADF, std::generic_category(), "FdSink write");
    }

    size_t written = 0;
    while (written < len) {
        ssize_t n = ::write(fd_, data + written, len - written);
        if (n > 0) {
            written += static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }

        int err = (n == 0) ? EIO : errno;
        BU_ERROR("Write failed on fd %d after %zu of %zu bytes: %s",
                 fd_, written, len, strerror(err));
        throw std::system_error(err, std::generic_category(), "FdSink write");
    }
    return written;
}

} // namespace bytesutil
