#ifndef BYTESUTIL_BYTE_STREAM_HPP
#define BYTESUTIL_BYTE_STREAM_HPP

#include <cstddef>
#include <iosfwd>
#include <string>

namespace bytesutil {

// 顺序字节源：read 返回 0 表示流结束
class ByteSource {
public:
    virtual ~ByteSource() = default;
    virtual size_t read(char* dst, size_t len) = 0;
};

// 字节汇：write 必须写完全部 len 字节，否则抛异常
class ByteSink {
public:
    virtual ~ByteSink() = default;
    virtual size_t write(const char* data, size_t len) = 0;
};

// 写入并校验 sink 返回的字节数，短写时抛 std::runtime_error
void write_all(ByteSink& sink, const char* data, size_t len);

// 将 source 读尽写入 sink，返回搬运的总字节数
size_t copy_stream(ByteSource& source, ByteSink& sink, size_t scratch_size = 4096);

class StringSink : public ByteSink {
public:
    explicit StringSink(std::string& out) : out_(out) {}
    size_t write(const char* data, size_t len) override;

private:
    std::string& out_;
};

class OstreamSink : public ByteSink {
public:
    explicit OstreamSink(std::ostream& os) : os_(os) {}
    size_t write(const char* data, size_t len) override;

private:
    std::ostream& os_;
};

// 阻塞 fd 写入，遇到 EINTR 重试，其他错误抛 std::system_error
class FdSink : public ByteSink {
public:
    explicit FdSink(int fd) : fd_(fd) {}
    size_t write(const char* data, size_t len) override;

    int fd() const { return fd_; }

private:
    int fd_;
};

} // namespace bytesutil

#endif // BYTESUTIL_BYTE_STREAM_HPP
