#include <cerrno>
#include <cstring>
#include <iostream>
#include <memory>
#include <random>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include "byte_stream.hpp"
#include "chunk_pool.hpp"
#include "chunked_buffer.hpp"
#include "pr.hpp"
#include "test_manager.hpp"

using namespace bytesutil;
using bytesutil::test::TestManager;

namespace {

ChunkPool::Config small_chunks(size_t size) {
    ChunkPool::Config cfg;
    cfg.chunk_size = size;
    return cfg;
}

std::string random_bytes(std::mt19937& rng, size_t n) {
    std::uniform_int_distribution<int> byte(0, 255);
    std::string s(n, '\0');
    for (auto& ch : s) ch = static_cast<char>(byte(rng));
    return s;
}

// 除最后一个外每个 chunk 都满
bool chunks_filled(const ChunkedBuffer& buf) {
    for (size_t i = 0; i + 1 < buf.chunk_count(); ++i) {
        if (buf.chunk(i).used() != buf.chunk_size()) return false;
    }
    return true;
}

size_t sum_used(const ChunkedBuffer& buf) {
    size_t total = 0;
    for (size_t i = 0; i < buf.chunk_count(); ++i) total += buf.chunk(i).used();
    return total;
}

// 只接收一半字节且不抛异常的 sink
class HalfSink : public ByteSink {
public:
    size_t write(const char*, size_t len) override { return len / 2; }
};

} // namespace

void boundary_scenario_test(TestManager& tm) {
    ChunkPool pool(small_chunks(4));
    ChunkedBuffer buf(pool);

    tm.verify_eq(buf.write("AB"), size_t{2}, "写入 AB");
    tm.verify_eq(buf.write("CDEF"), size_t{4}, "写入 CDEF");
    tm.verify_eq(buf.write("G"), size_t{1}, "写入 G");

    tm.verify_eq(buf.chunk_count(), size_t{2}, "共 2 个 chunk");
    tm.verify_eq(std::string(buf.chunk(0).data(), buf.chunk(0).used()), std::string("ABCD"), "chunk0 = ABCD");
    tm.verify_eq(buf.chunk(0).used(), size_t{4}, "chunk0 used = 4");
    tm.verify_eq(std::string(buf.chunk(1).data(), buf.chunk(1).used()), std::string("EFG"), "chunk1 = EFG");
    tm.verify_eq(buf.chunk(1).used(), size_t{3}, "chunk1 used = 3");

    StreamingReader reader = buf.open_reader();
    char dst[10];
    size_t n = reader.read(dst, sizeof(dst));
    tm.verify_eq(n, size_t{7}, "一次 read 跨 chunk 读到 7 字节");
    tm.verify_eq(std::string(dst, n), std::string("ABCDEFG"), "内容为 ABCDEFG");
    tm.verify_eq(reader.read(dst, sizeof(dst)), size_t{0}, "之后返回 0");
    reader.close();

    tm.verify_eq(buf.size_bytes(), size_t{8}, "占用 2 个 chunk 的内存");
    tm.verify_throws<std::out_of_range>([&] { buf.chunk(2); }, "越界 chunk 下标抛异常");
}

void length_and_fill_invariant_test(TestManager& tm) {
    std::mt19937 rng(42);
    std::uniform_int_distribution<size_t> len_dist(0, 70);

    ChunkPool pool(small_chunks(16));
    ChunkedBuffer buf(pool);

    size_t expected = 0;
    bool ok_len = true;
    bool ok_fill = true;
    bool ok_sum = true;
    for (int i = 0; i < 500; ++i) {
        std::string piece = random_bytes(rng, len_dist(rng));
        buf.write(piece);
        expected += piece.size();
        ok_len = ok_len && buf.length() == expected;
        ok_fill = ok_fill && chunks_filled(buf);
        ok_sum = ok_sum && sum_used(buf) == buf.length();
    }

    tm.verify(ok_len, "length() 始终等于写入字节总数");
    tm.verify(ok_fill, "除最后一个外 chunk 始终写满");
    tm.verify(ok_sum, "length() 等于各 chunk used 之和");
    tm.verify_eq(buf.chunk_count(), (expected + 15) / 16, "chunk 数量为 ceil(length / C)");
}

void empty_write_test(TestManager& tm) {
    ChunkPool pool(small_chunks(8));
    ChunkedBuffer buf(pool);

    tm.verify_eq(buf.write("", 0), size_t{0}, "空写入返回 0");
    tm.verify_eq(buf.write(nullptr, 0), size_t{0}, "空指针零长度允许");
    tm.verify(buf.chunk_count() == 0 && buf.empty(), "空写入不取 chunk");
    tm.verify_throws<std::invalid_argument>([&] { buf.write(nullptr, 3); }, "空指针非零长度抛异常");
}

void reset_test(TestManager& tm) {
    ChunkPool pool(small_chunks(8));
    ChunkedBuffer buf(pool);

    buf.reset();
    tm.verify(buf.length() == 0 && buf.chunk_count() == 0, "空 buffer reset 是空操作");

    buf.write(std::string(30, 'x'));
    tm.verify_eq(pool.stats().in_use_chunks, size_t{4}, "借出 4 个 chunk");

    buf.reset();
    tm.verify_eq(buf.length(), size_t{0}, "reset 后 length 为 0");
    tm.verify_eq(buf.chunk_count(), size_t{0}, "reset 后 chunk 数为 0");
    tm.verify_eq(pool.stats().in_use_chunks, size_t{0}, "chunk 全部归还");
    tm.verify_eq(pool.stats().idle_chunks, size_t{4}, "归还的 chunk 进入空闲链表");

    buf.reset();
    tm.verify(buf.empty(), "重复 reset 无副作用");

    buf.write("again");
    tm.verify_eq(pool.stats().total_allocations, size_t{4}, "再次写入复用已归还的 chunk");
    tm.verify_eq(buf.to_string(), std::string("again"), "reset 后内容重新开始");
}

void reset_with_open_reader_test(TestManager& tm) {
    ChunkPool pool(small_chunks(4));
    ChunkedBuffer buf(pool);
    buf.write("ABCDEFG");

    StreamingReader reader = buf.open_reader();
    tm.verify_eq(buf.open_reader_count(), size_t{1}, "登记 1 个 reader");
    tm.verify_throws<BufferInUseError>([&] { buf.reset(); }, "reader 打开时 reset 抛 BufferInUseError");
    tm.verify_eq(buf.length(), size_t{7}, "失败的 reset 不修改 buffer");
    tm.verify_eq(buf.chunk_count(), size_t{2}, "chunk 仍在");

    reader.close();
    tm.verify_eq(buf.open_reader_count(), size_t{0}, "close 后解除登记");
    buf.reset();
    tm.verify(buf.empty(), "关闭 reader 后可以 reset");
}

void read_at_test(TestManager& tm) {
    std::mt19937 rng(7);
    ChunkPool pool(small_chunks(13));
    ChunkedBuffer buf(pool);

    std::string data = random_bytes(rng, 300);
    buf.write(data.data(), 100);
    buf.write(data.data() + 100, 200);

    std::uniform_int_distribution<size_t> off_dist(0, data.size());
    bool all_match = true;
    for (int i = 0; i < 200; ++i) {
        size_t off = off_dist(rng);
        std::uniform_int_distribution<size_t> len_dist(0, data.size() - off);
        size_t len = len_dist(rng);
        std::string out(len, '\0');
        buf.read_at(&out[0], len, off);
        all_match = all_match && out == data.substr(off, len);
    }
    tm.verify(all_match, "随机偏移 read_at 与写入内容一致");

    char tmp[4];
    buf.read_at(tmp, 0, data.size());
    tm.verify(true, "末尾零长度 read_at 合法");
    tm.verify_throws<std::out_of_range>([&] { buf.read_at(tmp, 2, data.size() - 1); }, "越过末尾抛 out_of_range");
    tm.verify_throws<std::out_of_range>([&] { buf.read_at(tmp, 0, data.size() + 1); }, "偏移越界抛 out_of_range");
}

void copy_to_test(TestManager& tm) {
    ChunkPool pool(small_chunks(5));
    ChunkedBuffer buf(pool);
    buf.write("the quick brown fox");

    std::string out;
    StringSink sink(out);
    tm.verify_eq(buf.copy_to(sink), size_t{19}, "copy_to 返回字节数");
    tm.verify_eq(out, std::string("the quick brown fox"), "StringSink 收到完整内容");

    std::ostringstream os;
    OstreamSink os_sink(os);
    buf.copy_to(os_sink);
    tm.verify_eq(os.str(), std::string("the quick brown fox"), "OstreamSink 收到完整内容");

    ChunkPool other_pool(small_chunks(3));
    ChunkedBuffer other(other_pool);
    buf.copy_to(other);
    tm.verify_eq(other.to_string(), buf.to_string(), "可以 copy_to 另一个 ChunkedBuffer");
    tm.verify_eq(other.chunk_count(), size_t{7}, "目标按自己的 chunk 大小切分");

    std::ostringstream bad;
    bad.setstate(std::ios_base::badbit);
    OstreamSink bad_sink(bad);
    tm.verify_throws<std::ios_base::failure>([&] { buf.copy_to(bad_sink); }, "sink 失败向上传播");
}

void fd_round_trip_test(TestManager& tm) {
    std::mt19937 rng(99);
    ChunkPool pool(small_chunks(64));
    ChunkedBuffer src(pool);
    std::string data = random_bytes(rng, 1000);
    src.write(data);

    int fds[2];
    tm.verify(::pipe(fds) == 0, "创建 pipe");

    size_t offset = 0;
    while (offset < src.length()) {
        ssize_t n = src.write_to_fd(fds[1], offset);
        tm.verify(n > 0, "write_to_fd 写出数据");
        offset += static_cast<size_t>(n);
    }
    tm.verify_eq(src.write_to_fd(fds[1], src.length()), ssize_t{0}, "偏移到末尾时写出 0 字节");
    ::close(fds[1]);

    ChunkedBuffer dst(pool);
    ssize_t n = 0;
    while ((n = dst.read_from_fd(fds[0])) > 0) {
    }
    tm.verify_eq(n, ssize_t{0}, "读到 EOF");
    ::close(fds[0]);

    tm.verify_eq(dst.length(), data.size(), "读入长度一致");
    tm.verify(dst.to_string() == data, "读入内容一致");
    tm.verify(chunks_filled(dst), "read_from_fd 保持 chunk 填充不变式");
    tm.verify_eq(dst.chunk_count(), (data.size() + 63) / 64, "EOF 不留下空 chunk");
}

void fd_error_test(TestManager& tm) {
    ChunkPool pool(small_chunks(8));
    ChunkedBuffer buf(pool);
    buf.write("payload");

    errno = 0;
    tm.verify_eq(buf.write_to_fd(-1), ssize_t{-1}, "无效 fd 写返回 -1");
    tm.verify_eq(errno, EBADF, "errno 为 EBADF");

    int fds[2];
    tm.verify(::pipe(fds) == 0, "创建 pipe");
    int flags = ::fcntl(fds[0], F_GETFL, 0);
    ::fcntl(fds[0], F_SETFL, flags | O_NONBLOCK);

    ChunkedBuffer empty(pool);
    errno = 0;
    tm.verify_eq(empty.read_from_fd(fds[0]), ssize_t{-1}, "非阻塞空 pipe 读返回 -1");
    tm.verify(errno == EAGAIN || errno == EWOULDBLOCK, "errno 为 EAGAIN");
    tm.verify_eq(empty.chunk_count(), size_t{0}, "失败的读不留下 chunk");

    ::close(fds[0]);
    ::close(fds[1]);

    tm.verify_throws<std::out_of_range>([&] { buf.write_to_fd(1, 100); }, "偏移越界抛 out_of_range");
}

void pool_exhaustion_propagates_test(TestManager& tm) {
    ChunkPool::Config cfg;
    cfg.chunk_size = 4;
    cfg.max_capacity_bytes = 8;
    ChunkPool pool(cfg);
    ChunkedBuffer buf(pool);

    buf.write("ABCDEFGH");
    tm.verify_throws<PoolExhaustedError>([&] { buf.write("IJ"); }, "池耗尽异常传播给调用方");
    tm.verify_eq(buf.length(), size_t{8}, "已写入部分保持一致");
    tm.verify(sum_used(buf) == buf.length(), "length 与 chunk 内容一致");
}

void default_pool_test(TestManager& tm) {
    ChunkedBuffer buf;
    tm.verify(&buf.pool() == &ChunkPool::default_pool(), "默认使用进程级 ChunkPool");
    tm.verify_eq(buf.chunk_size(), DEFAULT_CHUNK_SIZE, "默认 chunk 大小 4096");

    buf.write(std::string(DEFAULT_CHUNK_SIZE + 1, 'z'));
    tm.verify_eq(buf.chunk_count(), size_t{2}, "4097 字节占 2 个 chunk");
}

void fd_sink_test(TestManager& tm) {
    ChunkPool pool(small_chunks(6));
    ChunkedBuffer src(pool);
    src.write("drained through FdSink");

    int fds[2];
    tm.verify(::pipe(fds) == 0, "创建 pipe");
    FdSink sink(fds[1]);
    tm.verify_eq(src.copy_to(sink), src.length(), "FdSink 写出全部字节");
    ::close(fds[1]);

    ChunkedBuffer dst(pool);
    while (dst.read_from_fd(fds[0]) > 0) {
    }
    ::close(fds[0]);
    tm.verify_eq(dst.to_string(), src.to_string(), "从 pipe 读回相同内容");

    FdSink bad(-1);
    tm.verify_throws<std::system_error>([&] { bad.write("x", 1); }, "无效 fd 抛 std::system_error");
}

void short_write_test(TestManager& tm) {
    ChunkPool pool(small_chunks(4));
    ChunkedBuffer buf(pool);
    buf.write("ABCDEFG");

    HalfSink sink;
    tm.verify_throws<std::runtime_error>([&] { buf.copy_to(sink); }, "sink 短写时 copy_to 抛异常");
}

void destroy_with_open_reader_aborts_test(TestManager& tm) {
    tm.verify_aborts([] {
        ChunkPool pool(small_chunks(4));
        auto buf = std::make_unique<ChunkedBuffer>(pool);
        buf->write("ABCDEFG");
        StreamingReader reader = buf->open_reader();
        buf.reset();
    }, "reader 未关闭时析构 buffer 终止进程");
}

void destroy_pool_with_chunks_in_use_aborts_test(TestManager& tm) {
    tm.verify_aborts([] {
        auto pool = std::make_unique<ChunkPool>(small_chunks(4));
        auto buf = std::make_unique<ChunkedBuffer>(*pool);
        buf->write("hello");
        pool.reset();
    }, "仍有 chunk 借出时析构 ChunkPool 终止进程");

    // 正常顺序不受影响
    auto pool = std::make_unique<ChunkPool>(small_chunks(4));
    auto buf = std::make_unique<ChunkedBuffer>(*pool);
    buf->write("hello");
    buf.reset();
    tm.verify_eq(pool->stats().in_use_chunks, size_t{0}, "先析构 buffer 再析构池");
    pool.reset();
}

int main() {
    logger::pr_init_from_env();
    TestManager tm("ChunkedBuffer");

    tm.run("边界场景 C=4", boundary_scenario_test);
    tm.run("长度与填充不变式", length_and_fill_invariant_test);
    tm.run("空写入", empty_write_test);
    tm.run("reset", reset_test);
    tm.run("reader 打开时 reset", reset_with_open_reader_test);
    tm.run("read_at", read_at_test);
    tm.run("copy_to", copy_to_test);
    tm.run("fd 往返", fd_round_trip_test);
    tm.run("fd 错误", fd_error_test);
    tm.run("FdSink", fd_sink_test);
    tm.run("sink 短写", short_write_test);
    tm.run("reader 未关闭时析构 buffer", destroy_with_open_reader_aborts_test);
    tm.run("chunk 未归还时析构池", destroy_pool_with_chunks_in_use_aborts_test);
    tm.run("池耗尽传播", pool_exhaustion_propagates_test);
    tm.run("默认池", default_pool_test);

    return tm.summary();
}
