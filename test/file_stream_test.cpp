/*
 *    file_stream_test.cpp:
 *
 *    Copyright (C) 2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#include <unistd.h>

#include <algorithm>
#include <cassert>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include "include/light_reader/io/buffered_read_stream.hpp"
#include "include/light_reader/shared_ptr.hpp"
#include "src/ports/posix/io/file_stream.hpp"
#include "test/test_streams.hpp"

using namespace std;
using lr::io::BufferedReadStream;
using lr::ports::posix::io::FileStream;

namespace {

/**
 * Writes data to a fresh temporary file and removes it again on scope exit.
 */
class TempFile {
public:
    explicit TempFile(const vector<uint8_t>& data) {
        char pattern[] = "/tmp/light_reader_testXXXXXX";
        int fd = mkstemp(pattern);
        if (fd < 0) {
            throw runtime_error("mkstemp failed");
        }
        path_ = pattern;
        size_t written = 0;
        while (written < data.size()) {
            auto n = ::write(fd, data.data() + written, data.size() - written);
            if (n <= 0) {
                ::close(fd);
                throw runtime_error("write failed");
            }
            written += static_cast<size_t>(n);
        }
        ::close(fd);
    }
    ~TempFile() { ::unlink(path_.c_str()); }

    const string& path() const { return path_; }

private:
    string path_;
};

void testFileStreamBasics() {
    auto data = lr::test::MakeData(1000);
    TempFile file(data);
    auto stream = lr::SharedPtr<FileStream>(new FileStream(file.path()), false);

    assert(stream->CanRead() && stream->CanSeek() && !stream->CanWrite());
    assert(stream->Length() == 1000);
    assert(stream->Position() == 0);
    assert(stream->SetPosition(998) == 998);

    uint8_t buf[8] = {};
    assert(stream->Read(buf, sizeof(buf)) == 2);
    assert(buf[0] == data[998] && buf[1] == data[999]);
    assert(stream->Read(buf, sizeof(buf)) == 0);
    assert(stream->Seek(-1, SEEK_SET) < 0);
    assert(stream->Write(buf, 1) == lr::io::kErrorNotSupported);
}

void testMissingFileThrows() {
    bool threw = false;
    try {
        FileStream stream("/nonexistent/light_reader/file");
    } catch (const system_error& e) {
        threw = e.code().value() == ENOENT;
    }
    assert(threw);
}

void testBufferedReadOverFile() {
    auto data = lr::test::MakeData(3 * BufferedReadStream::kBufferLength + 17);
    TempFile file(data);
    auto stream = lr::SharedPtr<FileStream>(new FileStream(file.path()), false);
    auto reader = lr::MakeShared<BufferedReadStream>(stream.get());

    vector<uint8_t> out;
    int b = 0;
    while ((b = reader->ReadByte()) >= 0) {
        out.push_back(static_cast<uint8_t>(b));
    }
    assert(b == lr::io::kEndOfStream);
    assert(out == data);

    assert(reader->Seek(100, SEEK_SET) == 100);
    vector<uint8_t> chunk(BufferedReadStream::kBufferLength * 2);
    assert(reader->Read(chunk.data(), chunk.size()) == static_cast<int>(chunk.size()));
    assert(equal(chunk.begin(), chunk.end(), data.begin() + 100));

    reader->Close();
    assert(stream->Position() == static_cast<int64_t>(100 + chunk.size()));
}

} // end namespace

int main() {
    testFileStreamBasics();
    testMissingFileThrows();
    testBufferedReadOverFile();
    cout << "All file stream tests passed\n";
    return 0;
}
