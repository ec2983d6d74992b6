/*
 *    custom_io_wrapper_test.cpp:
 *
 *    Copyright (C) 2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <vector>

extern "C" {
#include <libavformat/avio.h>
}

#include "include/light_reader/io/buffered_read_stream.hpp"
#include "src/io/custom_io_wrapper.hpp"
#include "test/test_streams.hpp"

using namespace std;
using lr::io::BufferedReadStream;
using lr::io::CustomIOWrapper;
using lr::test::CountingStream;
using lr::test::MakeData;

namespace {

void testParsesThroughBufferedReader() {
    auto data = MakeData(20000);
    CountingStream src(data);
    BufferedReadStream reader(&src);
    CustomIOWrapper custom_io(&reader);
    AVIOContext* pb = custom_io.IOContext();

    assert(pb != nullptr);
    assert(pb->seekable != 0);
    assert(avio_size(pb) == 20000);

    assert(avio_r8(pb) == data[0]);
    uint32_t be = (uint32_t(data[1]) << 24) | (uint32_t(data[2]) << 16) |
                  (uint32_t(data[3]) << 8) | uint32_t(data[4]);
    assert(avio_rb32(pb) == be);

    vector<uint8_t> buf(100);
    assert(avio_seek(pb, 12345, SEEK_SET) == 12345);
    assert(avio_read(pb, buf.data(), 100) == 100);
    assert(equal(buf.begin(), buf.end(), data.begin() + 12345));

    assert(avio_seek(pb, 19990, SEEK_SET) == 19990);
    assert(avio_read(pb, buf.data(), 100) == 10);
    assert(equal(buf.begin(), buf.begin() + 10, data.begin() + 19990));
    avio_r8(pb);
    assert(avio_feof(pb));
}

void testUnseekableStream() {
    CountingStream src(MakeData(16));
    src.can_seek = false;
    CustomIOWrapper custom_io(&src);
    assert(custom_io.IOContext()->seekable == 0);
    assert(avio_r8(custom_io.IOContext()) == MakeData(16)[0]);
}

void testNullStreamRejected() {
    bool threw = false;
    try {
        CustomIOWrapper custom_io(nullptr);
    } catch (const invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

} // end namespace

int main() {
    testParsesThroughBufferedReader();
    testUnseekableStream();
    testNullStreamRejected();
    cout << "All custom io wrapper tests passed\n";
    return 0;
}
