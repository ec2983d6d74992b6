/*
 *    memory_stream_test.cpp:
 *
 *    Copyright (C) 2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#include <cassert>
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <limits>
#include <vector>

#include "include/light_reader/io/memory_stream.hpp"

using namespace std;
using lr::io::MemoryStream;

namespace {

void testReadAndSeek() {
    MemoryStream stream(vector<uint8_t>{1, 2, 3, 4, 5});
    assert(stream.CanRead() && stream.CanSeek() && !stream.CanWrite());
    assert(stream.Length() == 5);

    uint8_t buf[8] = {};
    assert(stream.Read(buf, 3) == 3);
    assert(buf[0] == 1 && buf[2] == 3);
    assert(stream.Position() == 3);
    assert(stream.Read(buf, 8) == 2);
    assert(buf[0] == 4 && buf[1] == 5);
    assert(stream.Read(buf, 8) == 0);

    assert(stream.Seek(-2, SEEK_END) == 3);
    assert(stream.Seek(1, SEEK_CUR) == 4);
    assert(stream.Seek(1, SEEK_SET) == 1);
    assert(stream.Seek(0, 99) == AVERROR(EINVAL));
}

void testPositionPastEnd() {
    MemoryStream stream(vector<uint8_t>{1, 2, 3});
    uint8_t buf[4] = {};
    assert(stream.SetPosition(10) == 10);
    assert(stream.Read(buf, sizeof(buf)) == 0);
    assert(stream.SetPosition(-1) == AVERROR(EINVAL));
    assert(stream.Position() == 10);
}

void testSeekOverflowRejected() {
    MemoryStream stream(vector<uint8_t>{1, 2, 3});
    const auto max = numeric_limits<int64_t>::max();
    assert(stream.SetPosition(10) == 10);
    assert(stream.Seek(max, SEEK_CUR) == AVERROR(EINVAL));
    assert(stream.Seek(max, SEEK_END) == AVERROR(EINVAL));
    assert(stream.Seek(numeric_limits<int64_t>::min(), SEEK_CUR) == AVERROR(EINVAL));
    assert(stream.Position() == 10);
    assert(stream.Seek(max - 3, SEEK_END) == max);
}

void testReadOnlyRejectsWrites() {
    MemoryStream stream(vector<uint8_t>{1, 2, 3});
    const uint8_t payload[2] = {9, 9};
    assert(stream.Write(payload, sizeof(payload)) == lr::io::kErrorNotSupported);
    assert(stream.SetLength(1) == lr::io::kErrorNotSupported);
    assert(stream.Length() == 3);
}

void testWritable() {
    MemoryStream stream(vector<uint8_t>{1, 2, 3}, true);
    assert(stream.CanWrite());
    assert(stream.Flush() == 0);

    const uint8_t payload[3] = {7, 8, 9};
    assert(stream.SetPosition(2) == 2);
    assert(stream.Write(payload, sizeof(payload)) == 3);
    assert(stream.Length() == 5);
    assert((stream.Data() == vector<uint8_t>{1, 2, 7, 8, 9}));

    assert(stream.SetLength(1) == 0);
    assert(stream.Position() == 1);
    assert(stream.Length() == 1);
}

} // end namespace

int main() {
    testReadAndSeek();
    testPositionPastEnd();
    testSeekOverflowRejected();
    testReadOnlyRejectsWrites();
    testWritable();
    cout << "All memory stream tests passed\n";
    return 0;
}
