#include <catch2/catch.hpp>

#include "fake_transport.hpp"

#include <stream/file_io.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>

using namespace l2stream;

namespace {

std::filesystem::path temp_file(const std::string& name) {
    return std::filesystem::temp_directory_path() / ("l2stream_test_" + name);
}

void write_file(const std::filesystem::path& path, const std::vector<uint8_t>& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

std::vector<uint8_t> read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

} // namespace

TEST_CASE( "FileSource reads fixed chunks until exhausted", "[file][source]" ) {
    auto path = temp_file("source.pcm");
    auto data = test::pattern(2000);
    write_file(path, data);

    stream::FileSource source;
    REQUIRE( source.open(path.string()) );
    REQUIRE( 2000 == source.remaining() );
    REQUIRE( !source.live() );
    REQUIRE( !source.paced() );

    std::vector<uint8_t> chunk(988);
    std::vector<uint8_t> collected;
    std::vector<size_t> sizes;
    while (true) {
        auto n = source.read(chunk);
        REQUIRE( n );
        if (*n == 0) break;
        sizes.push_back(*n);
        collected.insert(collected.end(), chunk.begin(), chunk.begin() + static_cast<long>(*n));
    }

    REQUIRE( sizes == std::vector<size_t>{988, 988, 24} );
    REQUIRE( collected == data );
    REQUIRE( 0 == *source.read(chunk) );

    source.close();
    std::filesystem::remove(path);
}

TEST_CASE( "FileSource pacing flag and missing files", "[file][source]" ) {
    stream::FileSource paced(true);
    REQUIRE( paced.paced() );
    REQUIRE( !paced.open(temp_file("does_not_exist.pcm").string()) );

    std::vector<uint8_t> chunk(16);
    REQUIRE( !paced.read(chunk) );
}

TEST_CASE( "FileSink truncates and appends writes", "[file][sink]" ) {
    auto path = temp_file("sink.pcm");
    write_file(path, test::pattern(5000));

    auto first = test::pattern(300);
    std::vector<uint8_t> second(77, 0x5a);

    {
        stream::FileSink sink;
        REQUIRE( SinkKind::File == sink.kind() );
        REQUIRE( sink.open(path.string()) );
        REQUIRE( sink.write(first) );
        REQUIRE( sink.write(second) );
        sink.close();
        sink.close();
    }

    auto expected = first;
    expected.insert(expected.end(), second.begin(), second.end());
    REQUIRE( read_file(path) == expected );

    std::filesystem::remove(path);
}

TEST_CASE( "FileSink rejects writes when not open", "[file][sink]" ) {
    stream::FileSink sink;
    std::vector<uint8_t> data(10, 1);
    REQUIRE( !sink.write(data) );
    REQUIRE( !sink.open((temp_file("no_such_dir") / "out.pcm").string()) );
}
