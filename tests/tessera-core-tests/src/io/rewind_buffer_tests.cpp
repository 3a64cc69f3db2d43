#include <catch2/catch_test_macros.hpp>

#include <tessera/io/rewind_buffer.hpp>

#include <array>
#include <numeric>
#include <vector>

using namespace tessera;

namespace rewind_buffer {

static std::vector<uint8> Sequence(uint8 first, size_t count) {
    std::vector<uint8> bytes(count);
    std::iota(bytes.begin(), bytes.end(), first);
    return bytes;
}

TEST_CASE("Rewind buffer keeps the most recent bytes", "[io][rewind_buffer]") {
    io::RewindBuffer buffer{8};
    REQUIRE(buffer.Capacity() == 8);
    REQUIRE(buffer.Size() == 0);

    SECTION("appending within capacity drops nothing") {
        CHECK(buffer.Append(Sequence(0, 5)) == 0);
        CHECK(buffer.Size() == 5);

        std::array<uint8, 5> out{};
        buffer.CopyOut(0, out);
        CHECK(out == std::array<uint8, 5>{0, 1, 2, 3, 4});
    }

    SECTION("appending past capacity drops the oldest bytes") {
        CHECK(buffer.Append(Sequence(0, 6)) == 0);
        CHECK(buffer.Append(Sequence(6, 6)) == 4);
        CHECK(buffer.Size() == 8);

        std::array<uint8, 8> out{};
        buffer.CopyOut(0, out);
        CHECK(out == std::array<uint8, 8>{4, 5, 6, 7, 8, 9, 10, 11});

        SECTION("copying across the wrap-around point") {
            std::array<uint8, 3> part{};
            buffer.CopyOut(3, part);
            CHECK(part == std::array<uint8, 3>{7, 8, 9});
        }
    }

    SECTION("appending more than the capacity keeps only the tail") {
        CHECK(buffer.Append(Sequence(0, 3)) == 0);
        CHECK(buffer.Append(Sequence(100, 10)) == 5);
        CHECK(buffer.Size() == 8);

        std::array<uint8, 8> out{};
        buffer.CopyOut(0, out);
        CHECK(out == std::array<uint8, 8>{102, 103, 104, 105, 106, 107, 108, 109});
    }

    SECTION("clearing empties the buffer") {
        buffer.Append(Sequence(0, 7));
        buffer.Clear();
        CHECK(buffer.Size() == 0);

        buffer.Append(Sequence(50, 2));
        std::array<uint8, 2> out{};
        buffer.CopyOut(0, out);
        CHECK(out == std::array<uint8, 2>{50, 51});
    }
}

} // namespace rewind_buffer
