#include <catch2/catch_test_macros.hpp>

#include <tessera/util/bit_ops.hpp>
#include <tessera/util/data_ops.hpp>

#include <array>

namespace data_ops {

TEST_CASE("Byte runs are assembled in the requested order", "[util][data_ops]") {
    const std::array<uint8, 8> bytes{0x01, 0x23, 0x45, 0x67, 0x89, 0xAB, 0xCD, 0xEF};
    const std::span<const uint8> span{bytes};

    CHECK(util::ReadUnsigned(span, false) == 0x0123456789ABCDEFull);
    CHECK(util::ReadUnsigned(span, true) == 0xEFCDAB8967452301ull);

    CHECK(util::ReadUnsigned(span.first(1), true) == 0x01);
    CHECK(util::ReadUnsigned(span.first(3), false) == 0x012345);
    CHECK(util::ReadUnsigned(span.first(3), true) == 0x452301);
    CHECK(util::ReadUnsigned(span.first(0), true) == 0);
}

TEST_CASE("Fixed-width reads and writes honor the byte order", "[util][data_ops]") {
    std::array<uint8, 4> bytes{};

    util::WriteBE<uint32>(bytes.data(), 0x11223344);
    CHECK(bytes == std::array<uint8, 4>{0x11, 0x22, 0x33, 0x44});
    CHECK(util::ReadBE<uint32>(bytes.data()) == 0x11223344);
    CHECK(util::ReadLE<uint32>(bytes.data()) == 0x44332211);

    util::WriteLE<uint16>(bytes.data(), 0xABCD);
    CHECK(bytes[0] == 0xCD);
    CHECK(bytes[1] == 0xAB);
}

TEST_CASE("Bytes are swapped correctly", "[util][bit_ops]") {
    CHECK(bit::byte_swap<uint16>(0x1234) == 0x3412);
    CHECK(bit::byte_swap<uint32>(0x12345678) == 0x78563412);
    CHECK(bit::byte_swap<uint64>(0x0102030405060708ull) == 0x0807060504030201ull);
}

} // namespace data_ops
