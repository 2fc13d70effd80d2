#include "crypto.hpp"
#include "test_dir.hpp"
#include <catch2/catch.hpp>
#include <stdexcept>

namespace {

std::vector<unsigned char> bytes(const std::string& s) {
    return {s.begin(), s.end()};
}

} // namespace

TEST_CASE("sha512 matches the FIPS 180-2 test vectors", "[crypto]") {
    REQUIRE(hex_encode(sha512(bytes("abc"))) ==
            "ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a"
            "2192992a274fc1a836ba3c23a3feebbd454d4423643ce80e2a9ac94fa54ca49f");
    REQUIRE(hex_encode(sha512({})) ==
            "cf83e1357eefb8bdf1542850d66d8007d620e4050b5715dc83f4a921d36ce9ce"
            "47d0d13c5d85f2b0ff8318d2877eec2f63b931bd47417a81a538327af927da3e");
}

TEST_CASE("sha512_file hashes the whole file across read chunks", "[crypto]") {
    TestDir dir;
    std::string content;
    for (int i = 0; i < 200000; ++i)
        content += static_cast<char>('a' + i % 26);
    auto path = dir.write("big.mar", content);

    REQUIRE(sha512_file(path.string()) == sha512(bytes(content)));
    REQUIRE(sha512_file(dir.write("abc", "abc").string()) == sha512(bytes("abc")));
}

TEST_CASE("sha512_file throws for a missing file", "[crypto]") {
    TestDir dir;
    REQUIRE_THROWS_AS(sha512_file((dir.path() / "missing.mar").string()), std::runtime_error);
}

TEST_CASE("hex_encode is lowercase and zero padded", "[crypto]") {
    REQUIRE(hex_encode({0x00, 0x0f, 0xab, 0xff}) == "000fabff");
    REQUIRE(hex_encode({}).empty());
}
