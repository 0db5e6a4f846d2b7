#include <catch2/catch_test_macros.hpp>

#include <browser_mcp/core/base64.hpp>

using namespace browser_mcp;

TEST_CASE("Base64Decode: padded and unpadded input", "[core][base64]") {
    auto padded = Base64Decode("aGVsbG8=");
    REQUIRE(padded.IsOk());
    CHECK(padded.Value() == "hello");

    auto unpadded = Base64Decode("aGVsbG8");
    REQUIRE(unpadded.IsOk());
    CHECK(unpadded.Value() == "hello");

    CHECK(Base64Decode("").Value().empty());
}

TEST_CASE("Base64Decode: PDF and PNG signatures", "[core][base64]") {
    auto pdf = Base64Decode("JVBERi0xLjQK");
    REQUIRE(pdf.IsOk());
    CHECK(pdf.Value() == "%PDF-1.4\n");

    auto png = Base64Decode("iVBORw0KGgo=");
    REQUIRE(png.IsOk());
    CHECK(png.Value() == std::string("\x89PNG\r\n\x1a\n", 8));
}

TEST_CASE("Base64Decode: line breaks are skipped", "[core][base64]") {
    auto r = Base64Decode("aGVs\r\nbG8=");
    REQUIRE(r.IsOk());
    CHECK(r.Value() == "hello");
}

TEST_CASE("Base64Decode: rejects characters outside the alphabet", "[core][base64]") {
    CHECK(Base64Decode("aGVs bG8=").IsErr());
    CHECK(Base64Decode("aGVs*bG8=").IsErr());
    CHECK(Base64Decode("aG=Vs").IsErr());
}
