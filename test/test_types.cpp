#include "ledger_fixture.hpp"

#include <algorithm>
#include <cctype>

TEST_SUITE("Amount and Hash Tests") {

    TEST_CASE("Parse amounts") {
        SUBCASE("Decimal") {
            auto parsed = parseAmount("12345");
            REQUIRE(parsed.is_ok());
            CHECK(parsed.value() == 12345);
        }

        SUBCASE("Largest 256-bit value") {
            auto text = amountToString(std::numeric_limits<Amount>::max());
            auto parsed = parseAmount(text);
            REQUIRE(parsed.is_ok());
            CHECK(parsed.value() == std::numeric_limits<Amount>::max());
        }

        SUBCASE("Rejects non-decimal text") {
            for (const std::string text : {"", "-1", "+1", "0x10", "1.5", "12a"}) {
                auto parsed = parseAmount(text);
                REQUIRE(parsed.is_err());
                CHECK(parsed.error().code == ERR_INVALID_AMOUNT);
            }
        }

        SUBCASE("Rejects values beyond 256 bits") {
            // 2^256
            auto parsed =
                parseAmount("115792089237316195423570985008687907853269984665640564039457584007913129639936");
            REQUIRE(parsed.is_err());
            CHECK(parsed.error().code == ERR_OVERFLOW);
        }
    }

    TEST_CASE("Amount arithmetic is checked") {
        Amount max = std::numeric_limits<Amount>::max();
        CHECK_THROWS_AS(max + 1, std::overflow_error);

        Amount zero = 0;
        CHECK_THROWS(zero - 1);
    }

    TEST_CASE("Platform fee split") {
        SUBCASE("No fee") {
            auto [share, cut] = splitPlatformFee(1000, 0);
            CHECK(share == 1000);
            CHECK(cut == 0);
        }

        SUBCASE("Five percent") {
            auto [share, cut] = splitPlatformFee(1000, 500);
            CHECK(share == 950);
            CHECK(cut == 50);
        }

        SUBCASE("Cut rounds down") {
            auto [share, cut] = splitPlatformFee(19, 1000);
            CHECK(cut == 1);
            CHECK(share == 18);
        }

        SUBCASE("Dust goes to the creator") {
            auto [share, cut] = splitPlatformFee(9, 1000);
            CHECK(cut == 0);
            CHECK(share == 9);
        }

        SUBCASE("Maximum amount does not overflow") {
            Amount max = std::numeric_limits<Amount>::max();
            auto [share, cut] = splitPlatformFee(max, MAX_PLATFORM_FEE_BPS);
            CHECK(share + cut == max);
            CHECK(cut == max / 10);
        }
    }

    TEST_CASE("Content hashing") {
        auto hash = hashContent(std::string("abc"));
        REQUIRE(hash.is_ok());
        std::string hex = hash.value();
        std::transform(hex.begin(), hex.end(), hex.begin(), [](unsigned char c) { return std::tolower(c); });
        CHECK(hex == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

        auto same = hashContent(std::vector<uint8_t>{'a', 'b', 'c'});
        REQUIRE(same.is_ok());
        CHECK(same.value() == hash.value());

        auto other = hashContent(std::string("abd"));
        REQUIRE(other.is_ok());
        CHECK(other.value() != hash.value());
    }

    TEST_CASE("Hashed content reference on the ledger") {
        LedgerFixture fx;
        fx.registerCreator("alice");

        auto hash = hashContent(std::string("episode one"));
        REQUIRE(hash.is_ok());
        auto id = fx.platform->postContent(as("alice"), hash.value(), false, true);
        REQUIRE(id.is_ok());
        CHECK(fx.platform->getContent(id.value()).value().content_hash == hash.value());
    }
}
