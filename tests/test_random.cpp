// cardex - Seed derivation and weighted draw tests

#include "test_support.hpp"

using namespace cardex;
using namespace cardex::test;

TEST_CASE("Weighted draw walks cumulative probabilities", "[random]") {
    const std::vector<uint32_t> rare{9999, 1};

    SECTION("Index order breaks ties") {
        REQUIRE(weighted_draw(0, rare) == std::optional<size_t>(0));
        REQUIRE(weighted_draw(9998, rare) == std::optional<size_t>(0));
        REQUIRE(weighted_draw(9999, rare) == std::optional<size_t>(1));
    }

    SECTION("Seed is reduced modulo 10000") {
        REQUIRE(weighted_draw(19999, rare) == std::optional<size_t>(1));
        REQUIRE(weighted_draw(20000, rare) == std::optional<size_t>(0));
    }

    SECTION("Bucket boundaries") {
        const std::vector<uint32_t> thirds{2500, 2500, 5000};
        REQUIRE(weighted_draw(2499, thirds) == std::optional<size_t>(0));
        REQUIRE(weighted_draw(2500, thirds) == std::optional<size_t>(1));
        REQUIRE(weighted_draw(4999, thirds) == std::optional<size_t>(1));
        REQUIRE(weighted_draw(5000, thirds) == std::optional<size_t>(2));
        REQUIRE(weighted_draw(9999, thirds) == std::optional<size_t>(2));
    }

    SECTION("Zero-weight entries are never drawn") {
        const std::vector<uint32_t> gaps{0, 10000, 0};
        for (uint64_t seed : {0ULL, 1234ULL, 9999ULL}) {
            REQUIRE(weighted_draw(seed, gaps) == std::optional<size_t>(1));
        }
    }

    SECTION("Same seed, same index") {
        for (uint64_t seed = 0; seed < 50000; seed += 997) {
            REQUIRE(weighted_draw(seed, rare) == weighted_draw(seed, rare));
        }
    }

    SECTION("Malformed weights") {
        REQUIRE_FALSE(weighted_draw(500, {100}).has_value());
        REQUIRE_FALSE(weighted_draw(0, {}).has_value());
    }
}

TEST_CASE("Block entropy seed", "[random]") {
    EntropyContext ctx;
    ctx.timestamp = 1700000000;
    ctx.block_number = 42;
    ctx.caller = BUYER;
    ctx.nonce = 0;

    BlockEntropySeed source(BlockEntropySeed::salt_from_seed("cardex"));

    SECTION("Deterministic for the same context") {
        uint64_t first = source.seed(ctx);
        REQUIRE(source.seed(ctx) == first);

        BlockEntropySeed twin(BlockEntropySeed::salt_from_seed("cardex"));
        REQUIRE(twin.seed(ctx) == first);
    }

    SECTION("Every context field feeds the hash") {
        uint64_t base = source.seed(ctx);

        EntropyContext other = ctx;
        other.nonce = 1;
        REQUIRE(source.seed(other) != base);

        other = ctx;
        other.caller = BUYER2;
        REQUIRE(source.seed(other) != base);

        other = ctx;
        other.timestamp += 1;
        REQUIRE(source.seed(other) != base);
    }

    SECTION("Salt rotation changes the seed") {
        uint64_t before = source.seed(ctx);
        auto salt_before = source.salt();

        source.rotate_salt(ctx);
        REQUIRE(source.salt() != salt_before);
        REQUIRE(source.seed(ctx) != before);
    }

    SECTION("Salt derivation is SHA-256 of the seed string") {
        auto salt = BlockEntropySeed::salt_from_seed("abc");
        REQUIRE(salt[0] == 0xba);
        REQUIRE(salt[1] == 0x78);
        REQUIRE(salt[2] == 0x16);
        REQUIRE(salt[3] == 0xbf);
        REQUIRE(salt[31] == 0xad);
    }
}
