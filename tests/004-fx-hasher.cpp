#include <catch2/catch_test_macros.hpp>
#include <quicid/hash.hpp>

#include "utils.hpp"

namespace quicid::test
{
    TEST_CASE("004 - fx_hasher: Reference values", "[004][hash]")
    {
        CHECK(fx_hasher{}.finish() == 0);

        fx_hasher one;
        one.write_u64(1);
        CHECK(one.finish() == fx_hasher::SEED);

        fx_hasher abc;
        abc.write("abc"_usv);
        CHECK(abc.finish() == 0xc360d75917ea8923ULL);

        // 8-byte word, then 2- and 1-byte tails
        fx_hasher hw;
        hw.write("hello world"_usv);
        CHECK(hw.finish() == 0x824bd397ee3369c5ULL);

        fx_hasher keyed;
        keyed.write_u64(0x123456789abcdef0ULL);
        keyed.write("\x01\x02\x03"_usv);
        CHECK(keyed.finish() == 0xafff70463729343bULL);
    }

    TEST_CASE("004 - fx_hasher: Determinism", "[004][hash]")
    {
        auto digest = [](uint64_t key, ustring_view data) {
            fx_hasher h;
            h.write_u64(key);
            h.write(data);
            return h.finish();
        };

        CHECK(digest(42, "some nonce"_usv) == digest(42, "some nonce"_usv));
        CHECK(digest(42, "some nonce"_usv) != digest(43, "some nonce"_usv));
        CHECK(digest(42, "some nonce"_usv) != digest(42, "some nonc3"_usv));
        CHECK(digest(42, ""_usv) == digest(42, ustring_view{}));
    }
}  // namespace quicid::test
