#pragma once

#include "utils.hpp"

namespace quicid
{
    // Small, fast, non-cryptographic 64-bit streaming hasher in the style of Firefox's/rustc's
    // "FxHash": each input word is mixed in with a rotate, xor, and multiply by a fixed odd constant.
    // It is neither collision- nor preimage-resistant; it exists for cheap tagging such as the
    // HashedConnectionIDGenerator signature, where being fast matters and forgery by a motivated
    // attacker is accepted.
    //
    // Byte input is consumed as little-endian 8-byte words, then at most one each of a 4-, 2-, and
    // 1-byte tail, so results do not depend on host endianness.
    class fx_hasher
    {
      public:
        static constexpr uint64_t SEED = 0x51'7c'c1'b7'27'22'0a'95ULL;

        constexpr fx_hasher() = default;

        constexpr void write_u64(uint64_t i) { add_to_hash(i); }

        void write(const uint8_t* data, size_t size)
        {
            for (; size >= 8; data += 8, size -= 8)
                add_to_hash(oxenc::load_little_to_host<uint64_t>(data));
            if (size >= 4)
            {
                add_to_hash(oxenc::load_little_to_host<uint32_t>(data));
                data += 4;
                size -= 4;
            }
            if (size >= 2)
            {
                add_to_hash(oxenc::load_little_to_host<uint16_t>(data));
                data += 2;
                size -= 2;
            }
            if (size >= 1)
                add_to_hash(*data);
        }

        void write(ustring_view bytes) { write(bytes.data(), bytes.size()); }

        constexpr uint64_t finish() const { return hash; }

      private:
        uint64_t hash{0};

        constexpr void add_to_hash(uint64_t i) { hash = (((hash << 5) | (hash >> 59)) ^ i) * SEED; }
    };

}  // namespace quicid
