#pragma once

#include <stdexcept>

#include "utils.hpp"

namespace quicid::opt
{
    using namespace std::chrono_literals;

    // Fixed byte length of every connection ID minted by a RandomConnectionIDGenerator.  Must be in
    // [1, MAX_CID_SIZE]; anything else is a programming error and throws at construction.
    struct cid_length
    {
        size_t len{DEFAULT_CID_SIZE};
        cid_length() = default;
        explicit cid_length(size_t l) : len{l}
        {
            if (len == 0)
                throw std::invalid_argument{"opt::cid_length must be at least 1 byte"};
            if (len > MAX_CID_SIZE)
                throw std::invalid_argument{"opt::cid_length may not exceed " + std::to_string(MAX_CID_SIZE) + " bytes"};
        }
    };

    // Advisory hint to the connection layer for how long an issued connection ID should remain in
    // use before being retired.  If this option is not given then generated IDs carry no lifetime
    // and are never retired on a timer.
    struct cid_lifetime
    {
        std::chrono::milliseconds lifetime;
        explicit cid_lifetime(std::chrono::milliseconds val) : lifetime{val}
        {
            if (lifetime < 0ms)
                throw std::invalid_argument{"opt::cid_lifetime may not be negative"};
        }
    };

    // Used to provide a fixed secret for a HashedConnectionIDGenerator so that connection IDs issued
    // before a restart continue to validate afterwards.  If not provided, a random key is drawn from
    // the gnutls key-level random source at generator construction.  The hex form is the 16-digit
    // big-endian rendering of the integer key (i.e. "00000000000000ff" is key 255).
    struct hash_key
    {
        uint64_t key;
        explicit hash_key(uint64_t k) : key{k} {}
        explicit hash_key(std::string_view hex)
        {
            if (hex.size() != 2 * sizeof(uint64_t) || !oxenc::is_hex(hex))
                throw std::invalid_argument{"opt::hash_key requires exactly 16 hex digits"};
            auto bytes = oxenc::from_hex(hex);
            key = oxenc::load_big_to_host<uint64_t>(bytes.data());
        }
    };

}  // namespace quicid::opt
