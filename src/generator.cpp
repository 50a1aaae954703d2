#include "generator.hpp"

#include "hash.hpp"
#include "internal.hpp"

namespace quicid
{
    void RandomConnectionIDGenerator::handle_gen_opt(opt::cid_length len)
    {
        _cid_len = len.len;
    }

    void RandomConnectionIDGenerator::handle_gen_opt(opt::cid_lifetime lifetime)
    {
        _lifetime = lifetime.lifetime;
    }

    void RandomConnectionIDGenerator::_log_created() const
    {
        log::debug(
                log_cat,
                "Random CID generator created (length: {}B, lifetime: {})",
                _cid_len,
                _lifetime ? "{}ms"_format(_lifetime->count()) : "none"s);
    }

    RandomConnectionIDGenerator& RandomConnectionIDGenerator::set_lifetime(std::chrono::milliseconds d)
    {
        handle_gen_opt(opt::cid_lifetime{d});
        return *this;
    }

    ConnectionID RandomConnectionIDGenerator::generate_cid()
    {
        ConnectionID cid;
        cid.datalen = _cid_len;
        fill_random(cid.data, cid.datalen);

        log::trace(log_cat, "Generated random CID: {}", cid);
        return cid;
    }

    void HashedConnectionIDGenerator::handle_gen_opt(opt::hash_key key)
    {
        _key = key.key;
    }

    void HashedConnectionIDGenerator::handle_gen_opt(opt::cid_lifetime lifetime)
    {
        _lifetime = lifetime.lifetime;
    }

    void HashedConnectionIDGenerator::_log_created() const
    {
        log::debug(
                log_cat,
                "Hashed CID generator created (lifetime: {})",
                _lifetime ? "{}ms"_format(_lifetime->count()) : "none"s);
    }

    uint64_t HashedConnectionIDGenerator::random_key()
    {
        uint64_t key;
        fill_random(&key, sizeof(key), GNUTLS_RND_KEY);
        return key;
    }

    HashedConnectionIDGenerator& HashedConnectionIDGenerator::set_lifetime(std::chrono::milliseconds d)
    {
        handle_gen_opt(opt::cid_lifetime{d});
        return *this;
    }

    std::array<uint8_t, 8> HashedConnectionIDGenerator::digest(const uint8_t* nonce) const
    {
        fx_hasher hasher;
        hasher.write_u64(*_key);
        hasher.write(nonce, NONCE_LEN);

        std::array<uint8_t, 8> out;
        oxenc::write_host_as_little(hasher.finish(), out.data());
        return out;
    }

    ConnectionID HashedConnectionIDGenerator::generate_cid()
    {
        ConnectionID cid;
        cid.datalen = CID_LEN;
        fill_random(cid.data, NONCE_LEN);

        auto sig = digest(cid.data);
        std::memcpy(cid.data + NONCE_LEN, sig.data(), SIGNATURE_LEN);

        log::trace(log_cat, "Generated hashed CID: {}", cid);
        return cid;
    }

    validate_result HashedConnectionIDGenerator::validate(const ConnectionID& cid) const
    {
        if (cid.datalen != CID_LEN)
        {
            log::trace(log_cat, "Rejecting CID: {}; length {} is not {}", cid, cid.datalen, CID_LEN);
            return INVALID_CID;
        }

        auto expected = digest(cid.data);
        if (std::memcmp(expected.data(), cid.data + NONCE_LEN, SIGNATURE_LEN) != 0)
        {
            log::trace(log_cat, "Rejecting CID: {}; signature mismatch", cid);
            return INVALID_CID;
        }

        return {};
    }

}  // namespace quicid
