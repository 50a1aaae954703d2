#include "ngtcp2_hooks.hpp"

extern "C"
{
#include <ngtcp2/ngtcp2_crypto.h>
}

#include "internal.hpp"

namespace quicid
{
    namespace
    {
        constexpr uint8_t HEADER_FORM_BIT = 0x80;
        constexpr uint8_t LONG_TYPE_MASK = 0x30;

        // True for long header packets whose DCID was picked by the client rather than issued by us
        // (Initial and 0-RTT), and for versions we can't parse, which the endpoint must answer with
        // version negotiation regardless of DCID.  The long packet type encoding differs between
        // QUIC v1 and v2 (RFC 9369, section 3.2).
        bool peer_chosen_dcid(uint8_t first_byte, uint32_t version)
        {
            auto type = static_cast<uint8_t>((first_byte & LONG_TYPE_MASK) >> 4);
            switch (version)
            {
                case NGTCP2_PROTO_VER_V1:
                    return type == 0x0 || type == 0x1;
                case NGTCP2_PROTO_VER_V2:
                    return type == 0x1 || type == 0x2;
                default:
                    return true;
            }
        }
    }  // namespace

    int new_connection_id(
            ConnectionIDGenerator& gen, ngtcp2_cid* cid, uint8_t* token, size_t cidlen, ustring_view static_secret)
    {
        log::trace(log_cat, "{} called", __PRETTY_FUNCTION__);

        if (cidlen != gen.cid_len())
        {
            log::warning(log_cat, "ngtcp2 requested a {}B CID but the generator produces {}B CIDs", cidlen, gen.cid_len());
            return NGTCP2_ERR_CALLBACK_FAILURE;
        }
        if (static_secret.size() < STATIC_SECRET_MIN_SIZE)
        {
            log::warning(
                    log_cat,
                    "Static secret of {}B is too short to derive reset tokens (need {}B)",
                    static_secret.size(),
                    STATIC_SECRET_MIN_SIZE);
            return NGTCP2_ERR_CALLBACK_FAILURE;
        }

        ConnectionID fresh;
        try
        {
            fresh = gen.generate_cid();
        }
        catch (const random_source_error& e)
        {
            log::error(log_cat, "Failed to generate new CID: {}", e.what());
            return NGTCP2_ERR_CALLBACK_FAILURE;
        }

        *cid = fresh;

        if (ngtcp2_crypto_generate_stateless_reset_token(token, static_secret.data(), static_secret.size(), cid) != 0)
        {
            log::error(log_cat, "Failed to derive stateless reset token for CID: {}", fresh);
            return NGTCP2_ERR_CALLBACK_FAILURE;
        }

        log::trace(
                log_cat,
                "Generated new CID: {} with reset token {}",
                fresh,
                buffer_printer{token, NGTCP2_STATELESS_RESET_TOKENLEN});
        return 0;
    }

    std::optional<ConnectionID> packet_dcid(bstring_view pkt, size_t short_dcidlen)
    {
        if (pkt.empty())
            return std::nullopt;

        ngtcp2_version_cid vid;
        auto rv = ngtcp2_pkt_decode_version_cid(&vid, u8data(pkt), pkt.size(), short_dcidlen);

        if (rv != 0 && rv != NGTCP2_ERR_VERSION_NEGOTIATION)
        {
            log::debug(log_cat, "Error: failed to decode QUIC packet header [code: {}]", ngtcp2_strerror(rv));
            return std::nullopt;
        }

        if (vid.dcidlen > MAX_CID_SIZE)
        {
            log::debug(log_cat, "Error: destination ID is longer than MAX_CID_SIZE ({} > {})", vid.dcidlen, MAX_CID_SIZE);
            return std::nullopt;
        }

        return std::make_optional<ConnectionID>(vid.dcid, vid.dcidlen);
    }

    bool screen_packet(const ConnectionIDGenerator& gen, bstring_view pkt)
    {
        auto dcid = packet_dcid(pkt, gen.cid_len());
        if (!dcid)
            return false;

        auto first = static_cast<uint8_t>(pkt.front());
        if (first & HEADER_FORM_BIT)
        {
            auto version = oxenc::load_big_to_host<uint32_t>(pkt.data() + 1);
            if (peer_chosen_dcid(first, version))
                return true;
        }

        if (auto res = gen.validate(*dcid); res.failure())
        {
            log::debug(log_cat, "Dropping packet with unrecognized DCID: {}", *dcid);
            return false;
        }

        return true;
    }

}  // namespace quicid
