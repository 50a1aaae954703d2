#pragma once

#include "connection_ids.hpp"
#include "generator.hpp"
#include "utils.hpp"

namespace quicid
{
    // Minimum static secret size accepted by new_connection_id for deriving stateless reset tokens.
    inline constexpr size_t STATIC_SECRET_MIN_SIZE = 16;

    /// Body of an ngtcp2 `get_new_connection_id` callback backed by a generator: mints a connection
    /// ID into `cid` and derives its stateless reset token (NGTCP2_STATELESS_RESET_TOKENLEN bytes
    /// written to `token`) from `static_secret`.
    ///
    /// Returns 0 on success.  Returns NGTCP2_ERR_CALLBACK_FAILURE if ngtcp2 asked for a length other
    /// than gen.cid_len(), if the secret is too short, or if the random source or token derivation
    /// fails; ngtcp2 treats that as fatal to the connection.
    int new_connection_id(
            ConnectionIDGenerator& gen, ngtcp2_cid* cid, uint8_t* token, size_t cidlen, ustring_view static_secret);

    /// Extracts the destination connection ID from an inbound datagram.  Long header packets carry
    /// their own DCID length; short header packets are assumed to use `short_dcidlen` bytes.
    /// Returns nullopt if the header cannot be parsed.
    std::optional<ConnectionID> packet_dcid(bstring_view pkt, size_t short_dcidlen);

    /// Cheap pre-lookup triage of an inbound datagram: returns true if the packet's destination
    /// connection ID decodes and passes gen.validate(), false otherwise.
    bool screen_packet(const ConnectionIDGenerator& gen, bstring_view pkt);

}  // namespace quicid
