#pragma once

#include <CLI/CLI.hpp>
#include <oxen/log.hpp>
#include <quicid.hpp>
#include <string>
#include <vector>

#include "internal.hpp"

namespace quicid
{
    inline auto test_cat = oxen::log::Cat("test");

    void add_log_opts(CLI::App& cli, std::string& file, std::string& level);

    void setup_logging(std::string out, const std::string& level);

    namespace test
    {
        // Returns a copy of `cid` with bit `bit` (0 = MSB of the first byte) inverted.
        ConnectionID flip_bit(const ConnectionID& cid, size_t bit);

        // Builds a minimal 1-RTT (short header) packet addressed to `dcid`, followed by `payload`
        // bytes of filler.
        bstring short_header_packet(const ConnectionID& dcid, size_t payload = 32);

        // Builds a minimal long header packet of the given 2-bit `type` and `version`, addressed to
        // `dcid` with an empty SCID, followed by `payload` bytes of filler.
        bstring long_header_packet(
                uint8_t type, uint32_t version, const ConnectionID& dcid, size_t payload = 32);

        // A 32-byte fixed secret for stateless reset token derivation.
        inline const ustring STATIC_SECRET = "0123456789abcdef0123456789abcdef"_us;
    }  // namespace test

}  // namespace quicid
