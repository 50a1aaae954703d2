#include "utils.hpp"

#include <algorithm>
#include <array>

namespace quicid
{
    ConnectionID test::flip_bit(const ConnectionID& cid, size_t bit)
    {
        ConnectionID out{cid};
        out.data[bit / 8] ^= static_cast<uint8_t>(0x80 >> (bit % 8));
        return out;
    }

    bstring test::short_header_packet(const ConnectionID& dcid, size_t payload)
    {
        bstring pkt;
        pkt.push_back(std::byte{0x40});
        pkt.append(convert_sv<std::byte>(dcid.view()));
        pkt.append(payload, std::byte{0xaa});
        return pkt;
    }

    bstring test::long_header_packet(uint8_t type, uint32_t version, const ConnectionID& dcid, size_t payload)
    {
        bstring pkt;
        pkt.push_back(static_cast<std::byte>(0xc0 | ((type & 0x03) << 4)));

        std::array<std::byte, 4> ver;
        oxenc::write_host_as_big(version, ver.data());
        pkt.append(ver.begin(), ver.end());

        pkt.push_back(static_cast<std::byte>(dcid.size()));
        pkt.append(convert_sv<std::byte>(dcid.view()));
        pkt.push_back(std::byte{0});  // SCID length
        pkt.append(payload, std::byte{0xaa});
        return pkt;
    }

    void add_log_opts(CLI::App& cli, std::string& file, std::string& level)
    {
        file = "stderr";
        level = "info";

        cli.add_option("-l,--log-file", file, "Log output filename, or one of stdout/-/stderr/syslog.")
                ->type_name("FILE")
                ->capture_default_str();

        cli.add_option("-L,--log-level", level, "Log verbosity level; one of trace, debug, info, warn, error, critical, off")
                ->type_name("LEVEL")
                ->capture_default_str()
                ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}));
    }

    void setup_logging(std::string out, const std::string& level)
    {
        log::Level lvl = log::level_from_string(level);

        constexpr std::array print_vals = {"stdout", "-", "", "stderr", "nocolor", "stdout-nocolor", "stderr-nocolor"};
        log::Type type;
        if (std::count(print_vals.begin(), print_vals.end(), out))
            type = log::Type::Print;
        else if (out == "syslog")
            type = log::Type::System;
        else
            type = log::Type::File;

        logger_config(out, type, lvl);
    }

}  // namespace quicid
