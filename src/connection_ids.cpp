#include "connection_ids.hpp"

#include "format.hpp"
#include "internal.hpp"

namespace quicid
{
    ConnectionID::ConnectionID(const uint8_t* cid, size_t length) : ngtcp2_cid{}
    {
        if (length > MAX_CID_SIZE)
            throw std::invalid_argument{"ConnectionID of {} bytes exceeds the maximum of {}"_format(length, MAX_CID_SIZE)};
        datalen = length;
        if (length)
            std::memmove(data, cid, datalen);
    }

    ConnectionID ConnectionID::from_hex(std::string_view hex)
    {
        if (hex.size() % 2 != 0 || !oxenc::is_hex(hex))
            throw std::invalid_argument{"ConnectionID::from_hex requires an even number of hex digits"};
        if (hex.size() / 2 > MAX_CID_SIZE)
            throw std::invalid_argument{
                    "ConnectionID of {} bytes exceeds the maximum of {}"_format(hex.size() / 2, MAX_CID_SIZE)};

        ConnectionID cid;
        cid.datalen = hex.size() / 2;
        oxenc::from_hex(hex.begin(), hex.end(), cid.data);
        return cid;
    }

    std::string ConnectionID::to_string() const
    {
        return oxenc::to_hex(data, data + datalen);
    }

    std::string buffer_printer::to_string() const
    {
        return oxenc::to_hex(buf.begin(), buf.end());
    }

}  // namespace quicid
