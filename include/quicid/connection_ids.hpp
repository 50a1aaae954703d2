#pragma once

#include <cstddef>

#include "formattable.hpp"
#include "utils.hpp"

namespace quicid
{
    // Wrapper for ngtcp2_cid with helper functionalities to make it passable.  A ConnectionID is an
    // opaque 0 to MAX_CID_SIZE byte token; equality is byte-wise (including length) and nothing about
    // its internal structure is exposed.
    struct alignas(size_t) ConnectionID final : ngtcp2_cid
    {
        ConnectionID() : ngtcp2_cid{} {}
        ConnectionID(const ConnectionID& c) = default;
        ConnectionID(const ngtcp2_cid& c) : ConnectionID(c.data, c.datalen) {}
        ConnectionID(const uint8_t* cid, size_t length);

        // Constructed from any byte-sized string_view (bstring_view, ustring_view, etc.)
        template <typename T, typename = std::enable_if_t<sizeof(T) == 1>>
        explicit ConnectionID(std::basic_string_view<T> bytes) :
                ConnectionID(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size())
        {}

        ConnectionID& operator=(const ConnectionID& c) = default;

        inline bool operator==(const ConnectionID& other) const
        {
            return datalen == other.datalen && std::memcmp(data, other.data, datalen) == 0;
        }
        inline bool operator!=(const ConnectionID& other) const { return !(*this == other); }

        size_t size() const { return datalen; }
        bool empty() const { return datalen == 0; }

        // Not begin()/end(): that would make fmt treat ConnectionID as a range rather than use
        // to_string().
        ustring_view view() const { return {data, datalen}; }

        // Parses a hex-encoded connection ID; throws std::invalid_argument if the input is not valid
        // hex or decodes to more than MAX_CID_SIZE bytes.
        static ConnectionID from_hex(std::string_view hex);

        std::string to_string() const;
    };
}  // namespace quicid

namespace std
{
    // Custom hash is required s.t. unordered containers can be keyed on ConnectionID.  Only the first
    // `datalen` bytes participate.
    template <>
    struct hash<quicid::ConnectionID>
    {
        size_t operator()(const quicid::ConnectionID& cid) const
        {
            return std::hash<std::string_view>{}(
                    std::string_view{reinterpret_cast<const char*>(cid.data), cid.datalen});
        }
    };
}  // namespace std
