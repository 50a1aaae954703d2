#pragma once

#include <type_traits>

extern "C"
{
#include <gnutls/crypto.h>
#include <gnutls/gnutls.h>
#include <ngtcp2/ngtcp2.h>
}

#include <oxenc/endian.h>
#include <oxenc/hex.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace quicid
{
    using namespace std::literals;
    using bstring = std::basic_string<std::byte>;
    using ustring = std::basic_string<unsigned char>;
    using bstring_view = std::basic_string_view<std::byte>;
    using ustring_view = std::basic_string_view<unsigned char>;

    // Largest connection ID permitted by QUIC v1 (RFC 9000, section 17.2); ngtcp2 sizes its
    // ngtcp2_cid storage to exactly this.
    inline constexpr size_t MAX_CID_SIZE = NGTCP2_MAX_CIDLEN;

    // CID length used by the random generator when none is configured.
    inline constexpr size_t DEFAULT_CID_SIZE = 8;

    // strang literals
    inline ustring operator""_us(const char* str, size_t len) noexcept
    {
        return {reinterpret_cast<const unsigned char*>(str), len};
    }
    inline ustring_view operator""_usv(const char* str, size_t len) noexcept
    {
        return {reinterpret_cast<const unsigned char*>(str), len};
    }

    template <typename T>
    using remove_cvref_t = std::remove_cv_t<std::remove_reference_t<T>>;

    // Shortcut for a const-preserving `reinterpret_cast`ing c.data() from a std::byte to a uint8_t
    // pointer, because we need it all over the place in the ngtcp2 API
    template <
            typename Container,
            typename = std::enable_if_t<sizeof(typename std::remove_reference_t<Container>::value_type) == sizeof(uint8_t)>>
    auto* u8data(Container&& c)
    {
        using u8_sameconst_t =
                std::conditional_t<std::is_const_v<std::remove_pointer_t<decltype(c.data())>>, const uint8_t, uint8_t>;
        return reinterpret_cast<u8_sameconst_t*>(c.data());
    }

    // Stringview conversion function to interoperate between bstring_views and any other potential
    // user supplied type
    template <typename CharOut, typename CharIn, typename = std::enable_if_t<sizeof(CharOut) == 1 && sizeof(CharIn) == 1>>
    std::basic_string_view<CharOut> convert_sv(std::basic_string_view<CharIn> in)
    {
        return {reinterpret_cast<const CharOut*>(in.data()), in.size()};
    }

    /// Fills `size` bytes at `dest` from the gnutls random source at the given level.  Throws
    /// random_source_error (see error.hpp) if gnutls reports a failure; never returns with the buffer
    /// partially or weakly filled.
    void fill_random(void* dest, size_t size, gnutls_rnd_level_t level = GNUTLS_RND_RANDOM);

}  // namespace quicid
