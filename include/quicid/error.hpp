#pragma once

#include "utils.hpp"

namespace quicid
{
    // Marker returned (via validate_result) when a generator does not recognize a connection ID.
    // Deliberately carries nothing about *why* the ID was rejected.
    struct invalid_cid final
    {};

    inline constexpr invalid_cid INVALID_CID{};

    // Struct returned as the result of ConnectionIDGenerator::validate that is explicitly
    // convertible to bool.  Default construction is a "good" result; constructing from invalid_cid
    // makes a rejection.
    struct validate_result
    {
        validate_result() = default;

        validate_result(invalid_cid) : _valid{false} {}

        // Returns true if the connection ID was accepted
        bool success() const { return _valid; }
        // Returns true if the connection ID was rejected
        bool failure() const { return !success(); }

        explicit operator bool() const { return success(); }

        bool operator==(const validate_result& other) const { return _valid == other._valid; }
        bool operator!=(const validate_result& other) const { return !(*this == other); }

        std::string_view to_string() const { return _valid ? "valid"sv : "invalid"sv; }

      private:
        bool _valid{true};
    };

    /// Thrown when the secure random source fails to produce bytes.  There is no fallback: a
    /// generator that cannot get randomness must not hand out a low-entropy connection ID.
    class random_source_error : public std::runtime_error
    {
      public:
        int code;

        explicit random_source_error(int gnutls_errcode) :
                std::runtime_error{"secure random source failure: "s + gnutls_strerror(gnutls_errcode)},
                code{gnutls_errcode}
        {}
    };

}  // namespace quicid
