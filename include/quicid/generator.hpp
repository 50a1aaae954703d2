#pragma once

#include <array>

#include "connection_ids.hpp"
#include "error.hpp"
#include "opt.hpp"
#include "utils.hpp"

namespace quicid
{
    class ConnectionIDGenerator;

    // True if every Opt is something other than a generator, so that variadic option constructors
    // never shadow the copy constructor.
    template <typename... Opt>
    inline constexpr bool not_a_generator = (!std::is_base_of_v<ConnectionIDGenerator, remove_cvref_t<Opt>> && ...);

    /// Source of connection IDs for locally-initiated (source) CIDs of an endpoint.
    ///
    /// Connection IDs MUST NOT contain any information that can be used by an external observer
    /// (that is, one that does not cooperate with the issuer) to correlate them with other connection
    /// IDs for the same connection.  They MUST have high entropy, e.g. from encrypted data or
    /// cryptographic-grade random data.
    ///
    /// generate_cid() is non-const and calls to it must be externally serialized (one generator per
    /// endpoint event loop, or a lock around it).  The const members are safe to call concurrently.
    class ConnectionIDGenerator
    {
      public:
        virtual ~ConnectionIDGenerator() = default;

        /// Generates a new connection ID of exactly cid_len() bytes.  Throws random_source_error if
        /// the secure random source fails.
        virtual ConnectionID generate_cid() = 0;

        /// Quickly determines whether `cid` could have been generated by this generator.  False
        /// positives are permitted (but increase the cost of handling invalid packets); false
        /// negatives never are.  The default accepts everything.
        virtual validate_result validate(const ConnectionID& /* cid */) const { return {}; }

        /// Length of every connection ID this generator produces; constant for the generator's life.
        virtual size_t cid_len() const = 0;

        /// How long issued connection IDs should be used before being retired, if at all.  Assumed to
        /// be constant.
        virtual std::optional<std::chrono::milliseconds> cid_lifetime() const = 0;
    };

    /// Generates purely random connection IDs of a fixed length.
    ///
    /// Random CIDs can be shorter than those of HashedConnectionIDGenerator, but cannot be usefully
    /// validated: validate() accepts everything.
    ///
    /// Accepts opt::cid_length (default 8 bytes) and opt::cid_lifetime.
    class RandomConnectionIDGenerator final : public ConnectionIDGenerator
    {
      public:
        template <typename... Opt>
            requires not_a_generator<Opt...>
        explicit RandomConnectionIDGenerator(Opt&&... opts)
        {
            ((void)handle_gen_opt(std::forward<Opt>(opts)), ...);
            _log_created();
        }

        RandomConnectionIDGenerator(const RandomConnectionIDGenerator&) = default;
        RandomConnectionIDGenerator& operator=(const RandomConnectionIDGenerator&) = default;

        /// Sets the lifetime of connection IDs created by this generator
        RandomConnectionIDGenerator& set_lifetime(std::chrono::milliseconds d);

        ConnectionID generate_cid() override;

        // Provides the length of dst_cid in short header packets
        size_t cid_len() const override { return _cid_len; }

        std::optional<std::chrono::milliseconds> cid_lifetime() const override { return _lifetime; }

      private:
        size_t _cid_len{DEFAULT_CID_SIZE};
        std::optional<std::chrono::milliseconds> _lifetime;

        void handle_gen_opt(opt::cid_length len);
        void handle_gen_opt(opt::cid_lifetime lifetime);

        // Takes a std::optional-wrapped option that does nothing if the optional is empty,
        // otherwise passes it through to the above.  This is here to allow runtime-dependent
        // options (i.e. where whether or not the option is required is not known at compile time).
        template <typename Opt>
        void handle_gen_opt(std::optional<Opt> option)
        {
            if (option)
                handle_gen_opt(std::move(*option));
        }

        void _log_created() const;
    };

    /// Generates 8-byte connection IDs that can be efficiently validated.
    ///
    /// Each ID is a 3-byte random nonce followed by a 5-byte signature: the low-order bytes of a
    /// keyed, non-cryptographic hash of the nonce.  The hash can still be spoofed, but the check lets
    /// an endpoint discard non-QUIC and stray packets at very low cost before any connection lookup.
    ///
    /// Accepts opt::hash_key (default: a random key) and opt::cid_lifetime.  Constructing two
    /// generators with the same hash_key gives generators that accept each other's connection IDs,
    /// which is how an endpoint keeps recognizing its IDs across a restart.
    class HashedConnectionIDGenerator final : public ConnectionIDGenerator
    {
      public:
        // Good for more than 16 million connections
        static constexpr size_t NONCE_LEN = 3;
        static constexpr size_t CID_LEN = 8;
        static constexpr size_t SIGNATURE_LEN = CID_LEN - NONCE_LEN;

        template <typename... Opt>
            requires not_a_generator<Opt...>
        explicit HashedConnectionIDGenerator(Opt&&... opts)
        {
            ((void)handle_gen_opt(std::forward<Opt>(opts)), ...);
            if (!_key)
                _key = random_key();
            _log_created();
        }

        // Non-copyable: the key is fixed for the generator's life, and a copy would silently share
        // the secret.  Use opt::hash_key{gen.key()} to deliberately build a generator with the same key.
        HashedConnectionIDGenerator(const HashedConnectionIDGenerator&) = delete;
        HashedConnectionIDGenerator& operator=(const HashedConnectionIDGenerator&) = delete;

        /// Sets the lifetime of connection IDs created by this generator
        HashedConnectionIDGenerator& set_lifetime(std::chrono::milliseconds d);

        ConnectionID generate_cid() override;

        validate_result validate(const ConnectionID& cid) const override;

        size_t cid_len() const override { return CID_LEN; }

        std::optional<std::chrono::milliseconds> cid_lifetime() const override { return _lifetime; }

        // The secret in use; persist this (e.g. as opt::hash_key{gen.key()}) to keep validating the
        // same connection IDs after a restart.
        uint64_t key() const { return *_key; }

      private:
        std::optional<uint64_t> _key;
        std::optional<std::chrono::milliseconds> _lifetime;

        void handle_gen_opt(opt::hash_key key);
        void handle_gen_opt(opt::cid_lifetime lifetime);

        template <typename Opt>
        void handle_gen_opt(std::optional<Opt> option)
        {
            if (option)
                handle_gen_opt(std::move(*option));
        }

        static uint64_t random_key();

        // Computes the full 8-byte little-endian digest of key || nonce; the first SIGNATURE_LEN
        // bytes are the signature.
        std::array<uint8_t, 8> digest(const uint8_t* nonce) const;

        void _log_created() const;
    };

}  // namespace quicid
