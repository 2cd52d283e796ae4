#ifndef IRIS_CRYPTO_KEY
#define IRIS_CRYPTO_KEY

#include <Iris/codec.hpp>
#include <Iris/crypto/cheetah.hpp>

namespace Iris {

    // an integer mod the order of the Cheetah group.
    using scalar = uint512;

    const scalar &group_order ();

    // (a0 + p a1 + p^2 a2 + p^3 a3) mod n
    scalar truncate (const digest &);

    // sum of nonces, to be used by every party to a multi-signature.
    scalar combine_nonces (const std::vector<scalar> &);

    struct public_key {
        cheetah_point Point;

        public_key (): Point {} {}
        explicit public_key (const cheetah_point &p): Point {p} {}

        bool valid () const;

        // [[x0 .. x5] [y0 .. y5] inf], the coefficients of each coordinate.
        noun to_noun () const;
        static maybe<public_key> from_noun (const noun &);

        digest hash () const {
            return to_noun ().hash ();
        }

        // 0x01 followed by the coordinates y then x, each as six big-endian belts, most significant first.
        std::array<byte, 97> to_bytes () const;
        static maybe<public_key> from_bytes (const bytes &);

        std::string to_base58 () const;
        static maybe<public_key> read_base58 (const std::string &);

        bool operator == (const public_key &) const = default;
        auto operator <=> (const public_key &) const = default;
    };

    std::ostream inline &operator << (std::ostream &o, const public_key &p) {
        return o << p.to_base58 ();
    }

    // nothing if the sum is the point at infinity.
    maybe<public_key> combine (const std::vector<public_key> &);

    struct signature {
        scalar Challenge;
        scalar Signature;

        signature (): Challenge {0}, Signature {0} {}
        signature (const scalar &c, const scalar &s): Challenge {c}, Signature {s} {}

        // [[c0 .. c7] [s0 .. s7]], 32 bit limbs, least significant first.
        noun to_noun () const;
        static maybe<signature> from_noun (const noun &);

        digest hash () const {
            return to_noun ().hash ();
        }

        bool verify (const public_key &, const digest &message) const;

        bool operator == (const signature &) const = default;
    };

    // nothing if the challenges differ.
    maybe<signature> aggregate (const signature &, const signature &);

    // The secret is erased when the key is destroyed and is never copied.
    struct private_key {
        explicit private_key (const std::array<byte, 32> &);

        private_key (const private_key &) = delete;
        private_key &operator = (const private_key &) = delete;

        private_key (private_key &&);
        private_key &operator = (private_key &&);

        ~private_key ();

        static maybe<private_key> read_hex (const std::string &);

        public_key to_public () const;

        // deterministic nonce for a message.
        scalar nonce_for (const digest &message) const;

        signature sign (const digest &message) const;

        // sign as one party of a multi-signature. The nonce is the combined
        // nonce of all parties and the key is their combined public key.
        signature sign_multi (const digest &message, const scalar &nonce, const public_key &combined) const;

    private:
        std::array<byte, 32> Secret;
    };

}

#endif
