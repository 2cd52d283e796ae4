#include <Iris/crypto/key.hpp>
#include <data/encoding/base58.hpp>
#include <data/encoding/hex.hpp>
#include <atomic>
#include <type_traits>

namespace Iris {

    namespace {

        constexpr std::size_t CoordinateBelts = 6;

        void erase (byte *b, std::size_t size) {
            volatile byte *v = b;
            for (std::size_t i = 0; i < size; i++) v[i] = 0;
            std::atomic_signal_fence (std::memory_order_seq_cst);
        }

        void erase (scalar &x) {
            auto &backend = x.backend ();
            auto *limbs = backend.limbs ();
            volatile std::remove_pointer_t<decltype (limbs)> *v = limbs;
            for (std::size_t i = 0; i < backend.size (); i++) v[i] = 0;
            std::atomic_signal_fence (std::memory_order_seq_cst);
            x = 0;
        }

        uint512 read_be (const byte *b, std::size_t size) {
            uint512 x = 0;
            for (std::size_t i = 0; i < size; i++) x = (x << 8) | b[i];
            return x;
        }

        bool valid_secret (const std::array<byte, 32> &secret) {
            scalar x = read_be (secret.data (), secret.size ());
            bool ok = x != 0 && x < group_order ();
            erase (x);
            return ok;
        }

        // the 32-bit limbs of a scalar, least significant first.
        std::vector<belt> limbs (uint512 x) {
            std::vector<belt> b {};
            for (int i = 0; i < 8; i++) {
                b.push_back (static_cast<uint64> (x & 0xffffffff));
                x >>= 32;
            }
            return b;
        }

        maybe<scalar> read_limbs (const noun &n) {
            std::array<uint64, 8> l;
            if (!read_tuple (n, l[0], l[1], l[2], l[3], l[4], l[5], l[6], l[7])) return {};
            scalar x = 0;
            for (int i = 7; i >= 0; i--) {
                if (l[i] > 0xffffffff) return {};
                x = (x << 32) | l[i];
            }
            return x;
        }

        noun coordinate_noun (const f6 &c) {
            const auto &b = c.Coefficients;
            return tuple_noun ({b[0], b[1], b[2], b[3], b[4], b[5]});
        }

        maybe<f6> read_coordinate (const noun &n) {
            f6 c {};
            auto &b = c.Coefficients;
            if (!read_tuple (n, b[0], b[1], b[2], b[3], b[4], b[5]) || !c.valid ()) return {};
            return c;
        }

        void append (std::vector<belt> &v, const f6 &c) {
            v.insert (v.end (), c.Coefficients.begin (), c.Coefficients.end ());
        }

        void write_coordinate (byte *b, const f6 &c) {
            for (int i = CoordinateBelts - 1; i >= 0; i--)
                for (int j = 7; j >= 0; j--) *b++ = static_cast<byte> (c.Coefficients[i] >> (8 * j));
        }

        f6 read_coordinate (const byte *b) {
            f6 c {};
            for (int i = CoordinateBelts - 1; i >= 0; i--)
                for (int j = 0; j < 8; j++) c.Coefficients[i] = (c.Coefficients[i] << 8) | *b++;
            return c;
        }

        scalar challenge (const cheetah_point &r, const cheetah_point &p, const digest &m) {
            std::vector<belt> input {};
            append (input, r.X);
            append (input, r.Y);
            append (input, p.X);
            append (input, p.Y);
            input.insert (input.end (), m.Belts.begin (), m.Belts.end ());
            return truncate (digest {hash_varlen (input)});
        }

    }

    const scalar &group_order () {
        return cheetah_order ();
    }

    scalar truncate (const digest &d) {
        uint512 x = 0;
        uint512 power = 1;
        for (int i = 0; i < 4; i++) {
            x += power * d.Belts[i];
            power *= Prime;
        }
        return x % group_order ();
    }

    scalar combine_nonces (const std::vector<scalar> &nonces) {
        scalar x = 0;
        for (const scalar &n : nonces) x = (x + n) % group_order ();
        return x;
    }

    bool public_key::valid () const {
        return !Point.Infinity && Point.on_curve ();
    }

    noun public_key::to_noun () const {
        return tuple_noun ({coordinate_noun (Point.X), coordinate_noun (Point.Y), encode_noun (Point.Infinity)});
    }

    maybe<public_key> public_key::from_noun (const noun &n) {
        noun x, y;
        bool inf {};
        if (!read_tuple (n, x, y, inf) || inf) return {};

        maybe<f6> fx = read_coordinate (x);
        maybe<f6> fy = read_coordinate (y);
        if (!bool (fx) || !bool (fy)) return {};

        public_key p {cheetah_point {*fx, *fy}};
        if (!p.valid ()) return {};
        return p;
    }

    std::array<byte, 97> public_key::to_bytes () const {
        std::array<byte, 97> b {};
        b[0] = 0x01;
        write_coordinate (b.data () + 1, Point.Y);
        write_coordinate (b.data () + 49, Point.X);
        return b;
    }

    maybe<public_key> public_key::from_bytes (const bytes &b) {
        if (b.size () != 97 || b[0] != 0x01) return {};
        public_key p {cheetah_point {read_coordinate (b.data () + 49), read_coordinate (b.data () + 1)}};
        if (!p.valid ()) return {};
        return p;
    }

    std::string public_key::to_base58 () const {
        std::array<byte, 97> b = to_bytes ();
        bytes x {};
        for (const byte &z : b) x.push_back (z);
        return encoding::base58::write (x);
    }

    maybe<public_key> public_key::read_base58 (const std::string &str) {
        maybe<bytes> b = encoding::base58::read (str);
        if (!bool (b)) return {};
        return from_bytes (*b);
    }

    maybe<public_key> combine (const std::vector<public_key> &keys) {
        if (keys.size () == 0) return {};
        cheetah_point sum {};
        for (const public_key &p : keys) {
            if (!p.valid ()) return {};
            sum = sum + p.Point;
        }
        if (sum.Infinity) return {};
        return public_key {sum};
    }

    noun signature::to_noun () const {
        std::vector<belt> c = limbs (Challenge);
        std::vector<belt> s = limbs (Signature);
        return noun {
            tuple_noun ({c[0], c[1], c[2], c[3], c[4], c[5], c[6], c[7]}),
            tuple_noun ({s[0], s[1], s[2], s[3], s[4], s[5], s[6], s[7]})};
    }

    maybe<signature> signature::from_noun (const noun &n) {
        if (!n.is_cell ()) return {};
        maybe<scalar> c = read_limbs (n.head ());
        maybe<scalar> s = read_limbs (n.tail ());
        if (!bool (c) || !bool (s)) return {};
        return signature {*c, *s};
    }

    bool signature::verify (const public_key &p, const digest &m) const {
        const scalar &n = group_order ();
        if (Challenge == 0 || Challenge >= n || Signature == 0 || Signature >= n) return false;
        if (!p.valid ()) return false;

        // sG - cP
        cheetah_point r = Signature * cheetah_point::generator () + -(Challenge * p.Point);
        if (r.Infinity) return false;

        return challenge (r, p.Point, m) == Challenge;
    }

    maybe<signature> aggregate (const signature &a, const signature &b) {
        if (a.Challenge != b.Challenge) return {};
        return signature {a.Challenge, (a.Signature + b.Signature) % group_order ()};
    }

    private_key::private_key (const std::array<byte, 32> &secret): Secret {secret} {
        if (!valid_secret (Secret)) {
            erase (Secret.data (), Secret.size ());
            throw data::exception {} << "invalid secret key";
        }
    }

    private_key::private_key (private_key &&k): Secret {k.Secret} {
        erase (k.Secret.data (), k.Secret.size ());
    }

    private_key &private_key::operator = (private_key &&k) {
        if (this != &k) {
            Secret = k.Secret;
            erase (k.Secret.data (), k.Secret.size ());
        }
        return *this;
    }

    private_key::~private_key () {
        erase (Secret.data (), Secret.size ());
    }

    maybe<private_key> private_key::read_hex (const std::string &str) {
        maybe<bytes> b = encoding::hex::read (str);
        if (!bool (b) || b->size () != 32) return {};

        std::array<byte, 32> secret;
        for (std::size_t i = 0; i < 32; i++) secret[i] = (*b)[i];
        erase (b->data (), b->size ());

        if (!valid_secret (secret)) {
            erase (secret.data (), secret.size ());
            return {};
        }

        maybe<private_key> k {private_key {secret}};
        erase (secret.data (), secret.size ());
        return k;
    }

    public_key private_key::to_public () const {
        scalar x = read_be (Secret.data (), Secret.size ());
        cheetah_point p = x * cheetah_point::generator ();
        erase (x);
        return public_key {p};
    }

    scalar private_key::nonce_for (const digest &m) const {
        public_key p = to_public ();
        std::vector<belt> input {};
        append (input, p.Point.X);
        append (input, p.Point.Y);
        input.insert (input.end (), m.Belts.begin (), m.Belts.end ());

        // the secret as eight 32-bit limbs, least significant first.
        for (int i = 7; i >= 0; i--)
            input.push_back (static_cast<uint64> (Secret[4 * i]) << 24 | static_cast<uint64> (Secret[4 * i + 1]) << 16 |
                static_cast<uint64> (Secret[4 * i + 2]) << 8 | static_cast<uint64> (Secret[4 * i + 3]));

        return truncate (digest {hash_secret (input)});
    }

    signature private_key::sign (const digest &m) const {
        return sign_multi (m, nonce_for (m), to_public ());
    }

    signature private_key::sign_multi (const digest &m, const scalar &nonce, const public_key &combined) const {
        cheetah_point r = nonce * cheetah_point::generator ();
        if (r.Infinity) throw data::exception {} << "invalid nonce";

        scalar c = challenge (r, combined.Point, m);
        if (c == 0) throw data::exception {} << "invalid challenge";

        const scalar &n = group_order ();
        scalar x = read_be (Secret.data (), Secret.size ());
        scalar k = nonce_for (m);

        // s = k + c * secret
        scalar s = (k + c * x % n) % n;
        erase (x);
        erase (k);

        return signature {c, s};
    }

}
