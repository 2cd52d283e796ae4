#ifndef IRIS_TX_COMMON
#define IRIS_TX_COMMON

#include <Iris/tree.hpp>

namespace Iris {

    // an amount of the smallest unit of value.
    struct nicks {
        constexpr static uint64 PerNock = 65536;

        uint64 Value;

        constexpr nicks (): Value {0} {}
        constexpr nicks (uint64 v): Value {v} {}

        constexpr explicit operator uint64 () const {
            return Value;
        }

        uint64 nocks () const {
            return Value / PerNock;
        }

        nicks saturating_sub (const nicks &n) const {
            return Value > n.Value ? nicks {Value - n.Value} : nicks {0};
        }

        // throw on overflow and underflow.
        nicks operator + (const nicks &) const;
        nicks operator - (const nicks &) const;
        nicks operator * (const nicks &) const;

        nicks &operator += (const nicks &n) {
            return *this = *this + n;
        }

        nicks &operator -= (const nicks &n) {
            return *this = *this - n;
        }

        bool operator == (const nicks &) const = default;
        auto operator <=> (const nicks &) const = default;

        noun to_noun () const {
            return noun {Value};
        }

        static maybe<nicks> from_noun (const noun &n) {
            maybe<uint64> v = n.to_uint64 ();
            if (!bool (v)) return {};
            return nicks {*v};
        }

        digest hash () const {
            return hash_belt (Value);
        }
    };

    // <nocks>.<nicks>
    std::ostream &operator << (std::ostream &, const nicks &);

    enum class version : uint32 {
        V0 = 0,
        V1 = 1,
        V2 = 2
    };

    std::ostream &operator << (std::ostream &, version);

    template <> struct codec<version> {
        static noun encode (const version &v) {
            return noun {uint64 (v)};
        }

        static maybe<version> decode (const noun &n) {
            maybe<uint64> v = n.to_uint64 ();
            if (!bool (v) || *v > 2) return {};
            return static_cast<version> (*v);
        }
    };

    template <> struct hasher<version> {
        static digest hash (const version &v) {
            return hash_belt (uint64 (v));
        }
    };

    using tx_id = digest;

    struct source {
        digest Hash;
        bool IsCoinbase;

        source (): Hash {}, IsCoinbase {false} {}
        source (const digest &h, bool coinbase): Hash {h}, IsCoinbase {coinbase} {}

        noun to_noun () const {
            return encode_tuple (Hash, IsCoinbase);
        }

        static maybe<source> from_noun (const noun &n) {
            source s {};
            if (!read_tuple (n, s.Hash, s.IsCoinbase)) return {};
            return s;
        }

        digest hash () const {
            return hash_tuple (Hash, IsCoinbase);
        }

        bool operator == (const source &) const = default;
    };

    // a range of block heights. Zero is the same as no bound.
    struct timelock_range {
        maybe<block_height> Min;
        maybe<block_height> Max;

        timelock_range (): Min {}, Max {} {}
        timelock_range (maybe<block_height> min, maybe<block_height> max);

        static timelock_range none () {
            return timelock_range {};
        }

        noun to_noun () const {
            return encode_tuple (Min, Max);
        }

        static maybe<timelock_range> from_noun (const noun &n) {
            timelock_range r {};
            if (!read_tuple (n, r.Min, r.Max)) return {};
            return r;
        }

        digest hash () const {
            return hash_tuple (Min, Max);
        }

        bool operator == (const timelock_range &) const = default;
    };

    struct timelock {
        // relative to the creation of the note.
        timelock_range Relative;
        timelock_range Absolute;

        timelock (): Relative {}, Absolute {} {}
        timelock (const timelock_range &rel, const timelock_range &abs): Relative {rel}, Absolute {abs} {}

        // coinbase outputs mature after 100 blocks.
        static timelock coinbase () {
            return timelock {timelock_range {block_height {100}, {}}, timelock_range::none ()};
        }

        static timelock none () {
            return timelock {};
        }

        noun to_noun () const {
            return encode_tuple (Relative, Absolute);
        }

        static maybe<timelock> from_noun (const noun &n) {
            timelock t {};
            if (!read_tuple (n, t.Relative, t.Absolute)) return {};
            return t;
        }

        digest hash () const {
            return hash_tuple (Relative, Absolute);
        }

        bool operator == (const timelock &) const = default;
    };

    struct timelock_intent {
        maybe<timelock> Timelock;

        timelock_intent (): Timelock {} {}
        explicit timelock_intent (const maybe<timelock> &t): Timelock {t} {}

        noun to_noun () const {
            return encode_noun (Timelock);
        }

        static maybe<timelock_intent> from_noun (const noun &n) {
            maybe<maybe<timelock>> t = decode_noun<maybe<timelock>> (n);
            if (!bool (t)) return {};
            return timelock_intent {*t};
        }

        digest hash () const {
            return hash_of (Timelock);
        }

        bool operator == (const timelock_intent &) const = default;
    };

    namespace legacy {
        struct sig;
    }

    // identifies a note.
    struct name {
        digest First;
        digest Last;

        name (): First {}, Last {} {}
        name (const digest &first, const digest &last): First {first}, Last {last} {}

        static name new_v1 (const digest &lock, const source &);
        static name new_v0 (const legacy::sig &owners, const source &, const timelock_intent &);

        // a terminating 0 follows the two digests.
        noun to_noun () const {
            return encode_tuple (First, Last, uint64 {0});
        }

        static maybe<name> from_noun (const noun &n) {
            name x {};
            uint64 sig;
            if (!read_tuple (n, x.First, x.Last, sig) || sig != 0) return {};
            return x;
        }

        digest hash () const {
            return hash_tuple (First, Last, uint64 {0});
        }

        bool operator == (const name &) const = default;
        auto operator <=> (const name &) const = default;
    };

    std::ostream &operator << (std::ostream &, const name &);

}

#endif
