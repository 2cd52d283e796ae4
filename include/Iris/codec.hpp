#ifndef IRIS_CODEC
#define IRIS_CODEC

#include <Iris/noun.hpp>
#include <limits>

namespace Iris {

    // By default a type X provides
    //     noun X::to_noun () const;
    //     static maybe<X> X::from_noun (const noun &);
    //     digest X::hash () const;
    template <typename X> struct codec {
        static noun encode (const X &x) {
            return x.to_noun ();
        }

        static maybe<X> decode (const noun &n) {
            return X::from_noun (n);
        }
    };

    template <typename X> struct hasher {
        static digest hash (const X &x) {
            return x.hash ();
        }
    };

    template <typename X> noun inline encode_noun (const X &x) {
        return codec<X>::encode (x);
    }

    template <typename X> maybe<X> inline decode_noun (const noun &n) {
        return codec<X>::decode (n);
    }

    template <typename X> digest inline hash_of (const X &x) {
        return hasher<X>::hash (x);
    }

    // a tuple nests to the right: (a, b, c) is (a, (b, c)).
    template <typename X> digest inline hash_tuple (const X &x) {
        return hash_of (x);
    }

    template <typename X, typename Y, typename ... Z> digest inline hash_tuple (const X &x, const Y &y, const Z &... z) {
        return hash_pair (hash_of (x), hash_tuple (y, z...));
    }

    template <typename X> noun inline encode_tuple (const X &x) {
        return encode_noun (x);
    }

    template <typename X, typename Y, typename ... Z> noun inline encode_tuple (const X &x, const Y &y, const Z &... z) {
        return noun {encode_noun (x), encode_tuple (y, z...)};
    }

    // decode a tuple into the given references. False if the noun has the wrong shape.
    template <typename X> bool read_tuple (const noun &n, X &x) {
        maybe<X> m = decode_noun<X> (n);
        if (!bool (m)) return false;
        x = *m;
        return true;
    }

    template <typename X, typename Y, typename ... Z> bool read_tuple (const noun &n, X &x, Y &y, Z &... z) {
        if (!n.is_cell ()) return false;
        return read_tuple (n.head (), x) && read_tuple (n.tail (), y, z...);
    }

    // the empty tuple.
    struct unit {
        bool operator == (const unit &) const {
            return true;
        }
    };

    template <> struct codec<uint64> {
        static noun encode (const uint64 &x) {
            return noun {x};
        }

        static maybe<uint64> decode (const noun &n) {
            return n.to_uint64 ();
        }
    };

    template <> struct hasher<uint64> {
        static digest hash (const uint64 &x) {
            return hash_belt (x);
        }
    };

    template <> struct codec<uint32> {
        static noun encode (const uint32 &x) {
            return noun {uint64 (x)};
        }

        static maybe<uint32> decode (const noun &n) {
            maybe<uint64> x = n.to_uint64 ();
            if (!bool (x) || *x > std::numeric_limits<uint32>::max ()) return {};
            return static_cast<uint32> (*x);
        }
    };

    template <> struct hasher<uint32> {
        static digest hash (const uint32 &x) {
            return hash_belt (x);
        }
    };

    // a loobean: 0 is true.
    template <> struct codec<bool> {
        static noun encode (const bool &b) {
            return noun {uint64 (b ? 0 : 1)};
        }

        static maybe<bool> decode (const noun &n) {
            maybe<uint64> x = n.to_uint64 ();
            if (!bool (x) || *x > 1) return {};
            return *x == 0;
        }
    };

    template <> struct hasher<bool> {
        static digest hash (const bool &b) {
            return hash_belt (b ? 0 : 1);
        }
    };

    template <> struct codec<std::string> {
        static noun encode (const std::string &x) {
            return noun::cord (x);
        }

        static maybe<std::string> decode (const noun &n) {
            return n.to_cord ();
        }
    };

    // the bytes of the string packed little endian into one belt.
    template <> struct hasher<std::string> {
        static digest hash (const std::string &x) {
            uint64 packed = 0;
            for (std::size_t i = 0; i < x.size (); i++)
                packed |= static_cast<uint64> (static_cast<byte> (x[i])) << ((8 * i) % 64);
            return hash_belt (packed);
        }
    };

    template <> struct codec<noun> {
        static noun encode (const noun &n) {
            return n;
        }

        static maybe<noun> decode (const noun &n) {
            return n;
        }
    };

    template <> struct codec<unit> {
        static noun encode (const unit &) {
            return noun {};
        }

        static maybe<unit> decode (const noun &n) {
            maybe<uint64> x = n.to_uint64 ();
            if (!bool (x) || *x != 0) return {};
            return unit {};
        }
    };

    template <> struct hasher<unit> {
        static digest hash (const unit &) {
            return hash_belt (0);
        }
    };

    template <> struct codec<digest> {
        static noun encode (const digest &d) {
            return tuple_noun ({d.Belts[0], d.Belts[1], d.Belts[2], d.Belts[3], d.Belts[4]});
        }

        static maybe<digest> decode (const noun &n) {
            digest d {};
            if (!read_tuple (n, d.Belts[0], d.Belts[1], d.Belts[2], d.Belts[3], d.Belts[4])) return {};
            for (const belt &b : d.Belts) if (!based (b)) return {};
            return d;
        }
    };

    // none is 0, some v is [0 v].
    template <typename X> struct codec<maybe<X>> {
        static noun encode (const maybe<X> &x) {
            if (!bool (x)) return noun {};
            return noun {noun {}, encode_noun (*x)};
        }

        static maybe<maybe<X>> decode (const noun &n) {
            if (n.is_atom ()) {
                maybe<uint64> z = n.to_uint64 ();
                if (!bool (z) || *z != 0) return {};
                return maybe<maybe<X>> {maybe<X> {}};
            }

            maybe<uint64> z = n.head ().to_uint64 ();
            if (!bool (z) || *z != 0) return {};
            maybe<X> x = decode_noun<X> (n.tail ());
            if (!bool (x)) return {};
            return maybe<maybe<X>> {x};
        }
    };

    template <typename X> struct hasher<maybe<X>> {
        static digest hash (const maybe<X> &x) {
            if (!bool (x)) return hash_belt (0);
            return hash_pair (hash_belt (0), hash_of (*x));
        }
    };

    // a null-terminated list.
    template <typename X> struct codec<std::vector<X>> {
        static noun encode (const std::vector<X> &x) {
            noun n {};
            for (auto it = x.rbegin (); it != x.rend (); it++) n = noun {encode_noun (*it), n};
            return n;
        }

        static maybe<std::vector<X>> decode (const noun &n) {
            std::vector<X> x {};
            const noun *next = &n;
            while (next->is_cell ()) {
                maybe<X> v = decode_noun<X> (next->head ());
                if (!bool (v)) return {};
                x.push_back (*v);
                next = &next->tail ();
            }

            maybe<uint64> z = next->to_uint64 ();
            if (!bool (z) || *z != 0) return {};
            return x;
        }
    };

    template <typename X> struct hasher<std::vector<X>> {
        static digest hash (const std::vector<X> &x) {
            digest d = hash_belt (0);
            for (auto it = x.rbegin (); it != x.rend (); it++) d = hash_pair (hash_of (*it), d);
            return d;
        }
    };

    template <typename X, typename Y> struct codec<std::pair<X, Y>> {
        static noun encode (const std::pair<X, Y> &x) {
            return encode_tuple (x.first, x.second);
        }

        static maybe<std::pair<X, Y>> decode (const noun &n) {
            std::pair<X, Y> x {};
            if (!read_tuple (n, x.first, x.second)) return {};
            return x;
        }
    };

    template <typename X, typename Y> struct hasher<std::pair<X, Y>> {
        static digest hash (const std::pair<X, Y> &x) {
            return hash_tuple (x.first, x.second);
        }
    };

}

#endif
