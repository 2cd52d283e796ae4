#include <Iris/hash/digest.hpp>
#include <data/encoding/base58.hpp>

namespace Iris {

    uint512 digest::value () const {
        uint512 result = 0;
        uint512 power = 1;
        for (const belt &b : Belts) {
            result += power * b;
            power *= Prime;
        }
        return result;
    }

    std::array<byte, digest::Size> digest::to_bytes () const {
        std::array<byte, Size> b {};
        uint512 v = value ();
        for (int i = Size - 1; i >= 0; i--) {
            b[i] = static_cast<byte> (v & 0xff);
            v >>= 8;
        }
        return b;
    }

    maybe<digest> digest::from_bytes (const std::array<byte, Size> &b) {
        uint512 v = 0;
        for (const byte &x : b) v = (v << 8) | x;

        digest d {};
        for (belt &x : d.Belts) {
            x = static_cast<uint64> (v % Prime);
            v /= Prime;
        }

        if (v != 0) return {};
        return d;
    }

    std::string digest::to_base58 () const {
        std::array<byte, Size> b = to_bytes ();
        bytes x {};
        for (const byte &z : b) x.push_back (z);
        return encoding::base58::write (x);
    }

    maybe<digest> digest::read_base58 (const std::string &str) {
        maybe<bytes> b = encoding::base58::read (str);
        if (!bool (b) || b->size () > Size) return {};

        // leading zero bytes may have been dropped.
        std::array<byte, Size> x {};
        std::size_t offset = Size - b->size ();
        for (std::size_t i = 0; i < b->size (); i++) x[offset + i] = (*b)[i];
        return from_bytes (x);
    }

    std::ostream &operator << (std::ostream &o, const digest &d) {
        return o << d.to_base58 ();
    }

    digest hash_belt (uint64 x) {
        return digest {hash_varlen ({1, x})};
    }

    digest hash_pair (const digest &a, const digest &b) {
        std::array<belt, Rate> x;
        for (std::size_t i = 0; i < DigestLength; i++) {
            x[i] = a.Belts[i];
            x[DigestLength + i] = b.Belts[i];
        }
        return digest {hash_fixed (x)};
    }

    digest hash_leaves (const std::vector<belt> &leaves, const std::vector<belt> &dyck) {
        std::vector<belt> combined {};
        combined.reserve (1 + leaves.size () + dyck.size ());
        combined.push_back (leaves.size ());
        combined.insert (combined.end (), leaves.begin (), leaves.end ());
        combined.insert (combined.end (), dyck.begin (), dyck.end ());
        return digest {hash_varlen (combined)};
    }

}
