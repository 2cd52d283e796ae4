#ifndef IRIS_HASH_DIGEST
#define IRIS_HASH_DIGEST

#include <Iris/hash/tip5.hpp>

namespace Iris {

    // five belts of Tip5 output. As a number it is the sum of Belts[i] * p^i.
    struct digest {
        constexpr static std::size_t Size = 40;

        std::array<belt, DigestLength> Belts;

        digest (): Belts {} {}
        explicit digest (const std::array<uint64, DigestLength> &b): Belts {b} {}

        // 40 bytes, big endian.
        std::array<byte, Size> to_bytes () const;
        static maybe<digest> from_bytes (const std::array<byte, Size> &);

        std::string to_base58 () const;
        static maybe<digest> read_base58 (const std::string &);

        uint512 value () const;

        digest hash () const {
            return *this;
        }

        bool operator == (const digest &d) const {
            return Belts == d.Belts;
        }

        // belt 0 first.
        std::strong_ordering operator <=> (const digest &) const;
    };

    std::ostream &operator << (std::ostream &, const digest &);

    digest hash_belt (uint64);

    // hash of two digests laid side by side.
    digest hash_pair (const digest &, const digest &);

    // length-prefixed leaves followed by the dyck word of a tree.
    digest hash_leaves (const std::vector<belt> &leaves, const std::vector<belt> &dyck);

    // compare the values of two digests, the same as comparing their bytes.
    std::strong_ordering compare_values (const digest &, const digest &);

    std::strong_ordering inline digest::operator <=> (const digest &d) const {
        for (int i = 0; i < DigestLength; i++)
            if (Belts[i] != d.Belts[i]) return Belts[i] <=> d.Belts[i];
        return std::strong_ordering::equal;
    }

    std::strong_ordering inline compare_values (const digest &a, const digest &b) {
        for (int i = DigestLength - 1; i >= 0; i--)
            if (a.Belts[i] != b.Belts[i]) return a.Belts[i] <=> b.Belts[i];
        return std::strong_ordering::equal;
    }

}

#endif
