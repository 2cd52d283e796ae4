#ifndef IRIS_HASH_BELT
#define IRIS_HASH_BELT

#include <Iris/types.hpp>

namespace Iris {

    // an element of the Goldilocks field, p = 2^64 - 2^32 + 1.
    using belt = uint64;

    constexpr uint64 Prime = 0xffffffff00000001ull;

    constexpr bool based (uint64 x) {
        return x < Prime;
    }

    constexpr uint64 belt_add (uint64 a, uint64 b) {
        uint64 r = a + b;
        // overflow past 2^64 means we must subtract p, which is the same as adding 2^32 - 1.
        if (r < a || r >= Prime) r -= Prime;
        return r;
    }

    constexpr uint64 belt_sub (uint64 a, uint64 b) {
        return a >= b ? a - b : a + (Prime - b);
    }

    // reduce a 128 bit value x to x * 2^-64 mod p.
    constexpr uint64 mont_reduction (unsigned __int128 x) {
        uint64 xl = static_cast<uint64> (x);
        uint64 xh = static_cast<uint64> (x >> 64);
        uint64 shifted = xl << 32;
        uint64 a = xl + shifted;
        bool e = a < xl;
        uint64 b = a - (a >> 32) - static_cast<uint64> (e);
        uint64 r = xh - b;
        bool c = xh < b;
        return r - ((1 + ~Prime) * static_cast<uint64> (c));
    }

    // bring x into montgomery space, x * 2^64 mod p.
    constexpr uint64 montify (uint64 x) {
        return static_cast<uint64> ((static_cast<unsigned __int128> (x) << 64) % Prime);
    }

    constexpr uint64 mont_mul (uint64 a, uint64 b) {
        return mont_reduction (static_cast<unsigned __int128> (a) * b);
    }

    constexpr uint64 belt_mul (uint64 a, uint64 b) {
        return static_cast<uint64> ((static_cast<unsigned __int128> (a) * b) % Prime);
    }

    // write a number as little-endian base p digits.
    std::vector<belt> belts_from_atom (const uint512 &);

    // read belts as base p digits, most significant first. This is the
    // order in which the ledger's tools join belts into an atom, so
    // belts_to_atom (belts_from_atom (x)) is x only when x has one digit.
    uint512 belts_to_atom (const std::vector<belt> &);

}

#endif
