#ifndef IRIS_HASH_TIP5
#define IRIS_HASH_TIP5

#include <Iris/hash/belt.hpp>

namespace Iris {

    constexpr std::size_t StateSize = 16;
    constexpr std::size_t Rate = 10;
    constexpr std::size_t DigestLength = 5;

    // sponge state in montgomery form.
    using sponge_state = std::array<uint64, StateSize>;

    // the permutation that drives the sponge.
    struct permutation {
        virtual void operator () (sponge_state &) const = 0;
        virtual ~permutation () {}
    };

    struct tip5 final : permutation {
        constexpr static std::size_t Rounds = 7;
        constexpr static std::size_t SplitAndLookup = 4;

        void operator () (sponge_state &) const final override;

        static const tip5 &get ();

        tip5 ();

    private:
        std::array<byte, 256> Lookup;
        std::array<uint64, Rounds * StateSize> RoundConstants;

        void sbox (sponge_state &) const;
        static void mds (sponge_state &);
    };

    // the permutation used by every hash in this library unless one is passed in explicitly.
    const permutation &default_permutation ();

    // pads the input with [1 0 ...] to a multiple of the rate.
    std::array<uint64, DigestLength> hash_varlen (const std::vector<belt> &, const permutation & = default_permutation ());

    // input must be exactly Rate belts. The capacity starts at one rather than zero.
    std::array<uint64, DigestLength> hash_fixed (const std::array<belt, Rate> &, const permutation & = default_permutation ());

    // hash_varlen for input that contains secret material. The input and
    // every intermediate state are zeroed before returning.
    std::array<uint64, DigestLength> hash_secret (std::vector<belt> &, const permutation & = default_permutation ());

    void erase (std::vector<belt> &);

}

#endif
