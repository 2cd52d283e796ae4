#ifndef IRIS_CRYPTO_CHEETAH
#define IRIS_CRYPTO_CHEETAH

#include <Iris/hash/belt.hpp>

namespace Iris {

    // the sextic extension F_p[u] / (u^6 - 7), coefficients least significant first.
    struct f6 {
        std::array<belt, 6> Coefficients;

        f6 (): Coefficients {} {}
        explicit f6 (const std::array<belt, 6> &c): Coefficients {c} {}
        explicit f6 (belt x): Coefficients {x, 0, 0, 0, 0, 0} {}

        bool valid () const;
        bool is_zero () const;

        f6 operator + (const f6 &) const;
        f6 operator - (const f6 &) const;
        f6 operator - () const;
        f6 operator * (const f6 &) const;

        // throws if zero.
        f6 inverse () const;

        bool operator == (const f6 &) const = default;
        auto operator <=> (const f6 &) const = default;
    };

    // A point on the Cheetah curve, y^2 = x^3 + x + (395 + u) over f6.
    // The identity is the point at infinity and its coordinates are ignored.
    struct cheetah_point {
        f6 X;
        f6 Y;
        bool Infinity;

        cheetah_point (): X {}, Y {f6 {1}}, Infinity {true} {}
        cheetah_point (const f6 &x, const f6 &y): X {x}, Y {y}, Infinity {false} {}

        static const cheetah_point &generator ();

        bool on_curve () const;

        cheetah_point operator + (const cheetah_point &) const;
        cheetah_point operator - () const;

        bool operator == (const cheetah_point &) const;
        std::strong_ordering operator <=> (const cheetah_point &) const;
    };

    // double and add. Zero gives the identity.
    cheetah_point operator * (const uint512 &, const cheetah_point &);

    // prime order of the group generated by the generator.
    const uint512 &cheetah_order ();

}

#endif
