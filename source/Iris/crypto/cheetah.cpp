#include <Iris/crypto/cheetah.hpp>

namespace Iris {

    namespace {

        // a sixth root of unity, 7^((p - 1) / 6). The Frobenius map sends u to Omega u.
        constexpr uint64 Omega = 18446744065119617026ull;

        const f6 &curve_b () {
            static const f6 B {{395, 1, 0, 0, 0, 0}};
            return B;
        }

        uint64 belt_pow (uint64 x, uint64 n) {
            uint64 r = 1;
            while (n != 0) {
                if (n & 1) r = belt_mul (r, x);
                x = belt_mul (x, x);
                n >>= 1;
            }
            return r;
        }

        uint64 belt_inverse (uint64 x) {
            return belt_pow (x, Prime - 2);
        }

        // a^(p^k)
        f6 frobenius (const f6 &a, std::size_t k) {
            std::array<uint64, 6> powers;
            powers[0] = 1;
            for (std::size_t i = 1; i < 6; i++) powers[i] = belt_mul (powers[i - 1], Omega);

            f6 r {};
            for (std::size_t i = 0; i < 6; i++) r.Coefficients[i] = belt_mul (a.Coefficients[i], powers[(i * k) % 6]);
            return r;
        }

    }

    bool f6::valid () const {
        for (const belt &b : Coefficients) if (!based (b)) return false;
        return true;
    }

    bool f6::is_zero () const {
        for (const belt &b : Coefficients) if (b != 0) return false;
        return true;
    }

    f6 f6::operator + (const f6 &b) const {
        f6 r {};
        for (std::size_t i = 0; i < 6; i++) r.Coefficients[i] = belt_add (Coefficients[i], b.Coefficients[i]);
        return r;
    }

    f6 f6::operator - (const f6 &b) const {
        f6 r {};
        for (std::size_t i = 0; i < 6; i++) r.Coefficients[i] = belt_sub (Coefficients[i], b.Coefficients[i]);
        return r;
    }

    f6 f6::operator - () const {
        return f6 {} - *this;
    }

    f6 f6::operator * (const f6 &b) const {
        std::array<uint64, 11> r {};
        for (std::size_t i = 0; i < 6; i++)
            for (std::size_t j = 0; j < 6; j++)
                r[i + j] = belt_add (r[i + j], belt_mul (Coefficients[i], b.Coefficients[j]));

        // u^6 = 7
        for (std::size_t k = 10; k >= 6; k--) r[k - 6] = belt_add (r[k - 6], belt_mul (r[k], 7));

        f6 x {};
        for (std::size_t i = 0; i < 6; i++) x.Coefficients[i] = r[i];
        return x;
    }

    // the product of the conjugates of a is a^-1 times the norm of a, which lies in F_p.
    f6 f6::inverse () const {
        if (is_zero ()) throw data::exception {} << "inverse of zero";

        f6 conjugates = frobenius (*this, 1);
        for (std::size_t k = 2; k < 6; k++) conjugates = conjugates * frobenius (*this, k);

        uint64 norm = (*this * conjugates).Coefficients[0];
        uint64 n = belt_inverse (norm);

        f6 r {};
        for (std::size_t i = 0; i < 6; i++) r.Coefficients[i] = belt_mul (conjugates.Coefficients[i], n);
        return r;
    }

    const cheetah_point &cheetah_point::generator () {
        static const cheetah_point G {
            f6 {{2754611494552410273ull, 8599518745794843693ull, 10526511002404673680ull,
                4830863958577994148ull, 375185138577093320ull, 12938930721685970739ull}},
            f6 {{15384029202802550068ull, 2774812795997841935ull, 14375303400746062753ull,
                10708493419890101954ull, 13187678623570541764ull, 9990732138772505951ull}}};
        return G;
    }

    const uint512 &cheetah_order () {
        static const uint512 N {"0x7af2599b3b3f22d0563fbf0f990a37b5327aa72330157722d443623eaed4accf"};
        return N;
    }

    bool cheetah_point::on_curve () const {
        if (Infinity) return true;
        if (!X.valid () || !Y.valid ()) return false;
        return Y * Y == X * X * X + X + curve_b ();
    }

    cheetah_point cheetah_point::operator + (const cheetah_point &q) const {
        if (Infinity) return q;
        if (q.Infinity) return *this;

        f6 slope;
        if (X == q.X) {
            if ((Y + q.Y).is_zero ()) return cheetah_point {};
            // tangent, 3x^2 + 1 over 2y
            slope = (f6 {3} * X * X + f6 {1}) * (Y + Y).inverse ();
        } else slope = (q.Y - Y) * (q.X - X).inverse ();

        f6 x = slope * slope - X - q.X;
        return cheetah_point {x, slope * (X - x) - Y};
    }

    cheetah_point cheetah_point::operator - () const {
        if (Infinity) return *this;
        return cheetah_point {X, -Y};
    }

    bool cheetah_point::operator == (const cheetah_point &q) const {
        if (Infinity || q.Infinity) return Infinity == q.Infinity;
        return X == q.X && Y == q.Y;
    }

    std::strong_ordering cheetah_point::operator <=> (const cheetah_point &q) const {
        if (Infinity || q.Infinity) return Infinity <=> q.Infinity;
        if (auto c = X <=> q.X; c != 0) return c;
        return Y <=> q.Y;
    }

    cheetah_point operator * (const uint512 &n, const cheetah_point &p) {
        cheetah_point r {};
        if (n == 0) return r;
        for (int i = static_cast<int> (boost::multiprecision::msb (n)); i >= 0; i--) {
            r = r + r;
            if (boost::multiprecision::bit_test (n, i)) r = r + p;
        }
        return r;
    }

}
