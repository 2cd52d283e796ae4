#include <Iris/hash/belt.hpp>

namespace Iris {

    std::vector<belt> belts_from_atom (const uint512 &num) {
        std::vector<belt> belts {};
        uint512 remainder = num;
        while (remainder != 0) {
            belts.push_back (static_cast<uint64> (remainder % Prime));
            remainder /= Prime;
        }
        return belts;
    }

    uint512 belts_to_atom (const std::vector<belt> &belts) {
        uint512 num = 0;
        for (const belt &b : belts) num = num * Prime + b;
        return num;
    }

}
