#include <Iris/tx/common.hpp>
#include <Iris/tx/legacy.hpp>

namespace Iris {

    nicks nicks::operator + (const nicks &n) const {
        if (Value > std::numeric_limits<uint64>::max () - n.Value) throw data::exception {} << "nicks overflow";
        return nicks {Value + n.Value};
    }

    nicks nicks::operator - (const nicks &n) const {
        if (n.Value > Value) throw data::exception {} << "nicks underflow: " << Value << " - " << n.Value;
        return nicks {Value - n.Value};
    }

    nicks nicks::operator * (const nicks &n) const {
        if (n.Value != 0 && Value > std::numeric_limits<uint64>::max () / n.Value) throw data::exception {} << "nicks overflow";
        return nicks {Value * n.Value};
    }

    std::ostream &operator << (std::ostream &o, const nicks &n) {
        return o << n.nocks () << "." << n.Value % nicks::PerNock;
    }

    std::ostream &operator << (std::ostream &o, version v) {
        return o << "V" << uint32 (v);
    }

    timelock_range::timelock_range (maybe<block_height> min, maybe<block_height> max): Min {}, Max {} {
        if (bool (min) && *min != 0) Min = min;
        if (bool (max) && *max != 0) Max = max;
    }

    name name::new_v1 (const digest &lock, const source &src) {
        return name {hash_tuple (true, lock), hash_tuple (true, src.hash (), uint64 {0})};
    }

    name name::new_v0 (const legacy::sig &owners, const source &src, const timelock_intent &tl) {
        return name {
            hash_tuple (true, bool (tl.Timelock), owners, uint64 {0}),
            hash_tuple (true, src, tl, uint64 {0})};
    }

    std::ostream &operator << (std::ostream &o, const name &n) {
        return o << "[" << n.First << " " << n.Last << "]";
    }

}
