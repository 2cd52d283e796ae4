#include <Iris/tx/lock.hpp>
#include <type_traits>

namespace Iris {

    namespace {
        const std::string PkhTag {"pkh"};
        const std::string TimTag {"tim"};
        const std::string HaxTag {"hax"};
        const std::string BrnTag {"brn"};

        template <typename X> noun tagged (const std::string &tag, const X &x) {
            return encode_tuple (tag, x);
        }

        template <typename X> digest tagged_hash (const std::string &tag, const X &x) {
            return hash_tuple (tag, x);
        }

        digest leaf_hash (const noun &n) {
            if (n.is_cell ()) return hash_pair (leaf_hash (n.head ()), leaf_hash (n.tail ()));
            maybe<uint64> x = n.to_uint64 ();
            if (!bool (x)) throw data::exception {} << "note data atom is too large to hash";
            return hash_belt (*x);
        }
    }

    noun lock_primitive::to_noun () const {
        return std::visit ([] (const auto &p) -> noun {
            using type = std::decay_t<decltype (p)>;
            if constexpr (std::is_same_v<type, pkh>) return tagged (PkhTag, p);
            else if constexpr (std::is_same_v<type, timelock>) return tagged (TimTag, p);
            else if constexpr (std::is_same_v<type, hax>) return tagged (HaxTag, p);
            else return tagged (BrnTag, uint64 {0});
        }, static_cast<const std::variant<pkh, timelock, hax, burn> &> (*this));
    }

    digest lock_primitive::hash () const {
        return std::visit ([] (const auto &p) -> digest {
            using type = std::decay_t<decltype (p)>;
            if constexpr (std::is_same_v<type, pkh>) return tagged_hash (PkhTag, p);
            else if constexpr (std::is_same_v<type, timelock>) return tagged_hash (TimTag, p);
            else if constexpr (std::is_same_v<type, hax>) return tagged_hash (HaxTag, p);
            else return tagged_hash (BrnTag, uint64 {0});
        }, static_cast<const std::variant<pkh, timelock, hax, burn> &> (*this));
    }

    maybe<lock_primitive> lock_primitive::from_noun (const noun &n) {
        std::string tag;
        noun body;
        if (!read_tuple (n, tag, body)) return {};

        if (tag == PkhTag) {
            maybe<pkh> p = decode_noun<pkh> (body);
            if (!bool (p)) return {};
            return lock_primitive {*p};
        }

        if (tag == TimTag) {
            maybe<timelock> t = decode_noun<timelock> (body);
            if (!bool (t)) return {};
            return lock_primitive {*t};
        }

        if (tag == HaxTag) {
            maybe<hax> h = decode_noun<hax> (body);
            if (!bool (h)) return {};
            return lock_primitive {*h};
        }

        if (tag == BrnTag) return lock_primitive {burn {}};

        return {};
    }

    std::vector<const pkh *> spend_condition::pkhs () const {
        std::vector<const pkh *> x {};
        for (const lock_primitive &p : Primitives) if (const auto *v = std::get_if<pkh> (&p); bool (v)) x.push_back (v);
        return x;
    }

    std::vector<const timelock *> spend_condition::tims () const {
        std::vector<const timelock *> x {};
        for (const lock_primitive &p : Primitives) if (const auto *v = std::get_if<timelock> (&p); bool (v)) x.push_back (v);
        return x;
    }

    std::vector<const hax *> spend_condition::haxes () const {
        std::vector<const hax *> x {};
        for (const lock_primitive &p : Primitives) if (const auto *v = std::get_if<hax> (&p); bool (v)) x.push_back (v);
        return x;
    }

    bool spend_condition::brn () const {
        for (const lock_primitive &p : Primitives) if (std::holds_alternative<burn> (p)) return true;
        return false;
    }

    digest lock_merkle_proof::hash () const {
        static const digest AxisMoldHash = [] () -> digest {
            maybe<digest> d = digest::read_base58 ("6mhCSwJQDvbkbiPAUNjetJtVoo1VLtEhmEYoU4hmdGd6ep1F6ayaV4A");
            if (!bool (d)) throw data::exception {} << "could not read axis mold hash";
            return *d;
        } ();

        return hash_tuple (SpendCondition.hash (), AxisMoldHash, Proof);
    }

    void note_data::push_pkh (const pkh &p) {
        Entries.insert ("lock", encode_tuple (uint64 {0}, encode_tuple (PkhTag, p), uint64 {0}));
    }

    void note_data::push_lock (const spend_condition &sc) {
        Entries.insert ("lock", encode_tuple (uint64 {0}, sc));
    }

    digest note_data::hash () const {
        return Entries.hash_with ([] (const std::pair<std::string, noun> &e) -> digest {
            return hash_pair (hash_of (e.first), leaf_hash (e.second));
        });
    }

}
