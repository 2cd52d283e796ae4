#ifndef IRIS_TX_LOCK
#define IRIS_TX_LOCK

#include <Iris/tx/common.hpp>
#include <variant>

namespace Iris {

    // m of the listed public key hashes must sign.
    struct pkh {
        uint64 M;
        ordered_set<digest> Hashes;

        pkh (): M {0}, Hashes {} {}
        pkh (uint64 m, const ordered_set<digest> &hashes): M {m}, Hashes {hashes} {}

        static pkh single (const digest &h) {
            return pkh {1, ordered_set<digest> {h}};
        }

        noun to_noun () const {
            return encode_tuple (M, Hashes);
        }

        static maybe<pkh> from_noun (const noun &n) {
            pkh p {};
            if (!read_tuple (n, p.M, p.Hashes)) return {};
            return p;
        }

        digest hash () const {
            return hash_tuple (M, Hashes);
        }

        bool operator == (const pkh &) const = default;
    };

    // preimages of all the listed hashes must be revealed.
    struct hax {
        ordered_set<digest> Hashes;

        hax (): Hashes {} {}
        explicit hax (const ordered_set<digest> &h): Hashes {h} {}

        noun to_noun () const {
            return Hashes.to_noun ();
        }

        static maybe<hax> from_noun (const noun &n) {
            maybe<ordered_set<digest>> h = ordered_set<digest>::from_noun (n);
            if (!bool (h)) return {};
            return hax {*h};
        }

        digest hash () const {
            return Hashes.hash ();
        }

        bool operator == (const hax &) const = default;
    };

    // the output can never be spent.
    struct burn {
        bool operator == (const burn &) const {
            return true;
        }
    };

    struct lock_primitive : std::variant<pkh, timelock, hax, burn> {
        using std::variant<pkh, timelock, hax, burn>::variant;

        lock_primitive (): std::variant<pkh, timelock, hax, burn> {burn {}} {}

        // a tag followed by the primitive, ["pkh" pkh], ["tim" timelock], ["hax" hax] or ["brn" 0].
        noun to_noun () const;
        static maybe<lock_primitive> from_noun (const noun &);
        digest hash () const;
    };

    // all primitives must be satisfied.
    struct spend_condition {
        std::vector<lock_primitive> Primitives;

        spend_condition (): Primitives {} {}
        spend_condition (std::initializer_list<lock_primitive> p): Primitives {p} {}
        explicit spend_condition (const std::vector<lock_primitive> &p): Primitives {p} {}

        static spend_condition new_pkh (const pkh &p) {
            return spend_condition {lock_primitive {p}};
        }

        // first part of the name of a note locked by this condition.
        digest first_name () const {
            return hash_tuple (true, hash ());
        }

        std::vector<const pkh *> pkhs () const;
        std::vector<const timelock *> tims () const;
        std::vector<const hax *> haxes () const;
        bool brn () const;

        noun to_noun () const {
            return encode_noun (Primitives);
        }

        static maybe<spend_condition> from_noun (const noun &n) {
            maybe<std::vector<lock_primitive>> p = decode_noun<std::vector<lock_primitive>> (n);
            if (!bool (p)) return {};
            return spend_condition {*p};
        }

        digest hash () const {
            return hash_of (Primitives);
        }

        bool operator == (const spend_condition &) const = default;
    };

    struct merkle_proof {
        digest Root;
        std::vector<digest> Path;

        merkle_proof (): Root {}, Path {} {}
        merkle_proof (const digest &root, const std::vector<digest> &path): Root {root}, Path {path} {}

        noun to_noun () const {
            return encode_tuple (Root, Path);
        }

        static maybe<merkle_proof> from_noun (const noun &n) {
            merkle_proof p {};
            if (!read_tuple (n, p.Root, p.Path)) return {};
            return p;
        }

        digest hash () const {
            return hash_tuple (Root, Path);
        }

        bool operator == (const merkle_proof &) const = default;
    };

    // proof that a spend condition is part of the lock of a note.
    struct lock_merkle_proof {
        spend_condition SpendCondition;
        uint64 Axis;
        merkle_proof Proof;

        lock_merkle_proof (): SpendCondition {}, Axis {1}, Proof {} {}
        lock_merkle_proof (const spend_condition &sc, uint64 axis, const merkle_proof &proof):
            SpendCondition {sc}, Axis {axis}, Proof {proof} {}

        noun to_noun () const {
            return encode_tuple (SpendCondition, Axis, Proof);
        }

        static maybe<lock_merkle_proof> from_noun (const noun &n) {
            lock_merkle_proof p {};
            if (!read_tuple (n, p.SpendCondition, p.Axis, p.Proof)) return {};
            return p;
        }

        // the axis is replaced by the hash of its mold.
        digest hash () const;

        bool operator == (const lock_merkle_proof &) const = default;
    };

    // arbitrary data attached to a note.
    struct note_data {
        ordered_map<std::string, noun> Entries;

        note_data (): Entries {} {}
        explicit note_data (const ordered_map<std::string, noun> &e): Entries {e} {}

        static note_data from_pkh (const pkh &p) {
            note_data d {};
            d.push_pkh (p);
            return d;
        }

        void push_pkh (const pkh &);
        void push_lock (const spend_condition &);

        std::size_t words () const {
            return to_noun ().words ();
        }

        noun to_noun () const {
            return Entries.to_noun ();
        }

        static maybe<note_data> from_noun (const noun &n) {
            maybe<ordered_map<std::string, noun>> e = ordered_map<std::string, noun>::from_noun (n);
            if (!bool (e)) return {};
            return note_data {*e};
        }

        // the values are hashed leaf by leaf rather than as nouns.
        digest hash () const;

        bool operator == (const note_data &) const = default;
    };

    // the lock of an output, either a hash or the spend condition itself.
    struct lock_root : std::variant<digest, spend_condition> {
        using std::variant<digest, spend_condition>::variant;

        lock_root (): std::variant<digest, spend_condition> {digest {}} {}

        const spend_condition *lock () const {
            return std::get_if<spend_condition> (this);
        }

        noun to_noun () const {
            return encode_noun (hash ());
        }

        // always decodes to a hash.
        static maybe<lock_root> from_noun (const noun &n) {
            maybe<digest> d = decode_noun<digest> (n);
            if (!bool (d)) return {};
            return lock_root {*d};
        }

        digest hash () const {
            if (const auto *sc = lock (); bool (sc)) return sc->hash ();
            return std::get<digest> (*this);
        }
    };

}

#endif
