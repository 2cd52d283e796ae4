#ifndef IRIS_TX_LEGACY
#define IRIS_TX_LEGACY

#include <Iris/tx/common.hpp>
#include <Iris/crypto/key.hpp>

// notes and transactions of version 0.
namespace Iris::legacy {

    // m of n public keys must sign.
    struct sig {
        uint64 M;
        ordered_set<public_key> Pubkeys;

        sig (): M {0}, Pubkeys {} {}
        sig (uint64 m, const ordered_set<public_key> &keys): M {m}, Pubkeys {keys} {}

        static sig single (const public_key &pk) {
            return sig {1, ordered_set<public_key> {pk}};
        }

        noun to_noun () const {
            return encode_tuple (M, Pubkeys);
        }

        static maybe<sig> from_noun (const noun &n) {
            sig s {};
            if (!read_tuple (n, s.M, s.Pubkeys)) return {};
            return s;
        }

        digest hash () const {
            return hash_tuple (M, Pubkeys);
        }

        bool operator == (const sig &) const = default;
    };

    // signatures by public key.
    struct signatures : ordered_map<public_key, signature> {
        using ordered_map<public_key, signature>::ordered_map;
        signatures (ordered_map<public_key, signature> &&m): ordered_map<public_key, signature> {std::move (m)} {}

        void add_entry (const public_key &pk, const signature &x) {
            this->insert (pk, x);
        }

        static maybe<signatures> from_noun (const noun &n) {
            maybe<ordered_map<public_key, signature>> m = ordered_map<public_key, signature>::from_noun (n);
            if (!bool (m)) return {};
            return signatures {std::move (*m)};
        }
    };

    struct note_inner {
        version Version;
        block_height OriginPage;
        timelock_intent Timelock;

        note_inner (): Version {version::V0}, OriginPage {0}, Timelock {} {}
        note_inner (version v, block_height origin, const timelock_intent &tl): Version {v}, OriginPage {origin}, Timelock {tl} {}

        noun to_noun () const {
            return encode_tuple (Version, OriginPage, Timelock);
        }

        static maybe<note_inner> from_noun (const noun &n) {
            note_inner x {};
            if (!read_tuple (n, x.Version, x.OriginPage, x.Timelock)) return {};
            return x;
        }

        digest hash () const {
            return hash_tuple (Version, OriginPage, Timelock);
        }

        bool operator == (const note_inner &) const = default;
    };

    struct note {
        note_inner Inner;
        name Name;
        sig Sig;
        source Source;
        nicks Assets;

        note (): Inner {}, Name {}, Sig {}, Source {}, Assets {} {}
        note (const note_inner &inner, const name &n, const sig &s, const source &src, nicks assets):
            Inner {inner}, Name {n}, Sig {s}, Source {src}, Assets {assets} {}

        noun to_noun () const {
            return encode_tuple (Inner, Name, Sig, Source, Assets);
        }

        static maybe<note> from_noun (const noun &n) {
            note x {};
            if (!read_tuple (n, x.Inner, x.Name, x.Sig, x.Source, x.Assets)) return {};
            return x;
        }

        digest hash () const {
            return hash_tuple (Inner, Name, Sig, Source, Assets);
        }

        bool operator == (const note &) const = default;
    };

    struct seed {
        maybe<source> OutputSource;
        sig Recipient;
        timelock_intent TimelockIntent;
        nicks Gift;
        digest ParentHash;

        seed (): OutputSource {}, Recipient {}, TimelockIntent {}, Gift {}, ParentHash {} {}
        seed (const maybe<source> &src, const sig &recipient, const timelock_intent &tl, nicks gift, const digest &parent):
            OutputSource {src}, Recipient {recipient}, TimelockIntent {tl}, Gift {gift}, ParentHash {parent} {}

        static seed single (const public_key &pk, nicks gift, const digest &parent) {
            return seed {{}, sig::single (pk), timelock_intent {}, gift, parent};
        }

        noun to_noun () const {
            return encode_tuple (OutputSource, Recipient, TimelockIntent, Gift, ParentHash);
        }

        static maybe<seed> from_noun (const noun &n) {
            seed x {};
            if (!read_tuple (n, x.OutputSource, x.Recipient, x.TimelockIntent, x.Gift, x.ParentHash)) return {};
            return x;
        }

        // does not cover the output source.
        digest content_hash () const {
            return hash_tuple (Recipient, TimelockIntent, Gift, ParentHash);
        }

        digest signing_hash () const {
            return hash_tuple (OutputSource, Recipient, TimelockIntent, Gift, ParentHash);
        }

        digest hash () const {
            return content_hash ();
        }

        bool operator == (const seed &) const = default;
    };

    struct seeds : ordered_set<seed> {
        using ordered_set<seed>::ordered_set;
        seeds (ordered_set<seed> &&s): ordered_set<seed> {std::move (s)} {}

        digest sig_hash () const {
            return this->hash_with ([] (const seed &s) -> digest {
                return s.signing_hash ();
            });
        }

        static maybe<seeds> from_noun (const noun &n) {
            maybe<ordered_set<seed>> s = ordered_set<seed>::from_noun (n);
            if (!bool (s)) return {};
            return seeds {std::move (*s)};
        }
    };

    struct spend {
        maybe<signatures> Signature;
        seeds Seeds;
        nicks Fee;

        spend (): Signature {}, Seeds {}, Fee {} {}
        spend (const maybe<signatures> &x, const seeds &s, nicks fee): Signature {x}, Seeds {s}, Fee {fee} {}

        noun to_noun () const {
            return encode_tuple (Signature, Seeds, Fee);
        }

        static maybe<spend> from_noun (const noun &n) {
            spend x {};
            if (!read_tuple (n, x.Signature, x.Seeds, x.Fee)) return {};
            return x;
        }

        digest hash () const {
            return hash_tuple (Signature, Seeds, Fee);
        }

        bool operator == (const spend &) const = default;
    };

    struct input {
        note Note;
        spend Spend;

        input (): Note {}, Spend {} {}
        input (const note &n, const spend &s): Note {n}, Spend {s} {}

        noun to_noun () const {
            return encode_tuple (Note, Spend);
        }

        static maybe<input> from_noun (const noun &n) {
            input x {};
            if (!read_tuple (n, x.Note, x.Spend)) return {};
            return x;
        }

        digest hash () const {
            return hash_tuple (Note, Spend);
        }

        bool operator == (const input &) const = default;
    };

    using inputs = ordered_map<name, input>;

    struct raw_tx {
        tx_id ID;
        inputs Inputs;
        timelock_range TimelockRange;
        nicks TotalFees;

        raw_tx (): ID {}, Inputs {}, TimelockRange {}, TotalFees {} {}
        raw_tx (const tx_id &id, const inputs &in, const timelock_range &range, nicks fees):
            ID {id}, Inputs {in}, TimelockRange {range}, TotalFees {fees} {}

        version get_version () const {
            return version::V0;
        }

        tx_id calc_id () const {
            return hash_tuple (Inputs, TimelockRange, TotalFees);
        }

        // one output per recipient.
        std::vector<note> outputs () const;

        noun to_noun () const {
            return encode_tuple (ID, Inputs, TimelockRange, TotalFees);
        }

        static maybe<raw_tx> from_noun (const noun &n) {
            raw_tx x {};
            if (!read_tuple (n, x.ID, x.Inputs, x.TimelockRange, x.TotalFees)) return {};
            return x;
        }

        bool operator == (const raw_tx &) const = default;
    };

}

#endif
