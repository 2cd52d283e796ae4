#ifndef IRIS_TX_SPEND
#define IRIS_TX_SPEND

#include <Iris/tx/seed.hpp>
#include <Iris/tx/legacy.hpp>
#include <algorithm>

namespace Iris {

    // signatures by key hash.
    using pkh_signature = ordered_map<digest, std::pair<public_key, signature>>;

    // revealed spend condition and the data that satisfies it.
    struct witness {
        lock_merkle_proof LockMerkleProof;
        pkh_signature PkhSignature;
        ordered_map<digest, noun> HaxMap;
        unit Tim;

        witness (): LockMerkleProof {}, PkhSignature {}, HaxMap {}, Tim {} {}

        // a proof for a lock consisting of a single spend condition.
        explicit witness (const spend_condition &sc):
            LockMerkleProof {sc, 1, merkle_proof {sc.hash (), {}}}, PkhSignature {}, HaxMap {}, Tim {} {}

        // move the signatures and preimages into a new witness, keeping the proof.
        witness take_data ();

        noun to_noun () const {
            return encode_tuple (LockMerkleProof, PkhSignature, HaxMap, Tim);
        }

        static maybe<witness> from_noun (const noun &n) {
            witness x {};
            if (!read_tuple (n, x.LockMerkleProof, x.PkhSignature, x.HaxMap, x.Tim)) return {};
            return x;
        }

        digest hash () const {
            return hash_tuple (LockMerkleProof, PkhSignature, HaxMap, Tim);
        }

        bool operator == (const witness &) const = default;
    };

    // a spend of a legacy note authorized by signatures.
    struct legacy_spend {
        legacy::signatures Signature;
        seeds Seeds;
        nicks Fee;

        bool operator == (const legacy_spend &) const = default;
    };

    // a spend authorized by a witness.
    struct witness_spend {
        witness Witness;
        seeds Seeds;
        nicks Fee;

        bool operator == (const witness_spend &) const = default;
    };

    struct spend : std::variant<legacy_spend, witness_spend> {
        using std::variant<legacy_spend, witness_spend>::variant;

        constexpr static nicks MinFee {256};

        spend (): std::variant<legacy_spend, witness_spend> {witness_spend {}} {}

        static spend new_legacy (const seeds &s, nicks fee) {
            return spend {legacy_spend {legacy::signatures {}, s, fee}};
        }

        static spend new_witness (const witness &w, const seeds &s, nicks fee) {
            return spend {witness_spend {w, s, fee}};
        }

        const legacy_spend *s0 () const {
            return std::get_if<legacy_spend> (this);
        }

        const witness_spend *s1 () const {
            return std::get_if<witness_spend> (this);
        }

        legacy_spend *s0 () {
            return std::get_if<legacy_spend> (this);
        }

        witness_spend *s1 () {
            return std::get_if<witness_spend> (this);
        }

        version get_version () const {
            return bool (s0 ()) ? version::V0 : version::V1;
        }

        const nicks &fee () const;
        nicks &fee ();

        const Iris::seeds &get_seeds () const;
        Iris::seeds &get_seeds ();

        // hash of the seeds by signing hash together with the fee.
        digest sig_hash () const;

        // words of note data in the seeds and words of the signature or witness.
        std::pair<std::size_t, std::size_t> words () const;

        nicks unclamped_fee (nicks per_word) const {
            auto [a, b] = words ();
            return per_word * nicks {a + b};
        }

        // the fee for a collection of spends, never less than the minimum.
        template <typename iterator>
        static nicks fee_for_many (iterator begin, iterator end, nicks per_word, nicks min_fee = MinFee);

        void add_signature (const public_key &, const signature &);

        // a legacy spend carries no preimages, so nothing is stored.
        digest add_preimage (const noun &);

        void clear_signatures ();

        noun to_noun () const;
        static maybe<spend> from_noun (const noun &);
        digest hash () const;
    };

    template <typename iterator>
    nicks spend::fee_for_many (iterator begin, iterator end, nicks per_word, nicks min_fee) {
        nicks total {0};
        for (iterator i = begin; i != end; i++) total += i->second.unclamped_fee (per_word);
        return std::max (total, min_fee);
    }

    struct witness_data {
        ordered_map<name, witness> Data;

        witness_data (): Data {} {}
        explicit witness_data (const ordered_map<name, witness> &d): Data {d} {}

        noun to_noun () const {
            return encode_tuple (version::V1, Data);
        }

        static maybe<witness_data> from_noun (const noun &n) {
            version v {};
            witness_data x {};
            if (!read_tuple (n, v, x.Data) || v != version::V1) return {};
            return x;
        }

        bool operator == (const witness_data &) const = default;
    };

    struct spends : ordered_map<name, spend> {
        using ordered_map<name, spend>::ordered_map;
        spends (ordered_map<name, spend> &&m): ordered_map<name, spend> {std::move (m)} {}

        nicks fee (nicks per_word, nicks min_fee = spend::MinFee) const {
            return spend::fee_for_many (this->begin (), this->end (), per_word, min_fee);
        }

        // separate signatures and preimages from the spends.
        std::pair<spends, witness_data> split_witness () const;

        // put witnesses back into the spends that have them.
        spends apply_witness (const witness_data &) const;

        static maybe<spends> from_noun (const noun &n) {
            maybe<ordered_map<name, spend>> m = ordered_map<name, spend>::from_noun (n);
            if (!bool (m)) return {};
            return spends {std::move (*m)};
        }
    };

}

#endif
