#ifndef IRIS_TX_SEED
#define IRIS_TX_SEED

#include <Iris/tx/lock.hpp>

namespace Iris {

    // a planned output.
    struct seed {
        maybe<source> OutputSource;
        lock_root LockRoot;
        note_data NoteData;
        nicks Gift;
        digest ParentHash;

        seed (): OutputSource {}, LockRoot {}, NoteData {}, Gift {}, ParentHash {} {}
        seed (const maybe<source> &src, const lock_root &lock, const note_data &data, nicks gift, const digest &parent):
            OutputSource {src}, LockRoot {lock}, NoteData {data}, Gift {gift}, ParentHash {parent} {}

        // pay to a single key hash, optionally writing the lock into the note data.
        static seed new_single_pkh (const digest &pkh, nicks gift, const digest &parent, bool include_lock_data);

        std::size_t note_data_words () const {
            return NoteData.words ();
        }

        noun to_noun () const {
            return encode_tuple (OutputSource, LockRoot, NoteData, Gift, ParentHash);
        }

        static maybe<seed> from_noun (const noun &n) {
            seed x {};
            if (!read_tuple (n, x.OutputSource, x.LockRoot, x.NoteData, x.Gift, x.ParentHash)) return {};
            return x;
        }

        // identifies the output. Does not cover the output source.
        digest content_hash () const {
            return hash_tuple (LockRoot, NoteData, Gift, ParentHash);
        }

        // what a signature commits to.
        digest signing_hash () const {
            return hash_tuple (OutputSource, LockRoot, NoteData, Gift, ParentHash);
        }

        digest hash () const {
            return content_hash ();
        }

        bool operator == (const seed &) const = default;
    };

    struct seeds : ordered_set<seed> {
        using ordered_set<seed>::ordered_set;
        seeds (ordered_set<seed> &&s): ordered_set<seed> {std::move (s)} {}

        // tree hash with seeds hashed by signing hash.
        digest sig_hash () const {
            return this->hash_with ([] (const seed &s) -> digest {
                return s.signing_hash ();
            });
        }

        nicks total_gift () const {
            nicks total {0};
            for (const seed &s : *this) total += s.Gift;
            return total;
        }

        std::size_t note_data_words () const {
            std::size_t words = 0;
            for (const seed &s : *this) words += s.note_data_words ();
            return words;
        }

        static maybe<seeds> from_noun (const noun &n) {
            maybe<ordered_set<seed>> s = ordered_set<seed>::from_noun (n);
            if (!bool (s)) return {};
            return seeds {std::move (*s)};
        }
    };

    seed inline seed::new_single_pkh (const digest &h, nicks gift, const digest &parent, bool include_lock_data) {
        note_data data {};
        if (include_lock_data) data.push_pkh (pkh::single (h));
        return seed {{}, lock_root {spend_condition::new_pkh (pkh::single (h))}, data, gift, parent};
    }

}

#endif
