#ifndef IRIS_TX_BUILDER
#define IRIS_TX_BUILDER

#include <Iris/tx/transaction.hpp>
#include <Iris/options.hpp>

#include <map>
#include <set>

namespace Iris {

    // more signatures by the listed key hashes are needed.
    struct missing_pkh {
        uint64 NumSigs;
        std::set<digest> SigOf;

        bool operator == (const missing_pkh &) const = default;
    };

    // preimages of these hashes are needed.
    struct missing_hax {
        std::set<digest> PreimagesFor;

        bool operator == (const missing_hax &) const = default;
    };

    // a burned output can never be unlocked.
    struct missing_brn {
        bool operator == (const missing_brn &) const = default;
    };

    // more signatures by the listed public keys are needed for a legacy note.
    struct missing_sig {
        uint64 NumSigs;
        std::set<public_key> SigOf;

        bool operator == (const missing_sig &) const = default;
    };

    struct missing_unlock : std::variant<missing_pkh, missing_hax, missing_brn, missing_sig> {
        using std::variant<missing_pkh, missing_hax, missing_brn, missing_sig>::variant;
    };

    std::ostream &operator << (std::ostream &, const missing_unlock &);

    struct build_error : data::exception {
        enum class kind {
            ZeroGift,
            InsufficientFunds,
            AccountingMismatch,
            NoteNotFound,
            InvalidFee,
            InvalidVersion,
            InvalidSpendCondition,
            UnbalancedSpends,
            MissingSpendCondition,
            MissingUnlocks
        };

        kind Kind;

        // NoteNotFound
        maybe<name> Note;

        // InvalidFee
        nicks Needed;
        nicks Got;

        // MissingUnlocks
        std::vector<missing_unlock> Unlocks;

        explicit build_error (kind);

        static build_error note_not_found (const name &);
        static build_error invalid_fee (nicks needed, nicks got);
        static build_error missing_unlocks (const std::vector<missing_unlock> &);
    };

    std::ostream &operator << (std::ostream &, build_error::kind);

    // a note to be spent together with its spend under construction.
    struct spend_builder {
        note Note;
        spend Spend;

        // leftover funds are sent to this lock.
        maybe<spend_condition> RefundLock;

        spend_builder (): Note {}, Spend {}, RefundLock {} {}

        // a version 1 note requires a spend condition.
        spend_builder (const note &, const maybe<spend_condition> &, const maybe<spend_condition> &refund_lock);

        // nothing if the versions of the note and spend differ.
        static maybe<spend_builder> from_spend (const Iris::spend &, const note &, const maybe<spend_condition> &refund_lock);

        // signatures are cleared if the fee changes.
        spend_builder &fee (nicks);

        // replace the refund seed with one for whatever is not spent on gifts and fees.
        spend_builder &compute_refund (bool include_lock_data);

        const Iris::seed *cur_refund () const;

        bool is_balanced () const;

        Iris::seed build_seed (const spend_condition &lock, nicks gift, bool include_lock_data) const;

        spend_builder &seed (const Iris::seed &);

        spend_builder &invalidate_sigs ();

        std::vector<missing_unlock> missing_unlocks () const;

        // nothing unless some hash lock is waiting for this preimage.
        maybe<digest> add_preimage (const noun &);

        // false if the key is not needed for this spend.
        bool sign (const private_key &);

        // the fee without the minimum, budgeting for signatures not yet made.
        nicks unclamped_fee (nicks fee_per_word, uint64 signature_words = tx_engine_settings::DefaultSignatureWords) const;
    };

    struct tx_builder {
        using input = std::pair<note, maybe<spend_condition>>;

        std::map<name, spend_builder> Spends;

        // spends that contribute no gift and can be drawn on to pay the fee.
        std::vector<spend_builder> FeePool;

        tx_engine_settings Settings;

        explicit tx_builder (const tx_engine_settings &settings = {}): Spends {}, FeePool {}, Settings {settings} {}
        explicit tx_builder (nicks fee_per_word): Spends {}, FeePool {}, Settings {fee_per_word} {}

        // notes are matched to spends by name. The spend condition of each note is used as its refund lock.
        static tx_builder from_tx (const raw_tx &, std::map<name, input> notes);

        // returns the spend that was replaced, if any.
        maybe<spend_builder> spend (const spend_builder &);

        // the gift is taken from the notes in order. Notes that are not needed go to the fee pool.
        tx_builder &simple_spend_base (const std::vector<input> &notes,
            const digest &recipient, nicks gift, const digest &refund_pkh, bool include_lock_data);

        tx_builder &simple_spend (const std::vector<input> &notes,
            const digest &recipient, nicks gift, const digest &refund_pkh, bool include_lock_data);

        maybe<digest> add_preimage (const noun &);

        tx_builder &sign (const private_key &);

        // throws if the fee is too low, a spend is unbalanced, or some spend is not unlocked.
        tx_builder &validate ();

        nockchain_tx build () const;

        std::map<name, input> all_notes () const;

        const std::map<name, spend_builder> &all_spends () const {
            return Spends;
        }

        nicks cur_fee () const;

        nicks calc_fee () const;

        tx_builder &recalc_and_set_fee (bool include_lock_data);

        tx_builder &set_fee_and_balance_refund (nicks fee, bool adjust_fee, bool include_lock_data);
    };

}

#endif
