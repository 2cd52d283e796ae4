#ifndef IRIS_TX_TRANSACTION
#define IRIS_TX_TRANSACTION

#include <Iris/tx/note.hpp>
#include <Iris/tx/spend.hpp>

namespace Iris {

    struct nockchain_tx;

    struct raw_tx_v1 {
        tx_id ID;
        Iris::spends Spends;

        raw_tx_v1 (): ID {}, Spends {} {}

        // the id is computed from the spends.
        explicit raw_tx_v1 (const Iris::spends &s): ID {calc_id (s)}, Spends {s} {}
        raw_tx_v1 (const tx_id &id, const Iris::spends &s): ID {id}, Spends {s} {}

        version get_version () const {
            return version::V1;
        }

        static tx_id calc_id (const Iris::spends &s) {
            return hash_tuple (version::V1, s);
        }

        tx_id calc_id () const {
            return calc_id (Spends);
        }

        // one output per lock root.
        std::vector<note_v1> outputs () const;

        nockchain_tx to_nockchain_tx () const;

        noun to_noun () const {
            return encode_tuple (version::V1, ID, Spends);
        }

        static maybe<raw_tx_v1> from_noun (const noun &n);

        bool operator == (const raw_tx_v1 &) const = default;
    };

    struct lock_metadata {
        spend_condition Lock;
        bool IncludeData;

        lock_metadata (): Lock {}, IncludeData {false} {}
        explicit lock_metadata (const spend_condition &sc, bool include_data = false): Lock {sc}, IncludeData {include_data} {}

        noun to_noun () const {
            return encode_tuple (Lock, IncludeData);
        }

        static maybe<lock_metadata> from_noun (const noun &n) {
            lock_metadata x {};
            if (!read_tuple (n, x.Lock, x.IncludeData)) return {};
            return x;
        }

        digest hash () const {
            return hash_tuple (Lock, IncludeData);
        }

        bool operator == (const lock_metadata &) const = default;
    };

    // what is known about the inputs of a transaction without the witnesses.
    struct input_display : std::variant<ordered_map<name, legacy::sig>, ordered_map<name, spend_condition>> {
        using std::variant<ordered_map<name, legacy::sig>, ordered_map<name, spend_condition>>::variant;

        input_display (): std::variant<ordered_map<name, legacy::sig>, ordered_map<name, spend_condition>>
            {ordered_map<name, legacy::sig> {}} {}

        version get_version () const {
            return this->index () == 0 ? version::V0 : version::V1;
        }

        noun to_noun () const;
        static maybe<input_display> from_noun (const noun &);
    };

    struct transaction_display {
        input_display Inputs;
        ordered_map<digest, lock_metadata> Outputs;

        transaction_display (): Inputs {}, Outputs {} {}
        transaction_display (const input_display &in, const ordered_map<digest, lock_metadata> &out): Inputs {in}, Outputs {out} {}

        noun to_noun () const {
            return encode_tuple (Inputs, Outputs);
        }

        static maybe<transaction_display> from_noun (const noun &n) {
            transaction_display x {};
            if (!read_tuple (n, x.Inputs, x.Outputs)) return {};
            return x;
        }

        bool operator == (const transaction_display &) const = default;
    };

    // a transaction with the witnesses held apart from the spends.
    struct nockchain_tx {
        version Version;
        tx_id ID;
        Iris::spends Spends;
        transaction_display Display;
        witness_data WitnessData;

        nockchain_tx (): Version {version::V1}, ID {}, Spends {}, Display {}, WitnessData {} {}
        nockchain_tx (const tx_id &id, const Iris::spends &s, const transaction_display &d, const witness_data &w):
            Version {version::V1}, ID {id}, Spends {s}, Display {d}, WitnessData {w} {}

        // throws if this is not a version 1 transaction.
        raw_tx_v1 to_raw_tx () const;

        std::vector<note_v1> outputs () const {
            return to_raw_tx ().outputs ();
        }

        // the id is written as base 58 text.
        noun to_noun () const {
            return encode_tuple (Version, ID.to_base58 (), Spends, Display, WitnessData);
        }

        static maybe<nockchain_tx> from_noun (const noun &);

        bool operator == (const nockchain_tx &) const = default;
    };

    // a transaction of either version.
    struct raw_tx : std::variant<legacy::raw_tx, raw_tx_v1> {
        using std::variant<legacy::raw_tx, raw_tx_v1>::variant;

        raw_tx (): std::variant<legacy::raw_tx, raw_tx_v1> {raw_tx_v1 {}} {}

        const legacy::raw_tx *v0 () const {
            return std::get_if<legacy::raw_tx> (this);
        }

        const raw_tx_v1 *v1 () const {
            return std::get_if<raw_tx_v1> (this);
        }

        version get_version () const {
            return bool (v0 ()) ? version::V0 : version::V1;
        }

        const tx_id &id () const {
            if (const auto *x = v0 (); bool (x)) return x->ID;
            return v1 ()->ID;
        }

        std::vector<note> outputs () const;

        // a legacy transaction is written bare, a version 1 transaction after its version.
        noun to_noun () const;
        static maybe<raw_tx> from_noun (const noun &);
    };

}

#endif
