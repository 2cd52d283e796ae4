#include <Iris/tx/transaction.hpp>
#include <map>

namespace Iris {

    maybe<raw_tx_v1> raw_tx_v1::from_noun (const noun &n) {
        version v {};
        raw_tx_v1 x {};
        if (!read_tuple (n, v, x.ID, x.Spends) || v != version::V1) return {};
        return x;
    }

    std::vector<note_v1> raw_tx_v1::outputs () const {
        // lock roots are visited in order of their hashes.
        std::map<digest, ordered_set<seed>> by_lock {};
        for (const auto &[_, s] : Spends)
            for (const seed &x : s.get_seeds ()) by_lock[x.LockRoot.hash ()].insert (x);

        std::vector<note_v1> outputs {};
        for (const auto &[lock, group] : by_lock) {
            std::vector<const seed *> ordered = group.tap ();
            if (ordered.empty ()) continue;

            nicks assets {0};
            ordered_set<seed> normalized {};
            for (const seed *x : ordered) {
                assets += x->Gift;
                seed y = *x;
                y.OutputSource = {};
                normalized.insert (y);
            }

            outputs.push_back (note_v1 {
                version::V1, 0,
                name::new_v1 (lock, source {normalized.hash (), false}),
                // the note data of the last seed wins.
                ordered.back ()->NoteData,
                assets});
        }

        return outputs;
    }

    nockchain_tx raw_tx_v1::to_nockchain_tx () const {
        auto [s, w] = Spends.split_witness ();
        return nockchain_tx {ID, s, transaction_display {}, w};
    }

    raw_tx_v1 nockchain_tx::to_raw_tx () const {
        if (Version != version::V1) throw data::exception {} << "cannot convert a transaction of version " << Version;
        return raw_tx_v1 {ID, Spends.apply_witness (WitnessData)};
    }

    maybe<nockchain_tx> nockchain_tx::from_noun (const noun &n) {
        nockchain_tx x {};
        std::string id;
        if (!read_tuple (n, x.Version, id, x.Spends, x.Display, x.WitnessData) || x.Version != version::V1) return {};

        maybe<digest> d = digest::read_base58 (id);
        if (!bool (d)) return {};
        x.ID = *d;
        return x;
    }

    noun input_display::to_noun () const {
        if (const auto *m = std::get_if<ordered_map<name, legacy::sig>> (this); bool (m))
            return encode_tuple (version::V0, *m);
        return encode_tuple (version::V1, std::get<ordered_map<name, spend_condition>> (*this));
    }

    maybe<input_display> input_display::from_noun (const noun &n) {
        version v {};
        noun m {};
        if (!read_tuple (n, v, m)) return {};

        if (v == version::V0) {
            maybe<ordered_map<name, legacy::sig>> x = ordered_map<name, legacy::sig>::from_noun (m);
            if (!bool (x)) return {};
            return input_display {*x};
        }

        if (v == version::V1) {
            maybe<ordered_map<name, spend_condition>> x = ordered_map<name, spend_condition>::from_noun (m);
            if (!bool (x)) return {};
            return input_display {*x};
        }

        return {};
    }

    std::vector<note> raw_tx::outputs () const {
        std::vector<note> outputs {};
        if (const auto *x = v0 (); bool (x)) {
            for (const legacy::note &o : x->outputs ()) outputs.push_back (note {o});
            return outputs;
        }

        for (const note_v1 &o : v1 ()->outputs ()) outputs.push_back (note {o});
        return outputs;
    }

    noun raw_tx::to_noun () const {
        if (const auto *x = v0 (); bool (x)) return x->to_noun ();
        return encode_tuple (uint32 {1}, *v1 ());
    }

    maybe<raw_tx> raw_tx::from_noun (const noun &n) {
        if (maybe<legacy::raw_tx> x = legacy::raw_tx::from_noun (n); bool (x)) return raw_tx {*x};

        uint32 v {};
        raw_tx_v1 x {};
        if (!read_tuple (n, v, x) || v != 1) return {};
        return raw_tx {x};
    }

}
