#include <Iris/tx/spend.hpp>

namespace Iris {

    witness witness::take_data () {
        witness w {};
        w.LockMerkleProof = LockMerkleProof;
        w.PkhSignature = std::move (PkhSignature);
        w.HaxMap = std::move (HaxMap);
        PkhSignature.clear ();
        HaxMap.clear ();
        return w;
    }

    const nicks &spend::fee () const {
        if (const auto *s = s0 (); bool (s)) return s->Fee;
        return s1 ()->Fee;
    }

    nicks &spend::fee () {
        if (auto *s = s0 (); bool (s)) return s->Fee;
        return s1 ()->Fee;
    }

    const seeds &spend::get_seeds () const {
        if (const auto *s = s0 (); bool (s)) return s->Seeds;
        return s1 ()->Seeds;
    }

    seeds &spend::get_seeds () {
        if (auto *s = s0 (); bool (s)) return s->Seeds;
        return s1 ()->Seeds;
    }

    digest spend::sig_hash () const {
        return hash_tuple (get_seeds ().sig_hash (), fee ());
    }

    std::pair<std::size_t, std::size_t> spend::words () const {
        std::size_t seed_words = get_seeds ().note_data_words ();
        if (const auto *s = s0 (); bool (s)) return {seed_words, s->Signature.to_noun ().words ()};
        return {seed_words, s1 ()->Witness.to_noun ().words ()};
    }

    void spend::add_signature (const public_key &pk, const signature &x) {
        if (auto *s = s0 (); bool (s)) s->Signature.add_entry (pk, x);
        else s1 ()->Witness.PkhSignature.insert (pk.hash (), std::pair<public_key, signature> {pk, x});
    }

    digest spend::add_preimage (const noun &preimage) {
        digest d = preimage.hash ();
        if (auto *s = s1 (); bool (s)) s->Witness.HaxMap.insert (d, preimage);
        return d;
    }

    void spend::clear_signatures () {
        if (auto *s = s0 (); bool (s)) s->Signature.clear ();
        else s1 ()->Witness.PkhSignature.clear ();
    }

    noun spend::to_noun () const {
        if (const auto *s = s0 (); bool (s)) return encode_tuple (version::V0, s->Signature, s->Seeds, s->Fee);
        const witness_spend &s = *s1 ();
        return encode_tuple (version::V1, s.Witness, s.Seeds, s.Fee);
    }

    digest spend::hash () const {
        if (const auto *s = s0 (); bool (s)) return hash_tuple (version::V0, s->Signature, s->Seeds, s->Fee);
        const witness_spend &s = *s1 ();
        return hash_tuple (version::V1, s.Witness, s.Seeds, s.Fee);
    }

    maybe<spend> spend::from_noun (const noun &n) {
        version v {};
        noun auth {};
        seeds s {};
        nicks fee {};
        if (!read_tuple (n, v, auth, s, fee)) return {};

        if (v == version::V0) {
            maybe<legacy::signatures> x = legacy::signatures::from_noun (auth);
            if (!bool (x)) return {};
            return spend {legacy_spend {*x, s, fee}};
        }

        if (v == version::V1) {
            maybe<witness> w = witness::from_noun (auth);
            if (!bool (w)) return {};
            return spend {witness_spend {*w, s, fee}};
        }

        return {};
    }

    std::pair<spends, witness_data> spends::split_witness () const {
        std::pair<spends, witness_data> split {};
        for (const auto &[n, x] : *this) {
            spend s = x;
            if (auto *w = s.s1 (); bool (w)) split.second.Data.insert (n, w->Witness.take_data ());
            split.first.insert (n, s);
        }
        return split;
    }

    spends spends::apply_witness (const witness_data &d) const {
        spends applied {};
        for (const auto &[n, x] : *this) {
            spend s = x;
            if (auto *w = s.s1 (); bool (w))
                if (const witness *v = d.Data.contains (n); bool (v)) w->Witness = *v;
            applied.insert (n, s);
        }
        return applied;
    }

}
