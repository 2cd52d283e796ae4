#include <Iris/tx/builder.hpp>
#include <algorithm>
#include <iterator>

namespace Iris {

    namespace {
        template <typename X> std::ostream &write_set (std::ostream &o, const std::set<X> &x) {
            o << "{";
            bool first = true;
            for (const X &v : x) {
                if (!first) o << ", ";
                o << v;
                first = false;
            }
            return o << "}";
        }
    }

    std::ostream &operator << (std::ostream &o, const missing_unlock &u) {
        if (const auto *p = std::get_if<missing_pkh> (&u); bool (p))
            return write_set (o << "Pkh {num_sigs: " << p->NumSigs << ", sig_of: ", p->SigOf) << "}";

        if (const auto *h = std::get_if<missing_hax> (&u); bool (h))
            return write_set (o << "Hax {preimages_for: ", h->PreimagesFor) << "}";

        if (const auto *s = std::get_if<missing_sig> (&u); bool (s))
            return write_set (o << "Sig {num_sigs: " << s->NumSigs << ", sig_of: ", s->SigOf) << "}";

        return o << "Brn";
    }

    std::ostream &operator << (std::ostream &o, build_error::kind k) {
        switch (k) {
            case build_error::kind::ZeroGift: return o << "Cannot create a transaction with zero gift";
            case build_error::kind::InsufficientFunds: return o << "Insufficient funds to pay fee and gift";
            case build_error::kind::AccountingMismatch: return o << "Assets in must equal gift + fee + refund";
            case build_error::kind::NoteNotFound: return o << "Unable to find note";
            case build_error::kind::InvalidFee: return o << "Insufficient fee for transaction";
            case build_error::kind::InvalidVersion: return o << "Invalid RawTx version";
            case build_error::kind::InvalidSpendCondition: return o << "Spend condition is invalid (mismatch?)";
            case build_error::kind::UnbalancedSpends: return o << "Some spends are not balanced (forgot to compute refunds?)";
            case build_error::kind::MissingSpendCondition: return o << "Spend condition is missing for this input note";
            case build_error::kind::MissingUnlocks: return o << "The note is not fully unlocked. The following unlocks are missing:";
        }

        return o << "unknown build error";
    }

    build_error::build_error (kind k): data::exception {}, Kind {k}, Note {}, Needed {}, Got {}, Unlocks {} {
        // the other messages need a payload and are written by the factories below.
        if (k != kind::NoteNotFound && k != kind::InvalidFee && k != kind::MissingUnlocks) *this << k;
    }

    build_error build_error::note_not_found (const name &n) {
        build_error e {kind::NoteNotFound};
        e.Note = n;
        e << kind::NoteNotFound << " " << n;
        return e;
    }

    build_error build_error::invalid_fee (nicks needed, nicks got) {
        build_error e {kind::InvalidFee};
        e.Needed = needed;
        e.Got = got;
        e << kind::InvalidFee << " (needed: " << needed.Value << ", got: " << got.Value << ")";
        return e;
    }

    build_error build_error::missing_unlocks (const std::vector<missing_unlock> &unlocks) {
        build_error e {kind::MissingUnlocks};
        e.Unlocks = unlocks;
        e << kind::MissingUnlocks;
        for (const missing_unlock &u : unlocks) e << " " << u;
        return e;
    }

    spend_builder::spend_builder (const note &n, const maybe<spend_condition> &sc, const maybe<spend_condition> &refund_lock):
        Note {n}, Spend {}, RefundLock {refund_lock} {
        if (n.get_version () == version::V0) Spend = Iris::spend::new_legacy (seeds {}, nicks {0});
        else {
            if (!bool (sc)) throw build_error {build_error::kind::MissingSpendCondition};
            Spend = Iris::spend::new_witness (witness {*sc}, seeds {}, nicks {0});
        }
    }

    maybe<spend_builder> spend_builder::from_spend (const Iris::spend &s, const note &n, const maybe<spend_condition> &refund_lock) {
        if (s.get_version () != n.get_version ()) return {};
        spend_builder b {};
        b.Note = n;
        b.Spend = s;
        b.RefundLock = refund_lock;
        return b;
    }

    spend_builder &spend_builder::fee (nicks fee_portion) {
        if (Spend.fee () != fee_portion) invalidate_sigs ();
        Spend.fee () = fee_portion;
        return *this;
    }

    spend_builder &spend_builder::compute_refund (bool include_lock_data) {
        if (!bool (RefundLock)) return *this;

        invalidate_sigs ();
        digest refund_root = RefundLock->hash ();

        seeds &s = Spend.get_seeds ();
        s = s.filter ([&refund_root] (const Iris::seed &x) -> bool {
            return x.LockRoot.hash () != refund_root;
        });

        nicks refund = Note.assets () - Spend.fee () - s.total_gift ();
        if (refund > nicks {0}) s.insert (build_seed (*RefundLock, refund, include_lock_data));

        return *this;
    }

    const Iris::seed *spend_builder::cur_refund () const {
        if (!bool (RefundLock)) return nullptr;
        digest refund_root = RefundLock->hash ();
        for (const Iris::seed &x : Spend.get_seeds ()) if (x.LockRoot.hash () == refund_root) return &x;
        return nullptr;
    }

    bool spend_builder::is_balanced () const {
        return Note.assets () == Spend.get_seeds ().total_gift () + Spend.fee ();
    }

    Iris::seed spend_builder::build_seed (const spend_condition &lock, nicks gift, bool include_lock_data) const {
        note_data data {};
        if (include_lock_data) data.push_lock (lock);
        return Iris::seed {{}, lock_root {lock}, data, gift, Note.hash ()};
    }

    spend_builder &spend_builder::seed (const Iris::seed &x) {
        invalidate_sigs ();
        Spend.get_seeds ().insert (x);
        return *this;
    }

    spend_builder &spend_builder::invalidate_sigs () {
        Spend.clear_signatures ();
        return *this;
    }

    std::vector<missing_unlock> spend_builder::missing_unlocks () const {
        std::vector<missing_unlock> missing {};

        if (const legacy_spend *s = Spend.s0 (); bool (s)) {
            const legacy::note *n = Note.v0 ();
            if (!bool (n)) throw data::exception {} << "legacy spend of a note of version " << Note.get_version ();

            std::set<public_key> valid {};
            for (const public_key &pk : n->Sig.Pubkeys) valid.insert (pk);

            std::set<public_key> checked {};
            for (const auto &[pk, _] : s->Signature) if (valid.count (pk) != 0) checked.insert (pk);

            if (checked.size () < n->Sig.M) {
                std::set<public_key> sig_of {};
                std::set_difference (valid.begin (), valid.end (), checked.begin (), checked.end (),
                    std::inserter (sig_of, sig_of.end ()));
                missing.push_back (missing_sig {n->Sig.M - checked.size (), sig_of});
            }

            return missing;
        }

        const witness &w = Spend.s1 ()->Witness;
        const spend_condition &sc = w.LockMerkleProof.SpendCondition;

        std::set<digest> present {};
        for (const auto &[h, _] : w.PkhSignature) present.insert (h);

        for (const pkh *p : sc.pkhs ()) {
            std::set<digest> valid {};
            for (const digest &h : p->Hashes) valid.insert (h);

            std::set<digest> checked {};
            std::set_intersection (present.begin (), present.end (), valid.begin (), valid.end (),
                std::inserter (checked, checked.end ()));

            if (checked.size () < p->M) {
                std::set<digest> sig_of {};
                std::set_difference (valid.begin (), valid.end (), checked.begin (), checked.end (),
                    std::inserter (sig_of, sig_of.end ()));
                missing.push_back (missing_pkh {p->M - checked.size (), sig_of});
            }
        }

        for (const hax *h : sc.haxes ()) {
            std::set<digest> preimages_for {};
            for (const digest &d : h->Hashes) if (!w.HaxMap.contains_key (d)) preimages_for.insert (d);
            if (!preimages_for.empty ()) missing.push_back (missing_hax {preimages_for});
        }

        if (sc.brn ()) missing.push_back (missing_brn {});

        return missing;
    }

    maybe<digest> spend_builder::add_preimage (const noun &preimage) {
        witness_spend *s = Spend.s1 ();
        if (!bool (s)) return {};

        digest d = preimage.hash ();
        for (const hax *h : s->Witness.LockMerkleProof.SpendCondition.haxes ())
            if (h->Hashes.contains (d)) {
                s->Witness.HaxMap.insert (d, preimage);
                return d;
            }

        return {};
    }

    bool spend_builder::sign (const private_key &key) {
        public_key pk = key.to_public ();
        digest message = Spend.sig_hash ();

        if (witness_spend *s = Spend.s1 (); bool (s)) {
            digest key_hash = pk.hash ();
            for (const pkh *p : s->Witness.LockMerkleProof.SpendCondition.pkhs ())
                if (p->Hashes.contains (key_hash)) {
                    s->Witness.PkhSignature.insert (key_hash, std::pair<public_key, signature> {pk, key.sign (message)});
                    return true;
                }

            return false;
        }

        const legacy::note *n = Note.v0 ();
        if (!bool (n)) throw data::exception {} << "legacy spend of a note of version " << Note.get_version ();

        if (!n->Sig.Pubkeys.contains (pk)) return false;
        Spend.s0 ()->Signature.add_entry (pk, key.sign (message));
        return true;
    }

    nicks spend_builder::unclamped_fee (nicks fee_per_word, uint64 signature_words) const {
        nicks fee = Spend.unclamped_fee (fee_per_word);

        // only missing signatures are budgeted for.
        for (const missing_unlock &u : missing_unlocks ())
            if (const auto *p = std::get_if<missing_pkh> (&u); bool (p))
                fee += fee_per_word * nicks {signature_words} * nicks {p->NumSigs};

        return fee;
    }

    tx_builder tx_builder::from_tx (const raw_tx &tx, std::map<name, input> notes) {
        const raw_tx_v1 *v1 = tx.v1 ();
        if (!bool (v1)) throw build_error {build_error::kind::InvalidVersion};

        tx_builder b {tx_engine_settings {}};
        for (const auto &[n, s] : v1->Spends) {
            auto it = notes.find (n);
            if (it == notes.end ()) throw build_error::note_not_found (n);

            maybe<spend_builder> x = spend_builder::from_spend (s, it->second.first, it->second.second);
            if (!bool (x)) throw build_error {build_error::kind::InvalidSpendCondition};

            b.Spends.emplace (n, *x);
            notes.erase (it);
        }

        return b;
    }

    maybe<spend_builder> tx_builder::spend (const spend_builder &s) {
        name n = s.Note.get_name ();
        auto it = Spends.find (n);
        if (it == Spends.end ()) {
            Spends.emplace (n, s);
            return {};
        }

        spend_builder replaced = it->second;
        it->second = s;
        return replaced;
    }

    tx_builder &tx_builder::simple_spend_base (const std::vector<input> &notes,
        const digest &recipient, nicks gift, const digest &refund_pkh, bool include_lock_data) {
        if (gift == nicks {0}) throw build_error {build_error::kind::ZeroGift};

        spend_condition refund_lock = spend_condition::new_pkh (pkh::single (refund_pkh));
        nicks remaining_gift = gift;

        for (const auto &[n, sc] : notes) {
            nicks gift_portion = std::min (remaining_gift, n.assets ());
            remaining_gift -= gift_portion;

            spend_builder s {n, sc, refund_lock};
            if (gift_portion > nicks {0})
                s.seed (s.build_seed (spend_condition::new_pkh (pkh::single (recipient)), gift_portion, include_lock_data));

            s.compute_refund (include_lock_data);
            if (!s.is_balanced ()) throw build_error {build_error::kind::AccountingMismatch};

            if (gift_portion > nicks {0}) spend (s);
            else FeePool.push_back (s);
        }

        if (remaining_gift > nicks {0}) throw build_error {build_error::kind::InsufficientFunds};

        return *this;
    }

    tx_builder &tx_builder::simple_spend (const std::vector<input> &notes,
        const digest &recipient, nicks gift, const digest &refund_pkh, bool include_lock_data) {
        return simple_spend_base (notes, recipient, gift, refund_pkh, include_lock_data).recalc_and_set_fee (include_lock_data);
    }

    maybe<digest> tx_builder::add_preimage (const noun &preimage) {
        maybe<digest> added {};
        for (auto &[_, s] : Spends) if (maybe<digest> d = s.add_preimage (preimage); bool (d)) added = d;
        return added;
    }

    tx_builder &tx_builder::sign (const private_key &key) {
        for (auto &[_, s] : Spends) s.sign (key);
        return *this;
    }

    tx_builder &tx_builder::validate () {
        nicks current = cur_fee ();
        nicks needed = calc_fee ();
        if (current < needed) throw build_error::invalid_fee (needed, current);

        for (const auto &[_, s] : Spends) if (!s.is_balanced ()) throw build_error {build_error::kind::UnbalancedSpends};

        std::vector<missing_unlock> unlocks {};
        for (const auto &[_, s] : Spends)
            for (const missing_unlock &u : s.missing_unlocks ()) unlocks.push_back (u);

        if (!unlocks.empty ()) throw build_error::missing_unlocks (unlocks);

        return *this;
    }

    nockchain_tx tx_builder::build () const {
        transaction_display display {};
        Iris::spends spends {};

        for (const auto &[n, s] : Spends) {
            if (const witness_spend *w = s.Spend.s1 (); bool (w)) {
                // a witness spend turns the display into a map of spend conditions.
                if (display.Inputs.get_version () == version::V0)
                    display.Inputs = input_display {ordered_map<name, spend_condition> {}};
                std::get<ordered_map<name, spend_condition>> (display.Inputs).insert (n, w->Witness.LockMerkleProof.SpendCondition);
            } else if (const legacy::note *v = s.Note.v0 (); bool (v) && display.Inputs.get_version () == version::V0)
                std::get<ordered_map<name, legacy::sig>> (display.Inputs).insert (n, v->Sig);

            for (const Iris::seed &x : s.Spend.get_seeds ())
                if (const spend_condition *lock = x.LockRoot.lock (); bool (lock))
                    display.Outputs.insert (lock->hash (), lock_metadata {*lock});

            spends.insert (n, s.Spend);
        }

        tx_id id = raw_tx_v1::calc_id (spends);
        auto [core, w] = spends.split_witness ();
        return nockchain_tx {id, core, display, w};
    }

    std::map<name, tx_builder::input> tx_builder::all_notes () const {
        std::map<name, input> notes {};
        for (const auto &[n, s] : Spends) {
            maybe<spend_condition> sc {};
            if (const witness_spend *w = s.Spend.s1 (); bool (w)) sc = w->Witness.LockMerkleProof.SpendCondition;
            notes.emplace (n, input {s.Note, sc});
        }
        return notes;
    }

    nicks tx_builder::cur_fee () const {
        nicks fee {0};
        for (const auto &[_, s] : Spends) fee += s.Spend.fee ();
        return fee;
    }

    nicks tx_builder::calc_fee () const {
        nicks fee {0};
        for (const auto &[_, s] : Spends) fee += s.unclamped_fee (Settings.FeePerWord, Settings.SignatureWords);
        return std::max (fee, Settings.MinFee);
    }

    tx_builder &tx_builder::recalc_and_set_fee (bool include_lock_data) {
        return set_fee_and_balance_refund (calc_fee (), true, include_lock_data);
    }

    namespace {
        nicks non_refund_assets (const spend_builder &s) {
            const seed *r = s.cur_refund ();
            return s.Note.assets () - (bool (r) ? r->Gift : nicks {0});
        }
    }

    tx_builder &tx_builder::set_fee_and_balance_refund (nicks fee, bool adjust_fee, bool include_lock_data) {
        nicks current = cur_fee ();
        if (current == fee) return *this;

        std::vector<spend_builder *> active {};
        for (auto &[_, s] : Spends) active.push_back (&s);

        if (current < fee) {
            nicks fee_left = fee - current;

            // spends that give the most away come first, then the highest fee, then the greatest name.
            std::stable_sort (active.begin (), active.end (), [] (const spend_builder *a, const spend_builder *b) -> bool {
                nicks anra = non_refund_assets (*a);
                nicks bnra = non_refund_assets (*b);
                if (anra != bnra) return bnra < anra;
                if (a->Spend.fee () != b->Spend.fee ()) return b->Spend.fee () < a->Spend.fee ();
                return b->Note.get_name () < a->Note.get_name ();
            });

            for (spend_builder *s : active) {
                const seed *r = s->cur_refund ();
                if (!bool (r)) continue;

                std::size_t words = r->note_data_words ();
                nicks sub_refund = std::min (r->Gift, fee_left);
                if (sub_refund == nicks {0}) continue;

                s->fee (s->Spend.fee () + sub_refund);
                fee_left -= sub_refund;
                s->compute_refund (include_lock_data);

                // the refund seed is gone and so is the fee for its note data.
                if (adjust_fee && !bool (s->cur_refund ()))
                    fee_left -= std::min (fee_left, Settings.FeePerWord * nicks {words});
            }

            // the pool is popped from the back, so the largest notes are drawn on first.
            std::stable_sort (FeePool.begin (), FeePool.end (), [] (const spend_builder &a, const spend_builder &b) -> bool {
                return a.Note.assets () < b.Note.assets ();
            });

            while (fee_left > nicks {0} && !FeePool.empty ()) {
                spend_builder r = std::move (FeePool.back ());
                FeePool.pop_back ();

                r.compute_refund (include_lock_data);
                const seed *rs = r.cur_refund ();
                if (!bool (rs)) throw data::exception {} << "fee pool entry " << r.Note.get_name () << " has no refund";

                if (adjust_fee) fee_left += r.unclamped_fee (Settings.FeePerWord, Settings.SignatureWords);

                nicks sub_refund = std::min (rs->Gift, fee_left);
                if (sub_refund > nicks {0}) {
                    r.fee (r.Spend.fee () + sub_refund);
                    fee_left -= sub_refund;
                    r.compute_refund (include_lock_data);
                }

                spend (r);
            }

            if (fee_left > nicks {0}) throw build_error {build_error::kind::InsufficientFunds};
            return *this;
        }

        nicks refund_left = current - fee;

        // spends with nothing but a refund come first, then the lowest fee, then the least given away.
        std::stable_sort (active.begin (), active.end (), [] (const spend_builder *a, const spend_builder *b) -> bool {
            bool aor = a->Spend.get_seeds ().size () == 1 && bool (a->cur_refund ());
            bool bor = b->Spend.get_seeds ().size () == 1 && bool (b->cur_refund ());
            if (aor != bor) return aor;
            if (a->Spend.fee () != b->Spend.fee ()) return a->Spend.fee () < b->Spend.fee ();
            nicks anra = non_refund_assets (*a);
            nicks bnra = non_refund_assets (*b);
            if (anra != bnra) return anra < bnra;
            return b->Note.get_name () < a->Note.get_name ();
        });

        std::vector<name> return_to_pool {};

        for (spend_builder *s : active) {
            if (!bool (s->RefundLock)) continue;

            nicks add_refund = std::min (s->Spend.fee (), refund_left);
            if (add_refund > nicks {0}) {
                s->fee (s->Spend.fee () - add_refund);
                refund_left -= add_refund;
                s->compute_refund (include_lock_data);
            }

            // the spend no longer pays anything, so it goes back to the pool and its own fee is freed.
            // TODO: the freed fee is overestimated when the total falls to the minimum fee.
            if (s->Spend.fee () == add_refund) {
                return_to_pool.push_back (s->Note.get_name ());
                refund_left = refund_left.saturating_sub (s->unclamped_fee (Settings.FeePerWord, Settings.SignatureWords));
            }
        }

        for (const name &n : return_to_pool) {
            auto it = Spends.find (n);
            FeePool.push_back (std::move (it->second));
            Spends.erase (it);
        }

        if (refund_left > nicks {0}) throw build_error {build_error::kind::AccountingMismatch};
        return *this;
    }

}
