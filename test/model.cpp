#include <Iris/tx/transaction.hpp>
#include <data/encoding/hex.hpp>
#include "gtest/gtest.h"

#include <sstream>

namespace Iris {

    static private_key model_key (byte b) {
        std::array<byte, 32> secret;
        secret.fill (b);
        return private_key {secret};
    }

    static spend_condition pkh_and_coinbase (const digest &h) {
        return spend_condition {lock_primitive {pkh::single (h)}, lock_primitive {timelock::coinbase ()}};
    }

    static note make_note (uint64 n, nicks assets) {
        return note {note_v1 {version::V1, 13, name {hash_belt (n), hash_belt (n + 1000)}, note_data {}, assets}};
    }

    static digest base58_digest (const std::string &str) {
        maybe<digest> d = digest::read_base58 (str);
        if (!bool (d)) throw data::exception {} << "could not read digest " << str;
        return *d;
    }

    // a version 1 transaction with two witness spends, taken from the ledger.
    const std::string TransactionHex =
        "7101047c379f8ffbd300a503081807fe895b2c89ca071070f500fb178f756a0f2020d6f8dc7daec0a90810b0c9e9665210f9"
        "2bac0208cc4ede056771030906f8b1287cb3c0c9c3bb0104e24490e2e1c0b5880308a0748189a8b6669c037e93e53b87dd89"
        "cb6601f6d296b46758cb841f200ff63aba955efdeb0002d2eb569bde85c692017ec49e7977f2e1563e4080f1d0ecca4acbdc"
        "dbb82ae0c1ada1e30208302f6b7482f1300f061050861696e5aa69a20f20c01f65b4e7a52bac1b40802654a715537af51220"
        "f0cd44601ca826519b1a1760f7f0feb4a08cd6e701fe83df4a788b5dfe6280fe1575b988d421e10c20b0812cad8144baf40f"
        "f8932478f409ad48cd56c3c5b302082c143e2881c4867b06e89d0ff9cf9bb7f0f00002e3db85de4bcc71c3017ac4694ccfe9"
        "6c253b800086a0bb8b404bed28e0671d5b29445746b317a0a7bd518a3ba839b603e4b38b0120593fd11ce0574d6a59738959"
        "d50610704c8929038c39540fb0374561f9170c5968800046a2cc5ca7cd4a3717205864ed680fe831abb77280409696393d40"
        "e02c6fcb18f05706c6b001821e18a6d400014cc33d35d03ff3c6d800818e30096a8040dd3f4e3d40e0d869de1ef0bd12d7a8"
        "0191325833e0f23e8f316017380d75e0b3cd96ea8723f47084ae2c8080c28edfa6cd00287700012b7115916b50e7ce00b921"
        "17c2d849713e0610c06ff5f8b0b6c5b807fcf4e104e7329368c40c6800007380bf5feb45a2a01ab619a0675ed1c4b170e644"
        "03fce481d6412190c5c700bff236677af1d8771220c044d5424598bea49a65c3513a03a6f317c2612de17084061e002030ab"
        "0002e578b5eaa5f12db901febec80c05397433700081bec1757695bd8de000ff20075a70c1e87d13205040bf385d63fb1c5f"
        "008137df35146a01dded00bb003544c8641f3b0d20101aa5d5010051951e40a0cbb7e981d738b91bf0bbc7f2086a67adfc8d"
        "ab862b66010f2d0c5f80bd9061b4d8dc9d0007e837a5793fb26948ca003feca5910f43d3e53c8000554e10b75366223aa057"
        "365e63c375d8898723b4714396bbd570f16cc81b2c40005bf9e71dd0e13e7bc4808ed12155060876b3f5f303047a46fda701"
        "3dcc9a590c1010a0caeb027fdf905e182048d7f3390f10f8d0dbaa07f4dd35de334040cd14e718d02bd0f1f4008114433a6e"
        "405f2574e181bfa30a0e1c8ed0c311bab221cb3d031a00801c4040010fb51fb88b0e3f8080bff571977ed87e6080ff362236"
        "762e30511b40c068f3d707b6c4751ef073cd9cdbe81d7090b36c384a0fdbb28723b4c3111a";

    TEST (Model, Nicks) {
        EXPECT_EQ (nicks {3} + nicks {4}, nicks {7});
        EXPECT_THROW (nicks {3} - nicks {4}, data::exception);
        EXPECT_THROW (nicks {0xffffffffffffffffull} + nicks {1}, data::exception);
        EXPECT_EQ (nicks {3}.saturating_sub (nicks {4}), nicks {0});

        std::stringstream ss;
        ss << nicks {nicks::PerNock * 2 + 5};
        EXPECT_EQ (ss.str (), "2.5");
    }

    TEST (Model, TimelockRangeZeroIsUnbounded) {
        EXPECT_EQ (timelock_range (block_height {0}, block_height {0}), timelock_range::none ());
        EXPECT_FALSE (bool (timelock_range (block_height {0}, block_height {7}).Min));
        EXPECT_EQ (timelock_range (block_height {0}, block_height {7}).Max, maybe<block_height> {7});
    }

    TEST (Model, SpendConditionNoun) {
        digest h = hash_belt (1);
        spend_condition sc {
            lock_primitive {pkh::single (h)},
            lock_primitive {timelock::coinbase ()},
            lock_primitive {hax {ordered_set<digest> {hash_belt (2), hash_belt (3)}}},
            lock_primitive {burn {}}};

        maybe<spend_condition> read = spend_condition::from_noun (sc.to_noun ());
        ASSERT_TRUE (bool (read));
        EXPECT_EQ (*read, sc);
        EXPECT_EQ (read->hash (), sc.hash ());

        EXPECT_EQ (sc.pkhs ().size (), 1u);
        EXPECT_EQ (sc.tims ().size (), 1u);
        EXPECT_EQ (sc.haxes ().size (), 1u);
        EXPECT_TRUE (sc.brn ());

        EXPECT_EQ (lock_primitive {pkh::single (h)}.to_noun ().head (), noun::cord ("pkh"));
        EXPECT_FALSE (bool (lock_primitive::from_noun (encode_tuple (std::string {"xyz"}, uint64 {0}))));
    }

    TEST (Model, FirstName) {
        spend_condition sc = pkh_and_coinbase (hash_belt (1));
        name n = name::new_v1 (sc.hash (), source {hash_belt (2), false});
        EXPECT_EQ (sc.first_name (), n.First);
        EXPECT_EQ (n.First, name::new_v1 (sc.hash (), source {hash_belt (3), true}).First);
        EXPECT_NE (n.Last, name::new_v1 (sc.hash (), source {hash_belt (3), true}).Last);

        maybe<name> read = name::from_noun (n.to_noun ());
        ASSERT_TRUE (bool (read));
        EXPECT_EQ (*read, n);
        EXPECT_FALSE (bool (name::from_noun (encode_tuple (n.First, n.Last, uint64 {1}))));
    }

    TEST (Model, NoteVersionsDecode) {
        note v1 = make_note (1, 3000);
        maybe<note> read1 = note::from_noun (v1.to_noun ());
        ASSERT_TRUE (bool (read1));
        EXPECT_EQ (read1->get_version (), version::V1);
        EXPECT_EQ (*read1->v1 (), *v1.v1 ());

        public_key pk = model_key (0x01).to_public ();
        legacy::sig owner = legacy::sig::single (pk);
        source src {hash_belt (9), true};
        timelock_intent tl {timelock::coinbase ()};
        note v0 {legacy::note {legacy::note_inner {version::V0, 5, tl}, name::new_v0 (owner, src, tl), owner, src, 100}};

        maybe<note> read0 = note::from_noun (v0.to_noun ());
        ASSERT_TRUE (bool (read0));
        EXPECT_EQ (read0->get_version (), version::V0);
        EXPECT_EQ (*read0->v0 (), *v0.v0 ());
        EXPECT_EQ (read0->assets (), nicks {100});
        EXPECT_EQ (read0->origin_page (), 5u);
        EXPECT_EQ (read0->hash (), v0.hash ());

        // a version 2 head is neither.
        note_v1 bad = *v1.v1 ();
        bad.Version = version::V2;
        EXPECT_FALSE (bool (note::from_noun (bad.to_noun ())));
    }

    TEST (Model, SeedHashes) {
        seed a = seed::new_single_pkh (hash_belt (1), 500, hash_belt (2), false);
        seed b = a;
        b.OutputSource = source {hash_belt (3), false};

        EXPECT_EQ (a.content_hash (), b.content_hash ());
        EXPECT_EQ (a.hash (), b.hash ());
        EXPECT_NE (a.signing_hash (), b.signing_hash ());

        seeds sa {a};
        seeds sb {b};
        EXPECT_EQ (sa.hash (), sb.hash ());
        EXPECT_NE (sa.sig_hash (), sb.sig_hash ());

        maybe<seed> read = seed::from_noun (b.to_noun ());
        ASSERT_TRUE (bool (read));
        EXPECT_EQ (read->OutputSource, b.OutputSource);
        EXPECT_EQ (read->LockRoot.hash (), b.LockRoot.hash ());
        EXPECT_EQ (read->signing_hash (), b.signing_hash ());
    }

    TEST (Model, NoteDataWords) {
        EXPECT_EQ (note_data {}.words (), 1u);
        seed with_data = seed::new_single_pkh (hash_belt (1), 500, hash_belt (2), true);
        seed without = seed::new_single_pkh (hash_belt (1), 500, hash_belt (2), false);
        EXPECT_GT (with_data.note_data_words (), without.note_data_words ());
        EXPECT_NE (with_data.hash (), without.hash ());

        maybe<note_data> read = note_data::from_noun (with_data.NoteData.to_noun ());
        ASSERT_TRUE (bool (read));
        EXPECT_EQ (read->hash (), with_data.NoteData.hash ());
    }

    TEST (Model, WitnessWords) {
        witness w {pkh_and_coinbase (hash_belt (1))};
        EXPECT_EQ (w.to_noun ().words (), 26u);

        spend s = spend::new_witness (w, seeds {seed::new_single_pkh (hash_belt (2), 10, hash_belt (3), false)}, 256);
        EXPECT_EQ (s.words (), (std::pair<std::size_t, std::size_t> {1, 26}));
        EXPECT_EQ (s.unclamped_fee (2), nicks {54});

        private_key k = model_key (0x01);
        s.add_signature (k.to_public (), k.sign (s.sig_hash ()));
        EXPECT_EQ (s.words ().second, 26u + 35u);
    }

    TEST (Model, SpendNoun) {
        private_key k = model_key (0x01);
        seeds x {seed::new_single_pkh (hash_belt (2), 10, hash_belt (3), false)};

        spend s1 = spend::new_witness (witness {pkh_and_coinbase (k.to_public ().hash ())}, x, 300);
        s1.add_signature (k.to_public (), k.sign (s1.sig_hash ()));
        s1.add_preimage (noun {42});

        maybe<spend> read1 = spend::from_noun (s1.to_noun ());
        ASSERT_TRUE (bool (read1));
        EXPECT_EQ (read1->get_version (), version::V1);
        EXPECT_EQ (*read1->s1 (), *s1.s1 ());
        EXPECT_EQ (read1->hash (), s1.hash ());

        spend s0 = spend::new_legacy (x, 300);
        s0.add_signature (k.to_public (), k.sign (s0.sig_hash ()));
        EXPECT_EQ (s0.add_preimage (noun {42}), noun {42}.hash ());

        maybe<spend> read0 = spend::from_noun (s0.to_noun ());
        ASSERT_TRUE (bool (read0));
        EXPECT_EQ (read0->get_version (), version::V0);
        EXPECT_EQ (*read0->s0 (), *s0.s0 ());

        EXPECT_NE (s0.hash (), s1.hash ());
    }

    TEST (Model, SigHashCoversFee) {
        seeds x {seed::new_single_pkh (hash_belt (2), 10, hash_belt (3), false)};
        spend a = spend::new_witness (witness {pkh_and_coinbase (hash_belt (1))}, x, 300);
        spend b = spend::new_witness (witness {pkh_and_coinbase (hash_belt (1))}, x, 301);
        EXPECT_NE (a.sig_hash (), b.sig_hash ());

        // the witness is not part of what is signed.
        spend c = spend::new_witness (witness {pkh_and_coinbase (hash_belt (5))}, x, 300);
        EXPECT_EQ (a.sig_hash (), c.sig_hash ());
    }

    TEST (Model, FeeForMany) {
        spends s {};
        s.insert (name {hash_belt (1), hash_belt (2)},
            spend::new_witness (witness {pkh_and_coinbase (hash_belt (1))}, seeds {seed::new_single_pkh (hash_belt (2), 10, hash_belt (3), false)}, 0));
        EXPECT_EQ (s.fee (1), nicks {256});
        EXPECT_EQ (s.fee (1, 0), nicks {27});
        EXPECT_EQ (s.fee (100), nicks {2700});
    }

    TEST (Model, OutputsByLock) {
        digest alice = hash_belt (100);
        digest bob = hash_belt (200);

        spends s {};
        s.insert (name {hash_belt (1), hash_belt (2)}, spend::new_witness (witness {pkh_and_coinbase (hash_belt (7))},
            seeds {seed::new_single_pkh (alice, 10, hash_belt (11), false), seed::new_single_pkh (bob, 20, hash_belt (11), false)}, 256));
        s.insert (name {hash_belt (3), hash_belt (4)}, spend::new_witness (witness {pkh_and_coinbase (hash_belt (7))},
            seeds {seed::new_single_pkh (alice, 30, hash_belt (12), false)}, 256));

        raw_tx_v1 tx {s};
        EXPECT_EQ (tx.ID, raw_tx_v1::calc_id (s));

        std::vector<note_v1> outputs = tx.outputs ();
        ASSERT_EQ (outputs.size (), 2u);

        digest alice_lock = spend_condition::new_pkh (pkh::single (alice)).hash ();
        digest bob_lock = spend_condition::new_pkh (pkh::single (bob)).hash ();

        for (const note_v1 &o : outputs) {
            EXPECT_EQ (o.Version, version::V1);
            EXPECT_EQ (o.OriginPage, 0u);
            if (o.Name.First == hash_tuple (true, alice_lock)) EXPECT_EQ (o.Assets, nicks {40});
            else {
                EXPECT_EQ (o.Name.First, hash_tuple (true, bob_lock));
                EXPECT_EQ (o.Assets, nicks {20});
            }
        }

        // the output source of a seed does not change the name of its output.
        spends t {};
        seed sourced = seed::new_single_pkh (bob, 20, hash_belt (11), false);
        sourced.OutputSource = source {hash_belt (99), false};
        t.insert (name {hash_belt (1), hash_belt (2)}, spend::new_witness (witness {pkh_and_coinbase (hash_belt (7))},
            seeds {sourced}, 256));

        std::vector<note_v1> sourced_outputs = raw_tx_v1 {t}.outputs ();
        ASSERT_EQ (sourced_outputs.size (), 1u);
        for (const note_v1 &o : outputs) if (o.Name.First == hash_tuple (true, bob_lock))
            EXPECT_EQ (o.Name, sourced_outputs[0].Name);
    }

    TEST (Model, KnownHashes) {
        digest h = base58_digest ("6psXufjYNRxffRx72w8FF9b5MYg8TEmWq2nEFkqYm51yfqsnkJu8XqX");
        digest parent = base58_digest ("6qF9RtWRUWfCX8NS8QU2u7A3BufVrsMwwWWZ8KSzZ5gVn4syqmeVa4");

        seed seed1 = seed::new_single_pkh (h, 4290881913, parent, true);
        EXPECT_EQ (seed1.LockRoot.hash ().to_base58 (), "5bSsB8Hij6E3xefbs8WFdAw5CYSurBbJ4kL5kjoiuYFLak1eizq3v6b");
        EXPECT_EQ (seed1.NoteData.hash ().to_base58 (), "7hLhhBXik77vGuhxz9V9EKB5WcXhr692PsmV6AffGrQaxuF1df3kYUT");

        seed seed2 = seed1;
        seed2.Gift = 1234567;

        spend s = spend::new_witness (witness {pkh_and_coinbase (h)}, seeds {seed1, seed2}, 2850816);
        EXPECT_EQ (s.sig_hash ().to_base58 (), "B17CfQv9SuHTxn1k576S6EcKrxmb7WRcUFFx9eTXTzVyhtVVGwCKXSn");
        EXPECT_EQ (s.get_seeds ().hash ().to_base58 (), "7Zuskz3WibckR2anDXDuPcMUk45A2iJnrdPsFALj4Rc5NTufyca39gY");

        const lock_merkle_proof &proof = s.s1 ()->Witness.LockMerkleProof;
        EXPECT_EQ (proof.SpendCondition.Primitives[0].hash ().to_base58 (), "65RqCgowDZJziLZzpQkPULVy2tb1dMGMUrgsxxfC1mPPK6hSNKAP6DP");
        EXPECT_EQ (proof.SpendCondition.Primitives[1].hash ().to_base58 (), "B5RtZnbphbf1D5vQwsZjHycLN2Ldp7RD2pK6V3qAMFCrxnUXAhgmKgg");
        EXPECT_EQ (proof.SpendCondition.hash ().to_base58 (), "5k2qTDtcxyQWBmsVTi1fEmbSeoAnq5B83SGoJwDU8NJkRfXWevwQDWn");
        EXPECT_EQ (proof.Proof.hash ().to_base58 (), "MefKNQSmk8wzDzCPpY93GMdM53Pv1TGbUZe2Kn427FiuvbgjSZe5eJ");
        EXPECT_EQ (proof.hash ().to_base58 (), "6MNHCVrns4DjMxAV4CJQWKsPcpXPDSqizJsChgMYozsHsLBev52RRW1");

        name n {
            base58_digest ("2H7WHTE9dFXiGgx4J432DsCLuMovNkokfcnCGRg7utWGM9h13PgQvsH"),
            base58_digest ("7yMzrJjkb2Xu8uURP7YB3DFcotttR8dKDXF1tSp2wJmmXUvLM7SYzvM")};
        EXPECT_EQ (n.hash ().to_base58 (), "AvHDRESkhM9F2FMPiYFPeQ9GrL2kX8QkmHP8dGpVT8Pr2f8xM1SLGJW");
    }

    TEST (Model, LedgerTransaction) {
        maybe<bytes> b = encoding::hex::read (TransactionHex);
        ASSERT_TRUE (bool (b));

        maybe<noun> n = cue (*b);
        ASSERT_TRUE (bool (n));

        maybe<raw_tx_v1> tx = raw_tx_v1::from_noun (*n);
        ASSERT_TRUE (bool (tx));
        EXPECT_EQ (tx->to_noun (), *n);

        EXPECT_EQ (tx->ID.to_base58 (), "7dinV9KdtAUZgKhCZN1P8SZH9ux2RTe9kYUdh4fRvYWjX5wMopDQ6py");
        EXPECT_EQ (tx->calc_id ().to_base58 (), "ChtgwirfCoC1T8fg5EvkA6aGp9YPQh4mVxCDYrmhaBvq2oSCmpzrK6f");
        EXPECT_EQ (tx->Spends.size (), 2u);

        // every signature in the transaction is valid for its spend.
        std::size_t signatures = 0;
        for (const auto &[_, s] : tx->Spends) {
            const witness_spend *w = s.s1 ();
            ASSERT_TRUE (bool (w));
            digest m = s.sig_hash ();
            for (const auto &[k, v] : w->Witness.PkhSignature) {
                EXPECT_EQ (v.first.hash (), k);
                EXPECT_TRUE (v.second.verify (v.first, m));
                EXPECT_FALSE (v.second.verify (v.first, hash_belt (0)));
                signatures++;
            }
        }

        EXPECT_EQ (signatures, 2u);
    }

    TEST (Model, OutputsAreOrderedByLockRoot) {
        digest alice = hash_belt (100);
        digest bob = hash_belt (200);

        spends s {};
        s.insert (name {hash_belt (1), hash_belt (2)}, spend::new_witness (witness {pkh_and_coinbase (hash_belt (7))},
            seeds {seed::new_single_pkh (alice, 10, hash_belt (11), false), seed::new_single_pkh (bob, 20, hash_belt (11), false)}, 256));

        std::vector<note_v1> outputs = raw_tx_v1 {s}.outputs ();
        ASSERT_EQ (outputs.size (), 2u);

        digest alice_lock = spend_condition::new_pkh (pkh::single (alice)).hash ();
        digest bob_lock = spend_condition::new_pkh (pkh::single (bob)).hash ();
        ASSERT_NE (alice_lock, bob_lock);

        // lock roots compare belt 0 first.
        const digest &first = alice_lock.Belts[0] < bob_lock.Belts[0] ? alice_lock : bob_lock;
        EXPECT_EQ (outputs[0].Name.First, hash_tuple (true, first));
    }

    TEST (Model, LegacyOutputsByRecipient) {
        public_key alice = model_key (0x01).to_public ();
        public_key bob = model_key (0x02).to_public ();
        legacy::sig owner = legacy::sig::single (model_key (0x03).to_public ());

        auto input = [&] (uint64 n, std::initializer_list<legacy::seed> s) -> legacy::input {
            source src {hash_belt (n), false};
            legacy::note x {legacy::note_inner {}, name::new_v0 (owner, src, timelock_intent {}), owner, src, 1000};
            return legacy::input {x, legacy::spend {{}, legacy::seeds {s}, 100}};
        };

        legacy::input a = input (1, {legacy::seed::single (alice, 400, hash_belt (1)), legacy::seed::single (bob, 500, hash_belt (1))});
        legacy::input b = input (2, {legacy::seed::single (alice, 900, hash_belt (2))});

        legacy::inputs in {};
        in.insert (a.Note.Name, a);
        in.insert (b.Note.Name, b);

        legacy::raw_tx tx {};
        tx.Inputs = in;
        tx.TotalFees = 200;
        tx.ID = tx.calc_id ();

        std::vector<legacy::note> outputs = tx.outputs ();
        ASSERT_EQ (outputs.size (), 2u);
        for (const legacy::note &o : outputs) {
            EXPECT_EQ (o.Inner.Version, version::V0);
            EXPECT_FALSE (o.Source.IsCoinbase);
            if (o.Sig == legacy::sig::single (alice)) EXPECT_EQ (o.Assets, nicks {1300});
            else {
                EXPECT_EQ (o.Sig, legacy::sig::single (bob));
                EXPECT_EQ (o.Assets, nicks {500});
            }
            EXPECT_EQ (o.Name, name::new_v0 (o.Sig, o.Source, o.Inner.Timelock));
        }

        raw_tx wrapped {tx};
        maybe<raw_tx> read = raw_tx::from_noun (wrapped.to_noun ());
        ASSERT_TRUE (bool (read));
        EXPECT_EQ (read->get_version (), version::V0);
        EXPECT_EQ (*read->v0 (), tx);
        EXPECT_EQ (read->outputs ().size (), 2u);
    }

    TEST (Model, SplitAndApplyWitness) {
        private_key k = model_key (0x01);
        digest h = k.to_public ().hash ();

        spend s = spend::new_witness (witness {pkh_and_coinbase (h)}, seeds {seed::new_single_pkh (hash_belt (2), 10, hash_belt (3), false)}, 300);
        s.add_signature (k.to_public (), k.sign (s.sig_hash ()));

        spends all {};
        name n {hash_belt (1), hash_belt (2)};
        all.insert (n, s);

        auto [core, w] = all.split_witness ();
        ASSERT_NE (core.contains (n), nullptr);
        EXPECT_TRUE (core.contains (n)->s1 ()->Witness.PkhSignature.empty ());
        EXPECT_EQ (core.contains (n)->s1 ()->Witness.LockMerkleProof, s.s1 ()->Witness.LockMerkleProof);
        ASSERT_NE (w.Data.contains (n), nullptr);
        EXPECT_EQ (w.Data.contains (n)->PkhSignature.size (), 1u);

        // splitting leaves the source unchanged.
        EXPECT_EQ (all.contains (n)->s1 ()->Witness.PkhSignature.size (), 1u);

        spends applied = core.apply_witness (w);
        EXPECT_EQ (applied, all);
        EXPECT_EQ (raw_tx_v1::calc_id (applied), raw_tx_v1::calc_id (all));

        maybe<witness_data> read = witness_data::from_noun (w.to_noun ());
        ASSERT_TRUE (bool (read));
        EXPECT_EQ (*read, w);
    }

    TEST (Model, NockchainTx) {
        private_key k = model_key (0x01);
        spend s = spend::new_witness (witness {pkh_and_coinbase (k.to_public ().hash ())},
            seeds {seed::new_single_pkh (hash_belt (2), 10, hash_belt (3), false)}, 300);
        s.add_signature (k.to_public (), k.sign (s.sig_hash ()));

        spends all {};
        all.insert (name {hash_belt (1), hash_belt (2)}, s);

        raw_tx_v1 tx {all};
        nockchain_tx ntx = tx.to_nockchain_tx ();
        EXPECT_EQ (ntx.ID, tx.ID);
        EXPECT_EQ (ntx.to_raw_tx (), tx);
        EXPECT_EQ (ntx.outputs ().size (), 1u);

        maybe<nockchain_tx> read = nockchain_tx::from_noun (ntx.to_noun ());
        ASSERT_TRUE (bool (read));
        EXPECT_EQ (*read, ntx);

        ntx.Version = version::V0;
        EXPECT_THROW (ntx.to_raw_tx (), data::exception);

        raw_tx wrapped {tx};
        noun n = wrapped.to_noun ();
        EXPECT_EQ (n.head (), noun {1});
        maybe<raw_tx> read_wrapped = raw_tx::from_noun (n);
        ASSERT_TRUE (bool (read_wrapped));
        EXPECT_EQ (read_wrapped->get_version (), version::V1);
        EXPECT_EQ (*read_wrapped->v1 (), tx);
        EXPECT_EQ (read_wrapped->id (), tx.ID);

        EXPECT_FALSE (bool (raw_tx::from_noun (noun {2, tx.to_noun ()})));
    }

}
