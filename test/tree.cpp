#include <Iris/tree.hpp>
#include "gtest/gtest.h"

#include <algorithm>

namespace Iris {

    static std::vector<uint64> test_keys () {
        return {1, 2, 3, 5, 8, 13, 21, 34, 55, 89};
    }

    TEST (Tree, ShapeIsIndependentOfInsertionOrder) {
        std::vector<uint64> keys = test_keys ();

        ordered_set<uint64> first {};
        for (uint64 k : keys) first.insert (k);

        std::vector<digest> first_order {};
        for (uint64 k : first) first_order.push_back (tip (k));

        std::vector<uint64> reversed {keys.rbegin (), keys.rend ()};
        std::vector<std::vector<uint64>> orders {reversed};

        std::vector<uint64> permuted = keys;
        for (int i = 0; i < 6; i++) {
            std::next_permutation (permuted.begin (), permuted.end ());
            std::rotate (permuted.begin (), permuted.begin () + 3, permuted.end ());
            orders.push_back (permuted);
        }

        for (const auto &order : orders) {
            ordered_set<uint64> other {};
            for (uint64 k : order) other.insert (k);

            EXPECT_EQ (first.hash (), other.hash ());
            EXPECT_EQ (first.to_noun (), other.to_noun ());
            EXPECT_EQ (first, other);

            std::vector<digest> other_order {};
            for (uint64 k : other) other_order.push_back (tip (k));
            EXPECT_EQ (first_order, other_order);

            std::vector<const uint64 *> a = first.tap ();
            std::vector<const uint64 *> b = other.tap ();
            ASSERT_EQ (a.size (), b.size ());
            for (std::size_t i = 0; i < a.size (); i++) EXPECT_EQ (*a[i], *b[i]);
        }
    }

    TEST (Tree, InOrderTraversalIsSortedByTip) {
        ordered_set<uint64> s {};
        for (uint64 k : test_keys ()) s.insert (k);

        EXPECT_EQ (s.size (), test_keys ().size ());

        maybe<digest> last {};
        for (uint64 k : s) {
            digest t = tip (k);
            if (bool (last)) EXPECT_TRUE (compare_values (*last, t) < 0);
            last = t;
        }
    }

    TEST (Tree, EmptyTree) {
        ordered_set<uint64> s {};
        EXPECT_TRUE (s.empty ());
        EXPECT_EQ (s.hash (), hash_belt (0));
        EXPECT_EQ (s.to_noun (), noun {});
        EXPECT_EQ (s.begin (), s.end ());
    }

    TEST (Tree, SingleEntryHash) {
        ordered_set<uint64> s {7};
        EXPECT_EQ (s.hash (), hash_pair (hash_belt (7), hash_pair (hash_belt (0), hash_belt (0))));
        EXPECT_EQ (s.to_noun (), tuple_noun ({7, 0, 0}));
    }

    TEST (Tree, DuplicateInsertIsIgnored) {
        ordered_set<uint64> s {1, 2, 3};
        digest before = s.hash ();
        EXPECT_FALSE (s.insert (2));
        EXPECT_EQ (s.size (), 3u);
        EXPECT_EQ (s.hash (), before);
        EXPECT_TRUE (s.insert (4));
        EXPECT_EQ (s.size (), 4u);
    }

    TEST (Tree, MapInsertDoesNotReplace) {
        ordered_map<uint64, std::string> m {};
        EXPECT_TRUE (m.insert (1, "one"));
        EXPECT_FALSE (m.insert (1, "uno"));
        ASSERT_NE (m.contains (1), nullptr);
        EXPECT_EQ (*m.contains (1), "one");
        EXPECT_EQ (m.contains (2), nullptr);

        *m.get_mut (1) = "ein";
        EXPECT_EQ (*m.contains (1), "ein");
    }

    TEST (Tree, MapOrderDependsOnKeysOnly) {
        ordered_map<uint64, uint64> a {};
        ordered_map<uint64, uint64> b {};
        for (uint64 k : test_keys ()) {
            a.insert (k, k * 2);
            b.insert (k, k * 3);
        }

        auto i = a.begin ();
        auto j = b.begin ();
        for (; i != a.end (); ++i, ++j) EXPECT_EQ (i->first, j->first);

        EXPECT_NE (a.hash (), b.hash ());
    }

    TEST (Tree, Update) {
        ordered_map<uint64, uint64> m {};
        for (uint64 k : test_keys ()) m.insert (k, 0);
        m.update ([] (const uint64 &k, uint64 &v) {
            v = k + 1;
        });

        for (const auto &[k, v] : m) EXPECT_EQ (v, k + 1);
    }

    TEST (Tree, NounRoundTrip) {
        ordered_map<uint64, std::string> m {};
        m.insert (3, "three");
        m.insert (1, "one");
        m.insert (2, "two");

        maybe<ordered_map<uint64, std::string>> read = ordered_map<uint64, std::string>::from_noun (m.to_noun ());
        ASSERT_TRUE (bool (read));
        EXPECT_EQ (*read, m);
        EXPECT_EQ (read->hash (), m.hash ());

        EXPECT_FALSE (bool (ordered_set<uint64>::from_noun (noun {5})));
        EXPECT_FALSE (bool (ordered_set<uint64>::from_noun (tuple_noun ({1, 0}))));
    }

    TEST (Tree, Filter) {
        ordered_set<uint64> s {};
        ordered_set<uint64> odd {};
        for (uint64 k : test_keys ()) {
            s.insert (k);
            if (k % 2 == 1) odd.insert (k);
        }

        ordered_set<uint64> filtered = s.filter ([] (const uint64 &k) -> bool {
            return k % 2 == 1;
        });

        EXPECT_EQ (filtered, odd);
        EXPECT_EQ (filtered.hash (), odd.hash ());
    }

    TEST (Tree, CopyIsDeep) {
        ordered_set<uint64> a {1, 2, 3};
        ordered_set<uint64> b = a;
        b.insert (4);
        EXPECT_EQ (a.size (), 3u);
        EXPECT_EQ (b.size (), 4u);
        EXPECT_FALSE (a.contains (4));
    }

}
