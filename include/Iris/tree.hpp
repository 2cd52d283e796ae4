#ifndef IRIS_TREE
#define IRIS_TREE

#include <Iris/codec.hpp>
#include <functional>

namespace Iris {

    // the position of a key in the tree. Two keys with the same tip are the same key.
    template <typename K> digest inline tip (const K &k) {
        return encode_noun (k).hash ();
    }

    // the heap priority of a key, computed from its tip.
    struct double_tip {
        digest operator () (const digest &tip) const {
            return hash_pair (tip, tip);
        }
    };

    template <typename K, typename V> struct map_entry {
        using key_type = K;
        using entry = std::pair<K, V>;

        static const K &key (const entry &e) {
            return e.first;
        }
    };

    template <typename V> struct set_entry {
        using key_type = V;
        using entry = V;

        static const V &key (const entry &e) {
            return e;
        }
    };

    // A binary search tree ordered by the tips of the keys and kept heap-ordered
    // by a priority that is also a function of the key. The shape therefore
    // depends only on which entries are present, not on the order of insertion.
    template <typename policy, typename priority = double_tip> struct ordered_tree {
        using key_type = typename policy::key_type;
        using entry = typename policy::entry;

        ordered_tree (): Root {}, Size {0} {}
        ordered_tree (std::initializer_list<entry>);

        ordered_tree (const ordered_tree &t): Root {copy (t.Root)}, Size {t.Size} {}
        ordered_tree (ordered_tree &&) = default;
        ordered_tree &operator = (const ordered_tree &t) {
            if (this != &t) {
                Root = copy (t.Root);
                Size = t.Size;
            }
            return *this;
        }
        ordered_tree &operator = (ordered_tree &&) = default;

        // false if an entry with the same key is already present, in which case nothing changes.
        bool insert_entry (const entry &);

        const entry *find (const key_type &) const;

        bool contains_key (const key_type &k) const {
            return find (k) != nullptr;
        }

        std::size_t size () const {
            return Size;
        }

        bool empty () const {
            return Root == nullptr;
        }

        void clear () {
            Root.reset ();
            Size = 0;
        }

        // H(empty) = hash (0), H(node) = hash (entry, (H(left), H(right))).
        digest hash () const {
            return hash_with ([] (const entry &e) -> digest {
                return hash_of (e);
            });
        }

        // tree hash with a different hash for the entries.
        digest hash_with (std::function<digest (const entry &)>) const;

        noun to_noun () const;

        // the entries are inserted one at a time, so the result is always in canonical shape.
        static maybe<ordered_tree> from_noun (const noun &);

        // keep only the entries that satisfy the predicate.
        template <typename F> ordered_tree filter (F keep) const {
            ordered_tree t {};
            for (const entry &e : *this) if (keep (e)) t.insert_entry (e);
            return t;
        }

        // pre-order traversal, visiting the right subtree before the left.
        std::vector<const entry *> tap () const;

        bool operator == (const ordered_tree &) const;

    protected:
        struct node {
            entry Entry;
            digest Tip;
            digest Priority;
            std::unique_ptr<node> Left;
            std::unique_ptr<node> Right;
        };

        std::unique_ptr<node> Root;
        std::size_t Size;

        static std::unique_ptr<node> copy (const std::unique_ptr<node> &);
        static std::unique_ptr<node> put (std::unique_ptr<node>, const entry &, const digest &tip, bool &inserted);

        node *find_node (const key_type &) const;

    public:
        // in-order traversal.
        struct iterator {
            using iterator_category = std::forward_iterator_tag;
            using value_type = entry;
            using difference_type = std::ptrdiff_t;
            using pointer = const entry *;
            using reference = const entry &;

            std::vector<const node *> Stack;

            iterator (): Stack {} {}
            explicit iterator (const node *root): Stack {} {
                descend (root);
            }

            const entry &operator * () const {
                return Stack.back ()->Entry;
            }

            const entry *operator -> () const {
                return &Stack.back ()->Entry;
            }

            iterator &operator ++ () {
                const node *n = Stack.back ();
                Stack.pop_back ();
                descend (n->Right.get ());
                return *this;
            }

            iterator operator ++ (int) {
                iterator i = *this;
                ++*this;
                return i;
            }

            bool operator == (const iterator &i) const {
                return Stack == i.Stack;
            }

        private:
            void descend (const node *n) {
                while (n != nullptr) {
                    Stack.push_back (n);
                    n = n->Left.get ();
                }
            }
        };

        iterator begin () const {
            return iterator {Root.get ()};
        }

        iterator end () const {
            return iterator {};
        }
    };

    template <typename K, typename V> struct ordered_map : ordered_tree<map_entry<K, V>> {
        using ordered_tree<map_entry<K, V>>::ordered_tree;

        ordered_map (ordered_tree<map_entry<K, V>> &&t): ordered_tree<map_entry<K, V>> {std::move (t)} {}

        // does not replace the value if the key is already present.
        bool insert (const K &k, const V &v) {
            return this->insert_entry (std::pair<K, V> {k, v});
        }

        const V *contains (const K &k) const {
            if (const auto *e = this->find (k); bool (e)) return &e->second;
            return nullptr;
        }

        V *get_mut (const K &k) {
            if (auto *n = this->find_node (k); bool (n)) return &n->Entry.second;
            return nullptr;
        }

        // apply a function to every value.
        template <typename F> void update (F f) {
            update (this->Root.get (), f);
        }

        static maybe<ordered_map> from_noun (const noun &n) {
            maybe<ordered_tree<map_entry<K, V>>> t = ordered_tree<map_entry<K, V>>::from_noun (n);
            if (!bool (t)) return {};
            return ordered_map {std::move (*t)};
        }

    private:
        template <typename F> static void update (typename ordered_tree<map_entry<K, V>>::node *n, F &f) {
            if (n == nullptr) return;
            f (n->Entry.first, n->Entry.second);
            update (n->Left.get (), f);
            update (n->Right.get (), f);
        }
    };

    template <typename V> struct ordered_set : ordered_tree<set_entry<V>> {
        using ordered_tree<set_entry<V>>::ordered_tree;

        ordered_set (ordered_tree<set_entry<V>> &&t): ordered_tree<set_entry<V>> {std::move (t)} {}

        bool insert (const V &v) {
            return this->insert_entry (v);
        }

        bool contains (const V &v) const {
            return this->contains_key (v);
        }

        static maybe<ordered_set> from_noun (const noun &n) {
            maybe<ordered_tree<set_entry<V>>> t = ordered_tree<set_entry<V>>::from_noun (n);
            if (!bool (t)) return {};
            return ordered_set {std::move (*t)};
        }

        template <typename F> ordered_set filter (F keep) const {
            return ordered_set {ordered_tree<set_entry<V>>::filter (keep)};
        }
    };

    template <typename policy, typename priority>
    ordered_tree<policy, priority>::ordered_tree (std::initializer_list<entry> entries): Root {}, Size {0} {
        for (const entry &e : entries) insert_entry (e);
    }

    template <typename policy, typename priority>
    std::unique_ptr<typename ordered_tree<policy, priority>::node> ordered_tree<policy, priority>::copy (const std::unique_ptr<node> &n) {
        if (n == nullptr) return nullptr;
        return std::unique_ptr<node> {new node {n->Entry, n->Tip, n->Priority, copy (n->Left), copy (n->Right)}};
    }

    template <typename policy, typename priority>
    bool ordered_tree<policy, priority>::insert_entry (const entry &e) {
        bool inserted = false;
        Root = put (std::move (Root), e, tip (policy::key (e)), inserted);
        if (inserted) Size++;
        return inserted;
    }

    template <typename policy, typename priority>
    std::unique_ptr<typename ordered_tree<policy, priority>::node> ordered_tree<policy, priority>::put
        (std::unique_ptr<node> n, const entry &e, const digest &t, bool &inserted) {
        if (n == nullptr) {
            inserted = true;
            return std::unique_ptr<node> {new node {e, t, priority {} (t), nullptr, nullptr}};
        }

        if (n->Tip == t) return n;

        if (compare_values (t, n->Tip) < 0) {
            n->Left = put (std::move (n->Left), e, t, inserted);
            if (compare_values (n->Priority, n->Left->Priority) >= 0) {
                // rotate right
                std::unique_ptr<node> root = std::move (n->Left);
                n->Left = std::move (root->Right);
                root->Right = std::move (n);
                return root;
            }

            return n;
        }

        n->Right = put (std::move (n->Right), e, t, inserted);
        if (compare_values (n->Priority, n->Right->Priority) >= 0) {
            // rotate left
            std::unique_ptr<node> root = std::move (n->Right);
            n->Right = std::move (root->Left);
            root->Left = std::move (n);
            return root;
        }

        return n;
    }

    template <typename policy, typename priority>
    typename ordered_tree<policy, priority>::node *ordered_tree<policy, priority>::find_node (const key_type &k) const {
        digest t = tip (k);
        node *n = Root.get ();
        while (n != nullptr) {
            if (n->Tip == t) return n;
            n = compare_values (t, n->Tip) < 0 ? n->Left.get () : n->Right.get ();
        }
        return nullptr;
    }

    template <typename policy, typename priority>
    const typename ordered_tree<policy, priority>::entry *ordered_tree<policy, priority>::find (const key_type &k) const {
        if (const node *n = find_node (k); bool (n)) return &n->Entry;
        return nullptr;
    }

    template <typename policy, typename priority>
    digest ordered_tree<policy, priority>::hash_with (std::function<digest (const entry &)> f) const {
        std::function<digest (const node *)> visit = [&] (const node *n) -> digest {
            if (n == nullptr) return hash_belt (0);
            return hash_pair (f (n->Entry), hash_pair (visit (n->Left.get ()), visit (n->Right.get ())));
        };

        return visit (Root.get ());
    }

    template <typename policy, typename priority>
    noun ordered_tree<policy, priority>::to_noun () const {
        std::function<noun (const node *)> visit = [&] (const node *n) -> noun {
            if (n == nullptr) return noun {};
            return noun {encode_noun (n->Entry), noun {visit (n->Left.get ()), visit (n->Right.get ())}};
        };

        return visit (Root.get ());
    }

    template <typename policy, typename priority>
    maybe<ordered_tree<policy, priority>> ordered_tree<policy, priority>::from_noun (const noun &n) {
        ordered_tree t {};

        std::function<bool (const noun &)> visit = [&] (const noun &x) -> bool {
            if (x.is_atom ()) {
                maybe<uint64> z = x.to_uint64 ();
                return bool (z) && *z == 0;
            }

            if (!x.tail ().is_cell ()) return false;
            maybe<entry> e = decode_noun<entry> (x.head ());
            if (!bool (e)) return false;
            t.insert_entry (*e);
            return visit (x.tail ().head ()) && visit (x.tail ().tail ());
        };

        if (!visit (n)) return {};
        return t;
    }

    template <typename policy, typename priority>
    std::vector<const typename ordered_tree<policy, priority>::entry *> ordered_tree<policy, priority>::tap () const {
        std::vector<const entry *> out {};
        std::vector<const node *> stack {};
        if (Root != nullptr) stack.push_back (Root.get ());
        while (!stack.empty ()) {
            const node *n = stack.back ();
            stack.pop_back ();
            out.push_back (&n->Entry);
            if (n->Left != nullptr) stack.push_back (n->Left.get ());
            if (n->Right != nullptr) stack.push_back (n->Right.get ());
        }
        return out;
    }

    template <typename policy, typename priority>
    bool ordered_tree<policy, priority>::operator == (const ordered_tree &t) const {
        if (Size != t.Size) return false;
        auto a = begin ();
        auto b = t.begin ();
        for (; a != end (); ++a, ++b) if (!(*a == *b)) return false;
        return true;
    }

}

#endif
