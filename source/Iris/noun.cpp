#include <Iris/noun.hpp>
#include <data/encoding/hex.hpp>
#include <unordered_map>
#include <functional>

namespace Iris {

    struct noun::cell {
        noun Head;
        noun Tail;
        std::size_t Shape;
    };

    namespace {
        void trim (bytes &b) {
            while (b.size () > 0 && b[b.size () - 1] == 0) b.pop_back ();
        }

        std::size_t atom_shape (const bytes &b) {
            std::size_t h = 0xcbf29ce484222325ull;
            for (std::size_t i = 0; i < b.size (); i++) h = (h ^ b[i]) * 0x100000001b3ull;
            return h;
        }
    }

    noun::noun (uint64 x): Atom {}, Cell {} {
        while (x != 0) {
            Atom.push_back (static_cast<byte> (x & 0xff));
            x >>= 8;
        }
    }

    noun::noun (const noun &head, const noun &tail): Atom {},
        Cell {std::make_shared<const cell> (cell {head, tail, head.shape () * 31 + tail.shape () * 17 + 1})} {}

    noun noun::atom (const bytes &b) {
        noun n {};
        n.Atom = b;
        trim (n.Atom);
        return n;
    }

    noun noun::cord (const std::string &str) {
        bytes b {};
        for (char c : str) b.push_back (static_cast<byte> (c));
        return atom (b);
    }

    const bytes &noun::atom_bytes () const {
        if (is_cell ()) throw data::exception {} << "noun is not an atom";
        return Atom;
    }

    maybe<uint64> noun::to_uint64 () const {
        if (is_cell () || Atom.size () > 8) return {};
        uint64 x = 0;
        for (std::size_t i = 0; i < Atom.size (); i++) x |= static_cast<uint64> (Atom[i]) << (8 * i);
        return x;
    }

    maybe<std::string> noun::to_cord () const {
        if (is_cell ()) return {};
        std::string str {};
        for (std::size_t i = 0; i < Atom.size (); i++) str.push_back (static_cast<char> (Atom[i]));
        return str;
    }

    std::size_t noun::bit_length () const {
        if (is_cell ()) throw data::exception {} << "noun is not an atom";
        if (Atom.size () == 0) return 0;
        std::size_t bits = 8 * (Atom.size () - 1);
        byte last = Atom[Atom.size () - 1];
        while (last != 0) {
            bits++;
            last >>= 1;
        }
        return bits;
    }

    bool noun::bit (std::size_t i) const {
        if (i / 8 >= Atom.size ()) return false;
        return (Atom[i / 8] >> (i % 8)) & 1;
    }

    const noun &noun::head () const {
        if (is_atom ()) throw data::exception {} << "noun is not a cell";
        return Cell->Head;
    }

    const noun &noun::tail () const {
        if (is_atom ()) throw data::exception {} << "noun is not a cell";
        return Cell->Tail;
    }

    bool noun::operator == (const noun &n) const {
        if (is_atom () != n.is_atom ()) return false;
        if (is_atom ()) return Atom == n.Atom;
        if (Cell == n.Cell) return true;
        return Cell->Shape == n.Cell->Shape && Cell->Head == n.Cell->Head && Cell->Tail == n.Cell->Tail;
    }

    std::size_t noun::shape () const {
        return is_atom () ? atom_shape (Atom) : Cell->Shape;
    }

    std::size_t noun::words () const {
        return is_atom () ? 1 : Cell->Head.words () + Cell->Tail.words ();
    }

    digest noun::hash () const {
        std::vector<belt> leaves {};
        std::vector<belt> dyck {};

        std::function<void (const noun &)> visit = [&] (const noun &n) {
            if (n.is_atom ()) {
                maybe<uint64> x = n.to_uint64 ();
                if (!bool (x)) throw data::exception {} << "atom too large to hash";
                leaves.push_back (*x);
                return;
            }

            dyck.push_back (0);
            visit (n.head ());
            dyck.push_back (1);
            visit (n.tail ());
        };

        visit (*this);
        return hash_leaves (leaves, dyck);
    }

    noun tuple_noun (std::initializer_list<noun> list) {
        if (list.size () == 0) return noun {};
        auto it = list.end ();
        noun n = *--it;
        while (it != list.begin ()) n = noun {*--it, n};
        return n;
    }

    std::ostream &operator << (std::ostream &o, const noun &n) {
        if (n.is_atom ()) {
            maybe<uint64> x = n.to_uint64 ();
            if (bool (x)) return o << *x;
            bytes be {};
            const bytes &le = n.atom_bytes ();
            for (std::size_t i = le.size (); i > 0; i--) be.push_back (le[i - 1]);
            return o << "0x" << encoding::hex::write (be);
        }

        o << "[" << n.head ();
        const noun *next = &n.tail ();
        while (next->is_cell ()) {
            o << " " << next->head ();
            next = &next->tail ();
        }
        return o << " " << *next << "]";
    }

    namespace {

        struct noun_shape {
            std::size_t operator () (const noun &n) const {
                return n.shape ();
            }
        };

        struct bit_writer {
            bytes Bytes {};
            std::size_t Size {0};

            void push (bool b) {
                if (Size % 8 == 0) Bytes.push_back (0);
                if (b) Bytes[Size / 8] |= static_cast<byte> (1 << (Size % 8));
                Size++;
            }

            // the low n bits of a, least significant first.
            void push (const noun &a, std::size_t n) {
                for (std::size_t i = 0; i < n; i++) push (a.bit (i));
            }

            void mat (const noun &a) {
                std::size_t b = a.bit_length ();
                if (b == 0) {
                    push (true);
                    return;
                }

                noun len {static_cast<uint64> (b)};
                std::size_t c = len.bit_length ();
                for (std::size_t i = 0; i < c; i++) push (false);
                push (true);
                push (len, c - 1);
                push (a, b);
            }
        };

        void jam_to (bit_writer &w, const noun &n, std::unordered_map<noun, std::size_t, noun_shape> &seen) {
            auto it = seen.find (n);
            if (it != seen.end ()) {
                noun pos {static_cast<uint64> (it->second)};
                if (n.is_cell () || pos.bit_length () < n.bit_length ()) {
                    w.push (true);
                    w.push (true);
                    w.mat (pos);
                    return;
                }
            } else seen[n] = w.Size;

            if (n.is_atom ()) {
                w.push (false);
                w.mat (n);
                return;
            }

            w.push (true);
            w.push (false);
            jam_to (w, n.head (), seen);
            jam_to (w, n.tail (), seen);
        }

        struct bit_reader {
            const bytes &Bytes;
            std::size_t Position {0};

            maybe<bool> next () {
                if (Position / 8 >= Bytes.size ()) return {};
                bool b = (Bytes[Position / 8] >> (Position % 8)) & 1;
                Position++;
                return b;
            }

            maybe<noun> read_bits (std::size_t n) {
                bytes b {};
                for (std::size_t i = 0; i < n; i++) {
                    maybe<bool> x = next ();
                    if (!bool (x)) return {};
                    if (i % 8 == 0) b.push_back (0);
                    if (*x) b[i / 8] |= static_cast<byte> (1 << (i % 8));
                }
                return noun::atom (b);
            }

            maybe<noun> rub () {
                std::size_t c = 0;
                while (true) {
                    maybe<bool> x = next ();
                    if (!bool (x)) return {};
                    if (*x) break;
                    c++;
                    // a length that needs more than 64 bits cannot be real.
                    if (c > 64) return {};
                }

                if (c == 0) return noun {};

                maybe<noun> low = read_bits (c - 1);
                if (!bool (low)) return {};
                maybe<uint64> b = low->to_uint64 ();
                if (!bool (b)) return {};
                uint64 len = *b | (uint64 (1) << (c - 1));
                if (len > 8 * (Bytes.size () + 1)) return {};
                return read_bits (len);
            }
        };

        // a cell whose head or tail is still being read.
        struct open_cell {
            std::size_t Start;
            bool HasHead;
        };

        maybe<noun> cue_from (bit_reader &r, std::unordered_map<std::size_t, noun> &seen) {
            std::vector<open_cell> open {};
            std::vector<noun> heads {};

            while (true) {
                std::size_t start = r.Position;
                maybe<bool> tag = r.next ();
                if (!bool (tag)) return {};

                noun next {};
                if (!*tag) {
                    maybe<noun> a = r.rub ();
                    if (!bool (a)) return {};
                    seen[start] = *a;
                    next = *a;
                } else {
                    maybe<bool> back = r.next ();
                    if (!bool (back)) return {};

                    if (!*back) {
                        open.push_back (open_cell {start, false});
                        continue;
                    }

                    maybe<noun> pos = r.rub ();
                    if (!bool (pos)) return {};
                    maybe<uint64> p = pos->to_uint64 ();
                    if (!bool (p)) return {};
                    auto it = seen.find (*p);
                    if (it == seen.end ()) return {};
                    next = it->second;
                }

                // close every cell that is now complete.
                while (true) {
                    if (open.empty ()) return next;
                    open_cell &c = open.back ();
                    if (!c.HasHead) {
                        c.HasHead = true;
                        heads.push_back (next);
                        break;
                    }

                    next = noun {heads.back (), next};
                    heads.pop_back ();
                    seen[c.Start] = next;
                    open.pop_back ();
                }
            }
        }

    }

    bytes jam (const noun &n) {
        bit_writer w {};
        std::unordered_map<noun, std::size_t, noun_shape> seen {};
        jam_to (w, n, seen);
        trim (w.Bytes);
        return w.Bytes;
    }

    maybe<noun> cue (const bytes &b) {
        bit_reader r {b};
        std::unordered_map<std::size_t, noun> seen {};
        return cue_from (r, seen);
    }

}
