#ifndef IRIS_NOUN
#define IRIS_NOUN

#include <Iris/hash/digest.hpp>

namespace Iris {

    // a noun is either an atom (an unsigned integer of any size) or a cell (a pair of nouns).
    struct noun {
        noun (): noun {uint64 (0)} {}
        noun (uint64);
        noun (const noun &head, const noun &tail);

        // from little endian bytes.
        static noun atom (const bytes &);

        // text as a little endian atom.
        static noun cord (const std::string &);

        bool is_atom () const {
            return Cell == nullptr;
        }

        bool is_cell () const {
            return Cell != nullptr;
        }

        // little endian, no trailing zeros.
        const bytes &atom_bytes () const;

        maybe<uint64> to_uint64 () const;
        maybe<std::string> to_cord () const;

        std::size_t bit_length () const;
        bool bit (std::size_t) const;

        // throws if this is an atom.
        const noun &head () const;
        const noun &tail () const;

        bool operator == (const noun &) const;

        // a cheap structural hash, not to be confused with hash ().
        std::size_t shape () const;

        // throws if any atom is bigger than a belt.
        digest hash () const;

        // the number of atoms in the noun.
        std::size_t words () const;

    private:
        struct cell;
        bytes Atom;
        ptr<const cell> Cell;
    };

    // [a b c] = [a [b c]]
    noun tuple_noun (std::initializer_list<noun>);

    std::ostream &operator << (std::ostream &, const noun &);

    // bitwise serialization of a noun with back references.
    bytes jam (const noun &);

    // inverse of jam. Nothing on malformed input.
    maybe<noun> cue (const bytes &);

}

#endif
