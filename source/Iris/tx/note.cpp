#include <Iris/tx/note.hpp>

namespace Iris {

    const name &note::get_name () const {
        if (const auto *n = v0 (); bool (n)) return n->Name;
        return v1 ()->Name;
    }

    nicks note::assets () const {
        if (const auto *n = v0 (); bool (n)) return n->Assets;
        return v1 ()->Assets;
    }

    block_height note::origin_page () const {
        if (const auto *n = v0 (); bool (n)) return n->Inner.OriginPage;
        return v1 ()->OriginPage;
    }

    noun note::to_noun () const {
        if (const auto *n = v0 (); bool (n)) return n->to_noun ();
        return v1 ()->to_noun ();
    }

    digest note::hash () const {
        if (const auto *n = v0 (); bool (n)) return n->hash ();
        return v1 ()->hash ();
    }

    maybe<note> note::from_noun (const noun &n) {
        if (maybe<legacy::note> x = legacy::note::from_noun (n); bool (x)) return note {*x};

        if (!n.is_cell ()) return {};
        maybe<version> v = decode_noun<version> (n.head ());
        if (!bool (v) || *v != version::V1) return {};

        maybe<note_v1> x = note_v1::from_noun (n);
        if (!bool (x)) return {};
        return note {*x};
    }

    std::ostream &operator << (std::ostream &o, const note &n) {
        return o << "note {version: " << n.get_version () << ", name: " << n.get_name () <<
            ", assets: " << n.assets () << ", origin: " << n.origin_page () << "}";
    }

}
