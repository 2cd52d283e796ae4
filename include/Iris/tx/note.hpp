#ifndef IRIS_TX_NOTE
#define IRIS_TX_NOTE

#include <Iris/tx/legacy.hpp>
#include <Iris/tx/lock.hpp>

namespace Iris {

    struct note_v1 {
        version Version;
        block_height OriginPage;
        name Name;
        note_data NoteData;
        nicks Assets;

        note_v1 (): Version {version::V1}, OriginPage {0}, Name {}, NoteData {}, Assets {} {}
        note_v1 (version v, block_height origin, const name &n, const note_data &d, nicks assets):
            Version {v}, OriginPage {origin}, Name {n}, NoteData {d}, Assets {assets} {}

        noun to_noun () const {
            return encode_tuple (Version, OriginPage, Name, NoteData, Assets);
        }

        static maybe<note_v1> from_noun (const noun &n) {
            note_v1 x {};
            if (!read_tuple (n, x.Version, x.OriginPage, x.Name, x.NoteData, x.Assets)) return {};
            return x;
        }

        digest hash () const {
            return hash_tuple (Version, OriginPage, Name, NoteData, Assets);
        }

        bool operator == (const note_v1 &) const = default;
    };

    // a note of either version.
    struct note : std::variant<legacy::note, note_v1> {
        using std::variant<legacy::note, note_v1>::variant;

        note (): std::variant<legacy::note, note_v1> {note_v1 {}} {}

        const legacy::note *v0 () const {
            return std::get_if<legacy::note> (this);
        }

        const note_v1 *v1 () const {
            return std::get_if<note_v1> (this);
        }

        version get_version () const {
            return bool (v0 ()) ? version::V0 : version::V1;
        }

        const name &get_name () const;
        nicks assets () const;
        block_height origin_page () const;

        noun to_noun () const;

        // a legacy note is tried first.
        static maybe<note> from_noun (const noun &);

        digest hash () const;
    };

    std::ostream &operator << (std::ostream &, const note &);

}

#endif
