#include <Iris/tx/legacy.hpp>
#include <map>

namespace Iris::legacy {

    namespace {
        struct output_base {
            sig Recipient;
            timelock_intent Timelock;
            nicks Assets;
            seeds Seeds;
        };
    }

    std::vector<note> raw_tx::outputs () const {
        // recipients are ordered by the hash of their sig.
        std::map<digest, output_base> base {};

        for (const auto *in : Inputs.tap ())
            for (const seed *x : in->second.Spend.Seeds.tap ()) {
                digest key = x->Recipient.hash ();
                auto it = base.find (key);
                if (it == base.end ()) it = base.emplace (key, output_base {x->Recipient, timelock_intent {}, nicks {0}, seeds {}}).first;

                output_base &child = it->second;
                // only the intent of the last seed counts.
                if (bool (x->TimelockIntent.Timelock) && !(*x->TimelockIntent.Timelock == timelock::none ()))
                    child.Timelock = x->TimelockIntent;

                child.Assets += x->Gift;
                child.Seeds.insert (*x);
            }

        std::vector<note> outputs {};
        outputs.reserve (base.size ());

        for (const auto &[_, child] : base) {
            source src {child.Seeds.hash (), false};
            outputs.push_back (note {
                note_inner {version::V0, 0, child.Timelock},
                name::new_v0 (child.Recipient, src, child.Timelock),
                child.Recipient, src, child.Assets});
        }

        return outputs;
    }

}
