#include <Iris/options.hpp>

namespace Iris {

    namespace {
        uint64 read_setting (const JSON &j, const char *key) {
            const JSON &v = j[key];
            if (!v.is_number_unsigned ()) throw data::exception {} << "invalid settings: " << key << " must be a non-negative integer";
            return uint64 (v);
        }
    }

    tx_engine_settings::tx_engine_settings (const JSON &j) {
        if (!j.is_object ()) throw data::exception {} << "invalid settings: expected a JSON object";
        if (j.contains ("fee_per_word")) FeePerWord = nicks {read_setting (j, "fee_per_word")};
        if (j.contains ("min_fee")) MinFee = nicks {read_setting (j, "min_fee")};
        if (j.contains ("signature_words")) SignatureWords = read_setting (j, "signature_words");
    }

    tx_engine_settings::operator JSON () const {
        return JSON::object_t {
            {"fee_per_word", FeePerWord.Value},
            {"min_fee", MinFee.Value},
            {"signature_words", SignatureWords}};
    }

    std::ostream &operator << (std::ostream &o, const tx_engine_settings &x) {
        return o << "settings {fee_per_word: " << x.FeePerWord.Value << ", min_fee: " << x.MinFee.Value <<
            ", signature_words: " << x.SignatureWords << "}";
    }

}
