#ifndef IRIS_OPTIONS
#define IRIS_OPTIONS

#include <Iris/tx/common.hpp>
#include <data/net/JSON.hpp>

namespace Iris {

    struct tx_engine_settings {
        constexpr static uint64 DefaultFeePerWord {1 << 15};
        constexpr static uint64 DefaultMinFee {256};

        // words budgeted for a signature that has not been made yet.
        constexpr static uint64 DefaultSignatureWords {35};

        nicks FeePerWord {DefaultFeePerWord};
        nicks MinFee {DefaultMinFee};
        uint64 SignatureWords {DefaultSignatureWords};

        tx_engine_settings () {}
        explicit tx_engine_settings (nicks fee_per_word): FeePerWord {fee_per_word} {}

        // keys fee_per_word, min_fee and signature_words are all optional.
        explicit tx_engine_settings (const JSON &);
        explicit operator JSON () const;

        bool operator == (const tx_engine_settings &) const = default;
    };

    std::ostream &operator << (std::ostream &, const tx_engine_settings &);

}

#endif
