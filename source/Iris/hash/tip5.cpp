#include <Iris/hash/tip5.hpp>
#include <atomic>

namespace Iris {

    namespace {

        constexpr std::array<uint64, StateSize> MDSCirculant {
            61402, 1108, 28750, 33823, 7454, 43244, 53865, 12034,
            56951, 27521, 41351, 40901, 12021, 59689, 26798, 17845};

        // added to the state after each round. Stored as plain field elements.
        constexpr std::array<uint64, tip5::Rounds * StateSize> PlainRoundConstants {
            1332676891236936200ull, 16607633045354064669ull, 12746538998793080786ull, 15240351333789289931ull,
            10333439796058208418ull, 986873372968378050ull, 153505017314310505ull, 703086547770691416ull,
            8522628845961587962ull, 1727254290898686320ull, 199492491401196126ull, 2969174933639985366ull,
            1607536590362293391ull, 16971515075282501568ull, 15401316942841283351ull, 14178982151025681389ull,
            2916963588744282587ull, 5474267501391258599ull, 5350367839445462659ull, 7436373192934779388ull,
            12563531800071493891ull, 12265318129758141428ull, 6524649031155262053ull, 1388069597090660214ull,
            3049665785814990091ull, 5225141380721656276ull, 10399487208361035835ull, 6576713996114457203ull,
            12913805829885867278ull, 10299910245954679423ull, 12980779960345402499ull, 593670858850716490ull,
            12184128243723146967ull, 1315341360419235257ull, 9107195871057030023ull, 4354141752578294067ull,
            8824457881527486794ull, 14811586928506712910ull, 7768837314956434138ull, 2807636171572954860ull,
            9487703495117094125ull, 13452575580428891895ull, 14689488045617615844ull, 16144091782672017853ull,
            15471922440568867245ull, 17295382518415944107ull, 15054306047726632486ull, 5708955503115886019ull,
            9596017237020520842ull, 16520851172964236909ull, 8513472793890943175ull, 8503326067026609602ull,
            9402483918549940854ull, 8614816312698982446ull, 7744830563717871780ull, 14419404818700162041ull,
            8090742384565069824ull, 15547662568163517559ull, 17314710073626307254ull, 10008393716631058961ull,
            14480243402290327574ull, 13569194973291808551ull, 10573516815088946209ull, 15120483436559336219ull,
            3515151310595301563ull, 1095382462248757907ull, 5323307938514209350ull, 14204542692543834582ull,
            12448773944668684656ull, 13967843398310696452ull, 14838288394107326806ull, 13718313940616442191ull,
            15032565440414177483ull, 13769903572116157488ull, 17074377440395071208ull, 16931086385239297738ull,
            8723550055169003617ull, 590842605971518043ull, 16642348030861036090ull, 10708719298241282592ull,
            12766914315707517909ull, 11780889552403245587ull, 113183285481780712ull, 9019899125655375514ull,
            3300264967390964820ull, 12802381622653377935ull, 891063765000023873ull, 15939045541699412539ull,
            3240223189948727743ull, 4087221142360949772ull, 10980466041788253952ull, 18199914337033135244ull,
            7168108392363190150ull, 16860278046098150740ull, 13088202265571714855ull, 4712275036097525581ull,
            16338034078141228133ull, 1455012125527134274ull, 5024057780895012002ull, 9289161311673217186ull,
            9401110072402537104ull, 11919498251456187748ull, 4173156070774045271ull, 15647643457869530627ull,
            15642078237964257476ull, 1405048341078324037ull, 3059193199283698832ull, 1605012781983592984ull,
            7134876918849821827ull, 5796994175286958720ull, 7251651436095127661ull, 4565856221886323991ull};

        template <typename X, std::size_t size> void erase (std::array<X, size> &x) {
            volatile X *v = x.data ();
            for (std::size_t i = 0; i < size; i++) v[i] = 0;
            std::atomic_signal_fence (std::memory_order_seq_cst);
        }

    }

    void erase (std::vector<belt> &b) {
        volatile belt *v = b.data ();
        for (std::size_t i = 0; i < b.size (); i++) v[i] = 0;
        std::atomic_signal_fence (std::memory_order_seq_cst);
    }

    tip5::tip5 () {
        // (x + 1)^3 - 1 mod 257, which permutes 0..255.
        for (uint32 x = 0; x < 256; x++) {
            uint32 y = x + 1;
            Lookup[x] = static_cast<byte> (((y * y % 257) * y % 257 + 256) % 257);
        }

        for (std::size_t i = 0; i < RoundConstants.size (); i++)
            RoundConstants[i] = montify (PlainRoundConstants[i] % Prime);
    }

    const tip5 &tip5::get () {
        static tip5 Tip5 {};
        return Tip5;
    }

    const permutation &default_permutation () {
        return tip5::get ();
    }

    void tip5::sbox (sponge_state &state) const {
        // the lookup acts on the bytes of the montgomery representation.
        for (std::size_t i = 0; i < SplitAndLookup; i++) {
            uint64 x = state[i];
            uint64 r = 0;
            for (int b = 0; b < 8; b++) r |= static_cast<uint64> (Lookup[(x >> (8 * b)) & 0xff]) << (8 * b);
            state[i] = r;
        }

        for (std::size_t i = SplitAndLookup; i < StateSize; i++) {
            uint64 x = state[i];
            uint64 x2 = mont_mul (x, x);
            uint64 x4 = mont_mul (x2, x2);
            uint64 x6 = mont_mul (x4, x2);
            state[i] = mont_mul (x6, x);
        }
    }

    void tip5::mds (sponge_state &state) {
        sponge_state result {};
        for (std::size_t i = 0; i < StateSize; i++) {
            unsigned __int128 acc = 0;
            for (std::size_t j = 0; j < StateSize; j++)
                acc += static_cast<unsigned __int128> (MDSCirculant[(i + StateSize - j) % StateSize]) * state[j];
            result[i] = static_cast<uint64> (acc % Prime);
        }
        state = result;
        erase (result);
    }

    void tip5::operator () (sponge_state &state) const {
        for (std::size_t round = 0; round < Rounds; round++) {
            sbox (state);
            mds (state);
            for (std::size_t i = 0; i < StateSize; i++)
                state[i] = belt_add (state[i], RoundConstants[round * StateSize + i]);
        }
    }

    namespace {

        void check_based (const belt *b, std::size_t size) {
            for (std::size_t i = 0; i < size; i++)
                if (!based (b[i])) throw data::exception {} << "value " << b[i] << " is not a field element";
        }

        void absorb (sponge_state &sponge, const belt *input, const permutation &permute) {
            for (std::size_t i = 0; i < Rate; i++) sponge[i] = montify (input[i]);
            permute (sponge);
        }

        std::array<uint64, DigestLength> squeeze (const sponge_state &sponge) {
            std::array<uint64, DigestLength> digest;
            for (std::size_t i = 0; i < DigestLength; i++) digest[i] = mont_reduction (sponge[i]);
            return digest;
        }

        std::array<uint64, DigestLength> absorb_all (sponge_state &sponge, const std::vector<belt> &input,
            std::array<belt, Rate> &last, const permutation &permute) {
            std::size_t full = input.size () / Rate;
            for (std::size_t q = 0; q < full; q++) absorb (sponge, input.data () + q * Rate, permute);

            std::size_t r = input.size () % Rate;
            for (std::size_t i = 0; i < r; i++) last[i] = input[full * Rate + i];
            last[r] = 1;
            absorb (sponge, last.data (), permute);

            return squeeze (sponge);
        }

    }

    std::array<uint64, DigestLength> hash_varlen (const std::vector<belt> &input, const permutation &permute) {
        check_based (input.data (), input.size ());
        sponge_state sponge {};
        std::array<belt, Rate> last {};
        return absorb_all (sponge, input, last, permute);
    }

    std::array<uint64, DigestLength> hash_secret (std::vector<belt> &input, const permutation &permute) {
        sponge_state sponge {};
        std::array<belt, Rate> last {};
        try {
            check_based (input.data (), input.size ());
            std::array<uint64, DigestLength> digest = absorb_all (sponge, input, last, permute);
            erase (sponge);
            erase (last);
            erase (input);
            return digest;
        } catch (...) {
            erase (sponge);
            erase (last);
            erase (input);
            throw;
        }
    }

    std::array<uint64, DigestLength> hash_fixed (const std::array<belt, Rate> &input, const permutation &permute) {
        check_based (input.data (), input.size ());
        sponge_state sponge {};
        for (std::size_t i = Rate; i < StateSize; i++) sponge[i] = montify (1);
        absorb (sponge, input.data (), permute);
        return squeeze (sponge);
    }

}
