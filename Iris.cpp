#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>

#include <data/io/exception.hpp>
#include <data/io/arg_parser.hpp>
#include <data/encoding/hex.hpp>

#include <Iris/tx/builder.hpp>

using namespace data;

struct error {
    int Code;
    maybe<std::string> Message;
    error () : Code {0}, Message {} {}
    error (int code) : Code {code}, Message {} {}
    error (int code, const std::string &err): Code {code}, Message {err} {}
    error (const std::string &err): Code {1}, Message {err} {}
};

error run (const io::arg_parser &);

enum class method {
    UNSET,
    HELP,     // print help messages
    VERSION,  // print a version message
    CUE,      // decode a jammed noun
    HASH,     // hash a jammed noun
    PUBKEY,   // public key of a secret key
    SETTINGS  // print the tx engine settings
};

int main (int arg_count, char **arg_values) {

    auto err = run (io::arg_parser {arg_count, arg_values});

    if (err.Message) std::cout << "Error: " << *err.Message << std::endl;
    else if (err.Code) std::cout << "Error: unknown." << std::endl;

    return err.Code;
}

void version ();

void help (method meth = method::UNSET);

void command_cue (const io::arg_parser &);
void command_hash (const io::arg_parser &);
void command_pubkey (const io::arg_parser &);
void command_settings (const io::arg_parser &);

method read_method (const io::arg_parser &, uint32 index = 1);

error run (const io::arg_parser &p) {

    try {

        if (p.has ("version")) version ();

        else if (p.has ("help")) help ();

        else {

            method cmd = read_method (p);

            switch (cmd) {
                case method::VERSION: {
                    version ();
                    break;
                }

                case method::HELP: {
                    help (read_method (p, 2));
                    break;
                }

                case method::CUE: {
                    command_cue (p);
                    break;
                }

                case method::HASH: {
                    command_hash (p);
                    break;
                }

                case method::PUBKEY: {
                    command_pubkey (p);
                    break;
                }

                case method::SETTINGS: {
                    command_settings (p);
                    break;
                }

                default: {
                    std::cout << "Error: could not read user's command." << std::endl;
                    help ();
                }
            }
        }

    } catch (const Iris::build_error &x) {
        return error {2, std::string {x.what ()}};
    } catch (const data::exception &x) {
        return error {x.Code == 0 ? 1 : x.Code, std::string {x.what ()}};
    } catch (const std::exception &x) {
        return error {1, std::string {x.what ()}};
    }

    return {};
}

method read_method (const io::arg_parser &p, uint32 index) {
    maybe<std::string> m;
    p.get (index, m);
    if (!bool (m)) return method::UNSET;

    std::transform (m->begin (), m->end (), m->begin (),
        [] (unsigned char c) {
            return std::tolower (c);
        });

    if (*m == "help") return method::HELP;
    if (*m == "version") return method::VERSION;
    if (*m == "cue") return method::CUE;
    if (*m == "hash") return method::HASH;
    if (*m == "pubkey") return method::PUBKEY;
    if (*m == "settings") return method::SETTINGS;

    return method::UNSET;
}

void help (method meth) {
    switch (meth) {
        default : {
            version ();
            std::cout << "input should be <method> <args>... where method is "
                "\n\tcue        -- decode a jammed noun."
                "\n\thash       -- print the hash of a jammed noun."
                "\n\tpubkey     -- print the public key of a secret key."
                "\n\tsettings   -- print the settings for building transactions."
                "\nuse help \"method\" for information on a specific method"<< std::endl;
        } break;
        case method::CUE : {
            std::cout << "Decode a jammed noun and print it together with its hash."
                "\narguments for method cue:"
                "\n\t(--jam=)<hex>" << std::endl;
        } break;
        case method::HASH : {
            std::cout << "Print the base 58 hash of a jammed noun."
                "\narguments for method hash:"
                "\n\t(--jam=)<hex>" << std::endl;
        } break;
        case method::PUBKEY : {
            std::cout << "Print the public key of a secret key and the hash of the public key."
                "\narguments for method pubkey:"
                "\n\t(--secret=)<32 byte hex>" << std::endl;
        } break;
        case method::SETTINGS : {
            std::cout << "Print the settings for building transactions."
                "\narguments for method settings:"
                "\n\t(--file=<path to JSON settings>)" << std::endl;
        }
    }
}

void version () {
    std::cout << "Iris transaction engine version 0.0.1 alpha" << std::endl;
}

std::string read_argument (const io::arg_parser &p, const char *name) {
    maybe<std::string> arg;
    p.get (2, name, arg);
    if (!bool (arg)) throw data::exception {} << "missing argument " << name;
    return *arg;
}

Iris::noun read_jam (const io::arg_parser &p) {
    maybe<bytes> jammed = encoding::hex::read (read_argument (p, "jam"));
    if (!bool (jammed)) throw data::exception {} << "could not read jam as hex";

    maybe<Iris::noun> n = Iris::cue (*jammed);
    if (!bool (n)) throw data::exception {} << "could not decode jam";
    return *n;
}

void command_cue (const io::arg_parser &p) {
    Iris::noun n = read_jam (p);
    std::cout << n << "\nhash: " << n.hash () << std::endl;
}

void command_hash (const io::arg_parser &p) {
    std::cout << read_jam (p).hash () << std::endl;
}

void command_pubkey (const io::arg_parser &p) {
    maybe<Iris::private_key> key = Iris::private_key::read_hex (read_argument (p, "secret"));
    if (!bool (key)) throw data::exception {} << "could not read secret key";

    Iris::public_key pk = key->to_public ();
    std::cout << "public key: " << pk << "\nkey hash: " << pk.hash () << std::endl;
}

void command_settings (const io::arg_parser &p) {
    maybe<std::string> file;
    p.get ("file", file);

    Iris::tx_engine_settings settings {};
    if (bool (file)) {
        std::ifstream in {*file};
        if (!in) throw data::exception {} << "could not open " << *file;
        settings = Iris::tx_engine_settings {JSON::parse (in)};
    }

    std::cout << settings << std::endl;
}
