#include "../include/cli.hpp"
#include "../include/config_manager.hpp"
#include "../include/derived.hpp"
#include "../include/hex.hpp"
#include "../include/logger.hpp"
#include "../include/openssl_backend.hpp"
#include "../include/secp256k1_backend.hpp"
#include "../include/secure_memory.hpp"

#include <stdexcept>

/**
 * @file cli.cpp
 * @brief keytree-derive: print the BIP-32 key found at a path below a seed.
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    namespace {

        struct Options {
            std::string configPath = ".env";
            bool publicOnly = false;
            std::string seedHex;
            std::string path = "m";
        };

        void printUsage(std::ostream& out) {
            out << "Usage: keytree-derive [--config FILE] [--public] <seed-hex> [path]\n"
                << "  path defaults to m, e.g. m/44'/0'/0'/0/1\n"
                << "  --public derives from the master xpub (no hardened steps)\n";
        }

        bool parseArgs(const std::vector<std::string>& args, Options& opts) {
            std::vector<std::string> positional;
            for (size_t i = 0; i < args.size(); ++i) {
                const std::string& arg = args[i];
                if (arg == "--config") {
                    if (++i >= args.size()) return false;
                    opts.configPath = args[i];
                } else if (arg == "--public") {
                    opts.publicOnly = true;
                } else if (arg == "--help" || arg == "-h") {
                    return false;
                } else if (!arg.empty() && arg[0] == '-') {
                    return false;
                } else {
                    positional.push_back(arg);
                }
            }

            if (positional.empty() || positional.size() > 2) return false;
            opts.seedHex = positional[0];
            if (positional.size() == 2) opts.path = positional[1];
            return true;
        }

        void setupLogging(std::ostream& err) {
            LogLevel level = Logger::levelFromString(ConfigManager::getOr("KEYTREE_LOG_LEVEL", "info"));
            if (auto logPath = ConfigManager::get("KEYTREE_LOG_PATH")) {
                Logger::initialize(*logPath, level);
            } else {
                Logger::initializeStream(err, level);
            }
        }

        BackendHandle selectBackend() {
            std::string name = ConfigManager::getOr("KEYTREE_BACKEND", "secp256k1");
            if (name == "secp256k1") return Secp256k1Backend::create();
            if (name == "openssl") return OpensslBackend::create();
            throw std::invalid_argument("Unknown KEYTREE_BACKEND: " + name);
        }

        template <typename D>
        void printKeyInfo(std::ostream& out, const D& derived) {
            const auto& info = derived.key().info();
            out << "path:        " << derived.derivation().toString() << '\n'
                << "depth:       " << static_cast<int>(info.depth) << '\n'
                << "parent:      " << Hex::encode(info.parent) << '\n'
                << "index:       " << info.index << '\n'
                << "hint:        " << hintToString(info.hint) << '\n'
                << "chain code:  " << Hex::encode(info.chainCode) << '\n'
                << "public key:  " << Hex::encode(derived.publicPoint().bytes()) << '\n'
                << "fingerprint: " << Hex::encode(derived.fingerprint()) << '\n';
        }

        void derive(const Options& opts, std::ostream& out) {
            BackendHandle backend = selectBackend();
            Hint hint = hintFromString(ConfigManager::getOr("KEYTREE_HINT", "segwit"));
            DerivationPath path = DerivationPath::parse(opts.path);

            SecureBytes seed = Hex::decode<SecureBytes>(opts.seedHex);
            std::string hmacKey = ConfigManager::getOr("KEYTREE_HMAC_KEY", XPriv::BIP32_HMAC_KEY);
            DerivedXPriv master(XPriv::customMasterNode(reinterpret_cast<const uint8_t*>(hmacKey.data()),
                                                        hmacKey.size(), seed.data(), seed.size(),
                                                        backend, hint),
                                DerivationPath());

            Logger::info("Deriving " + path.toString() + (opts.publicOnly ? " (public)" : ""),
                         __FILE__, __LINE__);

            if (opts.publicOnly) {
                DerivedXPub key = master.deriveVerifyingKey().derivePublicPath(path);
                printKeyInfo(out, key);
            } else {
                DerivedXPriv key = master.derivePrivatePath(path);
                printKeyInfo(out, key);
                out << "private key: " << Hex::encode(key.serialize()) << '\n';
            }
        }
    }

    int runDerive(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
        Options opts;
        if (!parseArgs(args, opts)) {
            printUsage(err);
            return ExitUsage;
        }

        ConfigManager::initialize(opts.configPath);

        int code = ExitOk;
        try {
            setupLogging(err);
            derive(opts, out);
        } catch (const std::invalid_argument& e) {
            err << "error: " << e.what() << '\n';
            printUsage(err);
            code = ExitUsage;
        } catch (const InvalidKey& e) {
            // Below 2^-127 for an honest seed.
            err << "error: " << e.what() << '\n';
            Logger::critical(e.what(), __FILE__, __LINE__);
            code = ExitDerivation;
        } catch (const std::exception& e) {
            err << "error: " << e.what() << '\n';
            Logger::error(e.what(), __FILE__, __LINE__);
            code = ExitDerivation;
        }

        Logger::shutdown();
        return code;
    }

} // namespace Keytree
