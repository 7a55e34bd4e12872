/**
 * @file main.cpp
 * @brief Command-line front end: create shares from a secret, or recover it interactively.
 * @author Arkenstone Project
 * @date 2026
 */

#include "../include/console.hpp"
#include "../include/constants.hpp"
#include "../include/exceptions.hpp"
#include "../include/gf256.hpp"
#include "../include/hex.hpp"
#include "../include/logger.hpp"
#include "../include/mnemonic_scheme.hpp"
#include "../include/recovery_session.hpp"
#include "../include/word_codec.hpp"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#ifndef ARKENSTONE_DEFAULT_WORDLIST
#define ARKENSTONE_DEFAULT_WORDLIST "wordlists/english.txt"
#endif

using namespace Arkenstone;

namespace {

    void printUsage() {
        std::cout <<
            "Usage:\n"
            "  arkenstone-cli create SCHEME [options]\n"
            "  arkenstone-cli recover [-p] [options]\n"
            "\n"
            "Schemes:\n"
            "  single   one 1-of-1 share\n"
            "  MofN     one group of N shares, any M recover (e.g. 2of3)\n"
            "  master   a 1-of-1 master share plus a 3-of-5 group, either group recovers\n"
            "  custom   -t T groups needed, one -g M N per group\n"
            "\n"
            "Create options:\n"
            "  -g, --group M N           add an M-of-N group (custom only)\n"
            "  -t, --threshold T         groups needed to recover (custom only)\n"
            "  -E, --exponent E          iteration exponent (default 0)\n"
            "  -s, --strength BITS       random secret strength (default 128)\n"
            "  -S, --master-secret HEX   split this secret instead of a random one\n"
            "  -p, --passphrase TEXT     passphrase (requires -S)\n"
            "\n"
            "Recover options:\n"
            "  -p, --passphrase-prompt   ask for a passphrase after the shares\n"
            "\n"
            "Common options:\n"
            "  --wordlist PATH           vocabulary file (default $ARKENSTONE_WORDLIST or "
            ARKENSTONE_DEFAULT_WORDLIST ")\n"
            "  -v, --verbose             log events to stderr\n";
    }

    std::string resolveWordlist(const std::optional<std::string>& flag) {
        if (flag) return *flag;
        if (const char* env = std::getenv("ARKENSTONE_WORDLIST")) return env;
        return ARKENSTONE_DEFAULT_WORDLIST;
    }

    int create(const std::vector<std::string>& args) {
        if (args.empty())
            throw UsageError("Missing SCHEME argument.");

        const std::string scheme = args[0];
        std::vector<GroupSpec> groups;
        std::optional<int> threshold;
        unsigned exponent = 0;
        std::size_t strength = MIN_STRENGTH_BITS;
        std::optional<std::string> masterHex;
        std::optional<std::string> passphrase;
        std::optional<std::string> wordlistPath;

        for (std::size_t i = 1; i < args.size(); ++i) {
            const std::string& a = args[i];
            auto next = [&](const std::string& option) -> const std::string& {
                if (i + 1 >= args.size()) throw UsageError("Missing value for " + option);
                return args[++i];
            };

            if (a == "-g" || a == "--group") {
                const uint8_t m = parseSmall(next(a), a);
                const uint8_t n = parseSmall(next(a), a);
                groups.push_back(GroupSpec{m, n});
            } else if (a == "-t" || a == "--threshold") {
                threshold = parseInt(next(a), a);
            } else if (a == "-E" || a == "--exponent") {
                exponent = parseSmall(next(a), a);
            } else if (a == "-s" || a == "--strength") {
                strength = parseBitCount(next(a), a);
            } else if (a == "-S" || a == "--master-secret") {
                masterHex = next(a);
            } else if (a == "-p" || a == "--passphrase") {
                passphrase = next(a);
            } else if (a == "--wordlist") {
                wordlistPath = next(a);
            } else if (a == "-v" || a == "--verbose") {
                Logger::instance().setEnabled(true);
            } else {
                throw UsageError("Unknown option: " + a);
            }
        }

        if (passphrase && !passphrase->empty() && !masterHex)
            throw UsageError("Only use passphrase in conjunction with an explicit master secret.");

        if ((!groups.empty() || threshold) && scheme != "custom")
            throw UsageError("To use -g/-t, you must select 'custom' scheme.");

        uint8_t groupThreshold = 1;
        if (scheme == "single") {
            groups = {GroupSpec{1, 1}};
        } else if (scheme == "master") {
            groups = {GroupSpec{1, 1}, GroupSpec{3, 5}};
        } else if (scheme == "custom") {
            if (!threshold)
                throw UsageError("Use '-t' to specify the number of groups required for recovery.");
            if (groups.empty())
                throw UsageError("Use '-g T N' to add a T-of-N group to the collection.");
            if (*threshold < 1 || *threshold > 255)
                throw UsageError("Invalid group threshold: " + std::to_string(*threshold));
            groupThreshold = static_cast<uint8_t>(*threshold);
        } else {
            const auto pos = scheme.find("of");
            if (pos == std::string::npos || pos == 0)
                throw UsageError("Unknown scheme: " + scheme);
            const uint8_t m = parseSmall(scheme.substr(0, pos), "scheme");
            const uint8_t n = parseSmall(scheme.substr(pos + 2), "scheme");
            groups = {GroupSpec{m, n}};
        }

        for (const auto& g : groups) {
            if (g.memberThreshold == 1 && g.memberCount > 1) {
                std::cout << "1-of-X groups are not allowed.\n"
                          << "Instead, set up a 1-of-1 group and give everyone the same share.\n";
                return 1;
            }
        }

        const GF256 field;
        const Wordlist wordlist = Wordlist::loadFromFile(resolveWordlist(wordlistPath));
        const MnemonicScheme splitter(field, wordlist);

        const secure_string pass(passphrase ? *passphrase : std::string());

        SecureBytes secret;
        MnemonicScheme::Mnemonics mnemonics;
        if (masterHex) {
            secret = hexDecode(*masterHex);
            mnemonics = splitter.generate(groupThreshold, groups, secret, pass, exponent);
        } else {
            auto split = splitter.generateRandom(groupThreshold, groups, strength, pass, exponent);
            secret = std::move(split.masterSecret);
            mnemonics = std::move(split.mnemonics);
        }

        std::cout << "Using master secret: " << hexEncode(secret) << "\n";

        for (std::size_t i = 0; i < mnemonics.size(); ++i) {
            std::cout << "Group " << (i + 1) << " of " << mnemonics.size() << " - "
                      << static_cast<int>(groups[i].memberThreshold) << " of "
                      << static_cast<int>(groups[i].memberCount) << " shares required:\n";
            for (const auto& m : mnemonics[i]) {
                std::cout << m << "\n";
            }
        }
        return 0;
    }

    void printStatus(const SessionStatus& status) {
        std::cout << "\n";
        if (status.groupCount > 1) {
            std::cout << "Completed " << status.completedGroups << " of "
                      << static_cast<int>(status.groupThreshold) << " groups needed:\n";
        }
        for (const auto& g : status.groups) {
            switch (g.state) {
                case GroupStatus::State::Empty:
                    std::cout << "✗ " << g.collected << " shares from group " << g.prefix << "\n";
                    break;
                case GroupStatus::State::InProgress:
                    std::cout << "● " << g.collected << " of " << static_cast<int>(g.memberThreshold)
                              << " shares needed from group " << g.prefix << "\n";
                    break;
                case GroupStatus::State::Finished:
                    std::cout << "✓ " << g.collected << " of " << static_cast<int>(g.memberThreshold)
                              << " shares needed from group " << g.prefix << "\n";
                    break;
            }
        }
    }

    int recover(const std::vector<std::string>& args) {
        bool askPassphrase = false;
        std::optional<std::string> wordlistPath;

        for (std::size_t i = 0; i < args.size(); ++i) {
            const std::string& a = args[i];
            if (a == "-p" || a == "--passphrase-prompt") {
                askPassphrase = true;
            } else if (a == "--wordlist") {
                if (i + 1 >= args.size()) throw UsageError("Missing value for " + a);
                wordlistPath = args[++i];
            } else if (a == "-v" || a == "--verbose") {
                Logger::instance().setEnabled(true);
            } else {
                throw UsageError("Unknown option: " + a);
            }
        }

        const GF256 field;
        const Wordlist wordlist = Wordlist::loadFromFile(resolveWordlist(wordlistPath));
        const MnemonicScheme combiner(field, wordlist);
        RecoverySession session(combiner);

        while (!session.isComplete()) {
            std::cout << "Enter a recovery share: " << std::flush;
            std::string line;
            if (!std::getline(std::cin, line)) {
                session.cancel();
                return 1;
            }

            const AcceptResult result = session.accept(line);
            secure_memzero(&line[0], line.size());
            if (!result.accepted() && result.status != AcceptResult::Status::Duplicate) {
                std::cout << "ERROR: " << result.message << "\n";
            }
            if (session.state() != SessionState::Empty) {
                printStatus(session.status());
            }
        }

        secure_string passphrase;
        if (askPassphrase) {
            std::optional<secure_string> entered = promptPassphrase(std::cin, std::cout, true);
            if (!entered) {
                session.cancel();
                std::cout << "\nAborted: no passphrase was entered.\n";
                return 1;
            }
            passphrase = std::move(*entered);
        }

        try {
            const SecureBytes secret = session.recover(passphrase);
            std::cout << "SUCCESS!\n"
                      << "Your master secret is: " << hexEncode(secret) << "\n";
        } catch (const CryptoException& e) {
            std::cout << "ERROR: " << e.what() << "\n"
                      << "Recovery failed\n";
            return 1;
        }
        return 0;
    }
}

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty() || args[0] == "-h" || args[0] == "--help") {
        printUsage();
        return args.empty() ? 2 : 0;
    }

    const std::string command = args[0];
    args.erase(args.begin());

    try {
        if (command == "create") return create(args);
        if (command == "recover") return recover(args);
        throw UsageError("Unknown command: " + command);
    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        printUsage();
        return 2;
    } catch (const CryptoException& e) {
        Logger::instance().log(Logger::Level::Error, "command_failed", {{"kind", toString(e.kind())}});
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
