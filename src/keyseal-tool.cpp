// KEYSEAL Keystore Tool
// Copyright (c) 2024 KEYSEAL Developers
// MIT License
//
// Command-line tool for Web3 Secret Storage keystore records.
// Supports:
// - Encrypting a private key into a new record (scrypt or PBKDF2)
// - Decrypting a record back to its private key
// - Inspecting a record's non-secret metadata

#include "keyseal/core/errors.h"
#include "keyseal/core/hex.h"
#include "keyseal/core/secure.h"
#include "keyseal/keystore/derivedkey.h"
#include "keyseal/keystore/keystore.h"
#include "keyseal/util/config.h"
#include "keyseal/util/fs.h"
#include "keyseal/util/logging.h"
#include "keyseal/util/threadpool.h"

#include <algorithm>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#ifndef _WIN32
#include <termios.h>
#include <unistd.h>
#endif

using namespace keyseal;
using namespace keyseal::keystore;

namespace Keys = util::ConfigKeys;

// ============================================================================
// Constants
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* DEFAULT_KDF = "scrypt";

// ============================================================================
// Terminal Utilities
// ============================================================================

/// Read a line from the terminal without echo
std::string ReadPassword(const std::string& prompt) {
    std::cerr << prompt << std::flush;

#ifndef _WIN32
    termios oldt;
    bool echoOff = false;
    if (isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &oldt) == 0) {
        termios newt = oldt;
        newt.c_lflag &= ~ECHO;
        echoOff = tcsetattr(STDIN_FILENO, TCSANOW, &newt) == 0;
    }
#endif

    std::string password;
    bool ok = static_cast<bool>(std::getline(std::cin, password));

#ifndef _WIN32
    if (echoOff) {
        tcsetattr(STDIN_FILENO, TCSANOW, &oldt);
        std::cerr << std::endl;
    }
#endif

    if (!ok) {
        throw std::runtime_error("no input on stdin");
    }
    return password;
}

/// Read password with confirmation
std::string ReadPasswordWithConfirm(const std::string& prompt) {
    std::string password1 = ReadPassword(prompt);
    std::string password2 = ReadPassword("Confirm password: ");

    if (password1 != password2) {
        throw std::runtime_error("passwords do not match");
    }
    return password1;
}

/// Password from --password-file (first line) or the terminal
std::string GetPassword(const util::ConfigManager& config, bool confirm) {
    std::string file = config.GetPath(Keys::PASSWORD_FILE);
    if (file.empty()) {
        return confirm ? ReadPasswordWithConfirm("Password: ") : ReadPassword("Password: ");
    }

    auto content = util::fs::ReadFile(file);
    if (!content) {
        throw KeystoreError("cannot read password file: " + file);
    }
    std::string password = content->substr(0, content->find('\n'));
    if (!password.empty() && password.back() == '\r') {
        password.pop_back();
    }
    SecureZero(&(*content)[0], content->size());
    return password;
}

void PrintLine(char c = '-', int width = 60) {
    std::cout << std::string(width, c) << "\n";
}

// ============================================================================
// Command: Encrypt
// ============================================================================

int CommandEncrypt(const util::ConfigManager& config) {
    std::string keyHex = config.GetString(Keys::KEY, "");
    if (keyHex.empty()) {
        keyHex = ReadPassword("Private key (hex): ");
    }
    if (!IsValidHex(keyHex) || StripHexPrefix(keyHex).empty()) {
        std::cerr << "Error: private key must be non-empty hex\n";
        return 1;
    }
    Bytes privateKey = HexToBytes(keyHex);
    SecureZero(&keyHex[0], keyHex.size());

    std::string kdfName = config.GetString(Keys::KDF, DEFAULT_KDF);
    auto kdf = KdfTypeFromString(kdfName);
    if (!kdf) {
        std::cerr << "Error: unknown kdf '" << kdfName << "' (use pbkdf2 or scrypt)\n";
        return 1;
    }

    std::string password = GetPassword(config, true);

    std::future<DerivedKey> pending;
    if (*kdf == KdfType::Pbkdf2) {
        auto iterations = config.TryGetUInt(Keys::ITERATIONS);
        if (config.HasKey(Keys::ITERATIONS) &&
            (!iterations || *iterations == 0 ||
             *iterations > std::numeric_limits<uint32_t>::max())) {
            std::cerr << "Error: invalid --iterations\n";
            return 1;
        }
        Pbkdf2Options options;
        options.password = password;
        options.iterations = static_cast<uint32_t>(
            iterations.value_or(DEFAULT_PBKDF2_ITERATIONS));
        pending = DeriveKeyPbkdf2Async(std::move(options));
    } else {
        auto n = config.TryGetUInt(Keys::SCRYPT_N);
        if (config.HasKey(Keys::SCRYPT_N) && !n) {
            std::cerr << "Error: invalid --scrypt-n\n";
            return 1;
        }
        ScryptOptions options;
        options.password = password;
        options.n = n.value_or(DEFAULT_SCRYPT_N);
        pending = DeriveKeyScryptAsync(std::move(options));
    }
    SecureZero(&password[0], password.size());

    std::cerr << "Deriving key..." << std::endl;
    DerivedKey key = pending.get();
    LOG_DEBUG(util::LogCategory::TOOL) << "Derived " << key;

    auto id = config.TryGetString(Keys::ID);
    Keystore ks = Encrypt(ByteSpan(privateKey), key, id);
    SecureZero(privateKey.data(), privateKey.size());

    std::string out = config.GetPath(Keys::OUT);
    if (out.empty()) {
        std::cout << SerializeKeystore(ks, config.GetBool(Keys::PRETTY, true)) << "\n";
    } else {
        SaveKeystoreFile(out, ks);
        std::cerr << "Keystore " << ks.id << " written to " << out << "\n";
    }
    return 0;
}

// ============================================================================
// Command: Decrypt
// ============================================================================

Keystore LoadFromOptions(const util::ConfigManager& config) {
    std::string in = config.GetPath(Keys::IN);
    if (in.empty()) {
        throw KeystoreError("--in=<file> is required");
    }
    return LoadKeystoreFile(in);
}

int CommandDecrypt(const util::ConfigManager& config) {
    Keystore ks = LoadFromOptions(config);
    std::string password = GetPassword(config, false);

    std::cerr << "Deriving key..." << std::endl;
    auto pending = DeriveKeyForKeystoreAsync(ks, password);
    SecureZero(&password[0], password.size());
    DerivedKey key = pending.get();

    try {
        std::cout << DecryptToHex(ks, key) << "\n";
    } catch (const CorruptKeystoreError&) {
        std::cerr << "Error: wrong password or corrupt keystore\n";
        return 1;
    }
    return 0;
}

// ============================================================================
// Command: Inspect
// ============================================================================

int CommandInspect(const util::ConfigManager& config) {
    Keystore ks = LoadFromOptions(config);
    const CryptoSection& crypto = ks.crypto;

    PrintLine('=');
    std::cout << "KEYSTORE RECORD\n";
    PrintLine('=');
    std::cout << "Id:             " << ks.id << "\n";
    std::cout << "Version:        " << ks.version << "\n";
    std::cout << "Cipher:         " << crypto.cipher << "\n";
    std::cout << "IV:             " << BytesToHex(crypto.cipherparams.iv) << "\n";
    std::cout << "Ciphertext:     " << crypto.ciphertext.size() << " bytes\n";
    std::cout << "MAC:            " << crypto.mac.ToHex() << "\n";
    PrintLine();
    std::cout << "KDF:            " << KdfTypeToString(crypto.Kdf()) << "\n";

    if (const auto* pbkdf2 = std::get_if<Pbkdf2Params>(&crypto.kdfparams)) {
        std::cout << "Iterations:     " << pbkdf2->c << "\n";
        std::cout << "PRF:            " << pbkdf2->prf << "\n";
    } else {
        const auto& scrypt = std::get<ScryptParams>(crypto.kdfparams);
        std::cout << "N:              " << scrypt.n << "\n";
        std::cout << "r:              " << scrypt.r << "\n";
        std::cout << "p:              " << scrypt.p << "\n";
    }
    std::cout << "Salt:           " << BytesToHex(GetSalt(crypto.kdfparams)) << "\n";
    return 0;
}

// ============================================================================
// Help and Usage
// ============================================================================

void PrintUsage() {
    std::cout << "KEYSEAL Keystore Tool v" << VERSION << "\n";
    std::cout << "\n";
    std::cout << "Usage: keyseal-tool <command> [options]\n";
    std::cout << "\n";
    std::cout << "Commands:\n";
    std::cout << "  encrypt         Encrypt a private key into a keystore record\n";
    std::cout << "  decrypt         Decrypt a keystore record and print the key\n";
    std::cout << "  inspect         Validate a record and show its parameters\n";
    std::cout << "  help            Show this help message\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  --key=<hex>            Private key to encrypt (prompted if absent)\n";
    std::cout << "  --kdf=<name>           scrypt (default) or pbkdf2\n";
    std::cout << "  --iterations=<n>       PBKDF2 iterations (default: 262144)\n";
    std::cout << "  --scrypt-n=<n>         scrypt cost, a power of two (default: 262144)\n";
    std::cout << "  --id=<uuid>            Record id (default: random UUID)\n";
    std::cout << "  --in=<file>            Record to decrypt or inspect\n";
    std::cout << "  --out=<file>           Write the new record here instead of stdout\n";
    std::cout << "  --password-file=<f>    Read the password from the first line of f\n";
    std::cout << "  --nopretty             Print the record on one line\n";
    std::cout << "  --threads=<n>          Worker threads for key derivation\n";
    std::cout << "  --conf=<file>          Config file (default: ~/" << util::DEFAULT_CONFIG_FILENAME << ")\n";
    std::cout << "  --loglevel=<level>     trace, debug, info, warn, error, off\n";
    std::cout << "  --debug[=<cat,...>]    Debug logging (kdf, keystore, crypto, tool)\n";
    std::cout << "  --logfile=<file>       Also log to a file\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  keyseal-tool encrypt --key=0x4c0883a6... --out=key.json\n";
    std::cout << "  keyseal-tool encrypt --kdf=pbkdf2 --iterations=1m\n";
    std::cout << "  keyseal-tool decrypt --in=key.json\n";
    std::cout << "\n";
}

void PrintVersion() {
    std::cout << "KEYSEAL Keystore Tool v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 KEYSEAL Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Setup
// ============================================================================

bool LoadConfig(util::ConfigManager& config, int argc, char* argv[]) {
    auto result = config.ParseCommandLine(argc, argv);
    if (!result.success) {
        std::cerr << "Error: " << result.Describe() << "\n";
        return false;
    }

    std::string conf = config.GetPath(Keys::CONF);
    if (!conf.empty()) {
        result = config.ParseFile(conf);
        if (!result.success) {
            std::cerr << "Error: " << result.Describe() << "\n";
            return false;
        }
    } else {
        std::string defaultConf = util::ConfigManager::GetDefaultConfigPath();
        if (!defaultConf.empty() && util::fs::Exists(defaultConf)) {
            result = config.ParseFile(defaultConf);
            if (!result.success) {
                std::cerr << "Error: " << result.Describe() << "\n";
                return false;
            }
        }
    }

    const char* const allowed[] = {
        Keys::CONF, Keys::DEBUG, Keys::LOGLEVEL, Keys::PRINTTOCONSOLE,
        Keys::LOGFILE, Keys::THREADS, Keys::HELP, Keys::VERSION,
        Keys::KDF, Keys::ITERATIONS, Keys::SCRYPT_N, Keys::KEY,
        Keys::ID, Keys::IN, Keys::OUT, Keys::PASSWORD_FILE,
        Keys::PRETTY, "h", "v"
    };
    for (const char* key : allowed) {
        config.AllowKey(key);
    }
    return true;
}

bool SetupLogging(const util::ConfigManager& config) {
    util::LogSettings settings;
    settings.level = util::LogLevelFromString(
        config.GetString(Keys::LOGLEVEL, util::LogLevelToString(settings.level)));
    settings.printToConsole = config.GetBool(Keys::PRINTTOCONSOLE, true);
    settings.logFile = config.GetPath(Keys::LOGFILE);

    // --debug alone enables everything; --debug=kdf,keystore narrows it
    if (config.HasKey(Keys::DEBUG) && config.GetBool(Keys::DEBUG, true)) {
        settings.level = util::LogLevel::Debug;
        for (const auto& category : config.GetList(Keys::DEBUG)) {
            if (!util::ConfigManager::ParseBool(category)) {
                settings.categories.push_back(category);
            }
        }
    }

    if (!util::ConfigureLogging(settings)) {
        std::cerr << "Error: cannot open log file " << settings.logFile << "\n";
        return false;
    }

    for (const auto& warning : config.Validate()) {
        LOG_WARN(util::LogCategory::TOOL) << warning;
    }
    return true;
}

void SetupThreadPool(const util::ConfigManager& config) {
    auto threads = config.TryGetUInt(Keys::THREADS);
    if (threads && *threads > 0) {
        util::ThreadPool::Config poolConfig;
        poolConfig.numThreads = static_cast<size_t>(std::min<uint64_t>(*threads, 64));
        poolConfig.name = "kdf";
        util::InitGlobalThreadPool(poolConfig);
    }
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    util::ConfigManager config;
    if (!LoadConfig(config, argc, argv)) {
        return 1;
    }

    if (config.GetBool(Keys::VERSION, false) || config.GetBool("v", false)) {
        PrintVersion();
        return 0;
    }

    const auto& args = config.GetPositionalArgs();
    std::string command = args.empty() ? "" : args.front();
    bool help = config.GetBool(Keys::HELP, false) || config.GetBool("h", false);

    if (help || command.empty() || command == "help") {
        PrintUsage();
        return (help || command == "help") ? 0 : 1;
    }

    if (!SetupLogging(config)) {
        return 1;
    }

    int rc = 1;
    try {
        SetupThreadPool(config);

        if (command == "encrypt") {
            rc = CommandEncrypt(config);
        } else if (command == "decrypt") {
            rc = CommandDecrypt(config);
        } else if (command == "inspect") {
            rc = CommandInspect(config);
        } else {
            std::cerr << "Unknown command: " << command << "\n";
            std::cerr << "Run 'keyseal-tool help' for usage.\n";
        }
    } catch (const KeystoreError& e) {
        std::cerr << "Error: " << e.what() << "\n";
    } catch (const std::exception& e) {
        LOG_ERROR(util::LogCategory::TOOL) << "Unhandled error: " << e.what();
        std::cerr << "Error: " << e.what() << "\n";
    }

    util::ShutdownGlobalThreadPool();
    return rc;
}
