// Satchel Tool
// Copyright (c) 2024 Satchel Developers
// MIT License
//
// Command-line front end for the signing core.
// Supports:
// - Listing supported chains
// - Deriving account addresses from a mnemonic read on stdin
// - Validating addresses against a chain
// - Estimating transaction size and fee
// - Printing the effective signing policy

#include <satchel/wallet/address.h>
#include <satchel/wallet/amount.h>
#include <satchel/wallet/chainparams.h>
#include <satchel/wallet/coinselection.h>
#include <satchel/wallet/errors.h>
#include <satchel/wallet/keyring.h>
#include <satchel/wallet/policy.h>
#include <satchel/util/config.h>
#include <satchel/util/logging.h>

#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <termios.h>
#include <unistd.h>

using namespace satchel;
using namespace satchel::wallet;

// ============================================================================
// Constants
// ============================================================================

constexpr const char* VERSION = "0.1.0";

// ============================================================================
// Terminal Utilities
// ============================================================================

/// Read one line from stdin, without echo when stdin is a terminal
std::string ReadSecret(const std::string& prompt) {
    const bool tty = isatty(STDIN_FILENO);
    termios oldt{};
    if (tty) {
        std::cerr << prompt << std::flush;
        tcgetattr(STDIN_FILENO, &oldt);
        termios newt = oldt;
        newt.c_lflag &= ~ECHO;
        tcsetattr(STDIN_FILENO, TCSANOW, &newt);
    }

    std::string line;
    std::getline(std::cin, line);

    if (tty) {
        tcsetattr(STDIN_FILENO, TCSANOW, &oldt);
        std::cerr << std::endl;
    }
    return line;
}

void PrintLine(char c = '-', int width = 60) {
    std::cout << std::string(width, c) << "\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct Options {
    std::string command;
    std::vector<std::string> args;
    std::string configPath;
    std::string chain{"bitcoin-mainnet"};
    std::string type;
    std::string logLevel{"warn"};
    uint32_t account = 0;
    uint32_t count = 1;
    size_t inputs = 1;
    size_t outputs = 2;
    double feeRate = 1.0;
    bool help = false;
    bool version = false;
};

bool ParseArgs(int argc, char* argv[], Options& opts) {
    auto value = [](const std::string& arg, size_t prefix) { return arg.substr(prefix); };

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                opts.help = true;
            } else if (arg == "-v" || arg == "--version") {
                opts.version = true;
            } else if (arg.rfind("--config=", 0) == 0) {
                opts.configPath = value(arg, 9);
            } else if (arg.rfind("--chain=", 0) == 0) {
                opts.chain = value(arg, 8);
            } else if (arg.rfind("--type=", 0) == 0) {
                opts.type = value(arg, 7);
            } else if (arg.rfind("--account=", 0) == 0) {
                opts.account = static_cast<uint32_t>(std::stoul(value(arg, 10)));
            } else if (arg.rfind("--count=", 0) == 0) {
                opts.count = static_cast<uint32_t>(std::stoul(value(arg, 8)));
            } else if (arg.rfind("--inputs=", 0) == 0) {
                opts.inputs = std::stoul(value(arg, 9));
            } else if (arg.rfind("--outputs=", 0) == 0) {
                opts.outputs = std::stoul(value(arg, 10));
            } else if (arg.rfind("--feerate=", 0) == 0) {
                opts.feeRate = std::stod(value(arg, 10));
            } else if (arg.rfind("--log-level=", 0) == 0) {
                opts.logLevel = value(arg, 12);
            } else if (!arg.empty() && arg[0] != '-') {
                if (opts.command.empty()) {
                    opts.command = arg;
                } else {
                    opts.args.push_back(arg);
                }
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                return false;
            }
        }
    } catch (const std::exception&) {
        std::cerr << "Error: invalid numeric option\n";
        return false;
    }
    return true;
}

std::optional<AddressType> ParseType(const Options& opts) {
    if (opts.type.empty()) {
        return std::nullopt;
    }
    auto type = AddressTypeFromString(opts.type);
    if (!type) {
        throw ValidationError(ErrorCode::UnsupportedAddressType, "unknown address type '" + opts.type + "'");
    }
    return type;
}

// ============================================================================
// Commands
// ============================================================================

int CommandChains(const KeyringContext& ctx) {
    std::cout << std::left
              << std::setw(20) << "ID" << std::setw(8) << "SYMBOL"
              << std::setw(8) << "COIN" << std::setw(8) << "P2PKH"
              << std::setw(8) << "P2SH" << std::setw(8) << "HRP" << "DEFAULT\n";
    PrintLine();
    for (const auto& id : ctx.chains.Ids()) {
        const ChainParams& p = ctx.chains.Get(id);
        std::cout << std::setw(20) << p.id << std::setw(8) << p.symbol
                  << std::setw(8) << p.coinType
                  << std::setw(8) << p.pubKeyHash.ToHex()
                  << std::setw(8) << p.scriptHash.ToHex()
                  << std::setw(8) << p.bech32Hrp.value_or("-")
                  << AddressTypeToString(p.defaultAddressType) << "\n";
    }
    return 0;
}

int CommandDerive(const KeyringContext& ctx, const Options& opts) {
    auto type = ParseType(opts);
    ctx.chains.Get(opts.chain);

    std::string mnemonic = ReadSecret("Recovery phrase: ");
    Keyring keyring(ctx);
    keyring.Unlock(mnemonic);
    SecureClear(&mnemonic[0], mnemonic.size());

    for (uint32_t i = 0; i < opts.count; ++i) {
        uint32_t account = opts.account + i;
        std::cout << keyring.GetPath(opts.chain, account, type).ToString() << "  "
                  << keyring.GetAddress(opts.chain, account, type) << "\n";
    }
    keyring.Lock();
    return 0;
}

int CommandValidate(const KeyringContext& ctx, const Options& opts) {
    if (opts.args.empty()) {
        std::cerr << "Usage: satchel-tool validate --chain=<id> <address>...\n";
        return 1;
    }
    const ChainParams& params = ctx.chains.Get(opts.chain);

    int invalid = 0;
    for (const auto& address : opts.args) {
        auto script = DecodeAddress(address, params);
        if (script) {
            std::cout << address << "  valid  " << ScriptTypeToString(script->GetType())
                      << "  " << script->ToHex() << "\n";
        } else {
            std::cout << address << "  invalid\n";
            ++invalid;
        }
    }
    return invalid == 0 ? 0 : 2;
}

int CommandEstimate(const KeyringContext& ctx, const Options& opts) {
    AddressType type = ParseType(opts).value_or(ctx.chains.Get(opts.chain).defaultAddressType);
    const auto& params = ctx.policy.selection;

    size_t vsize = EstimateVsize(type, opts.inputs, opts.outputs, params);
    Amount fee = EstimateFee(type, opts.inputs, opts.outputs, opts.feeRate, params);

    std::cout << "type:    " << AddressTypeToString(type) << "\n"
              << "inputs:  " << opts.inputs << "\n"
              << "outputs: " << opts.outputs << "\n"
              << "vsize:   " << vsize << " vB\n"
              << "feerate: " << opts.feeRate << " sat/vB\n"
              << "fee:     " << fee << " sat (" << FormatAmount(fee) << ")\n"
              << "dust:    " << params.dust.For(type) << " sat\n";
    return 0;
}

int CommandPolicy(const KeyringContext& ctx) {
    std::cout << ctx.policy.ToConfigString();
    return 0;
}

// ============================================================================
// Help and Usage
// ============================================================================

void PrintUsage() {
    std::cout << "Satchel Tool v" << VERSION << "\n"
              << "\n"
              << "Usage: satchel-tool <command> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  chains             List supported chains\n"
              << "  derive             Derive account addresses (mnemonic on stdin)\n"
              << "  validate <addr>... Check addresses against --chain\n"
              << "  estimate           Estimate vsize and fee\n"
              << "  policy             Print the effective signing policy\n"
              << "  help               Show this help message\n"
              << "\n"
              << "Options:\n"
              << "  --config=<file>    Signing policy file (INI)\n"
              << "  --chain=<id>       Chain id (default: bitcoin-mainnet)\n"
              << "  --type=<type>      p2pkh, p2sh-p2wpkh or p2wpkh\n"
              << "  --account=<n>      First account index (default: 0)\n"
              << "  --count=<n>        Number of accounts to derive (default: 1)\n"
              << "  --inputs=<n>       Inputs for estimate (default: 1)\n"
              << "  --outputs=<n>      Outputs for estimate (default: 2)\n"
              << "  --feerate=<r>      Fee rate in sat/vB (default: 1)\n"
              << "  --log-level=<lvl>  trace, debug, info, warn, error, off\n"
              << "\n"
              << "Examples:\n"
              << "  satchel-tool derive --chain=litecoin-mainnet --count=3 < phrase.txt\n"
              << "  satchel-tool validate --chain=dogecoin-mainnet D8ZEVbgf...\n"
              << "  satchel-tool estimate --type=p2wpkh --inputs=3 --feerate=12.5\n"
              << "\n";
}

void PrintVersion() {
    std::cout << "Satchel Tool v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 Satchel Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    Options opts;
    if (!ParseArgs(argc, argv, opts)) {
        return 1;
    }

    if (opts.version) {
        PrintVersion();
        return 0;
    }
    if (opts.help || opts.command.empty() || opts.command == "help") {
        PrintUsage();
        return (opts.help || opts.command == "help") ? 0 : 1;
    }

    util::Logger::Instance().Initialize(util::LogLevelFromString(opts.logLevel));

    KeyringContext ctx;
    try {
        if (!opts.configPath.empty()) {
            util::ConfigManager config;
            auto result = config.ParseFile(opts.configPath);
            if (!result.success) {
                std::cerr << "Error: " << result.ToString() << "\n";
                return 1;
            }
            ctx.policy = SigningPolicy::FromConfig(config);
        }

        if (opts.command == "chains") {
            return CommandChains(ctx);
        } else if (opts.command == "derive") {
            return CommandDerive(ctx, opts);
        } else if (opts.command == "validate") {
            return CommandValidate(ctx, opts);
        } else if (opts.command == "estimate") {
            return CommandEstimate(ctx, opts);
        } else if (opts.command == "policy") {
            return CommandPolicy(ctx);
        }
    } catch (const WalletError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Unknown command: " << opts.command << "\n";
    std::cerr << "Run 'satchel-tool help' for usage.\n";
    return 1;
}
