// Satchel - Signing Policy Implementation
// Copyright (c) 2024 Satchel Developers
// MIT License

#include <satchel/wallet/policy.h>
#include <satchel/wallet/errors.h>
#include <satchel/util/logging.h>

#include <cmath>
#include <sstream>

namespace satchel {
namespace wallet {

namespace {

using util::ConfigKeys::SIZE_INPUT;
using util::ConfigKeys::SIZE_OUTPUT;
using util::ConfigKeys::SIZE_OVERHEAD;

[[noreturn]] void BadValue(const std::string& section, const std::string& key) {
    throw ValidationError(ErrorCode::InvalidConfig,
        "invalid value for [" + section + "] " + key);
}

uint64_t ReadUInt(const util::ConfigManager& config, const std::string& section,
                  const std::string& key, uint64_t fallback) {
    if (!config.HasKey(key, section)) {
        return fallback;
    }
    auto value = config.TryGetUInt(key, section);
    if (!value) {
        BadValue(section, key);
    }
    return *value;
}

SizeModel ReadSizeModel(const util::ConfigManager& config, const std::string& section,
                        const SizeModel& fallback) {
    SizeModel model(
        static_cast<size_t>(ReadUInt(config, section, SIZE_OVERHEAD, fallback.overhead)),
        static_cast<size_t>(ReadUInt(config, section, SIZE_INPUT, fallback.input)),
        static_cast<size_t>(ReadUInt(config, section, SIZE_OUTPUT, fallback.output)));
    if (model.input == 0 || model.output == 0) {
        BadValue(section, "input/output");
    }
    return model;
}

} // namespace

SigningPolicy SigningPolicy::FromConfig(const util::ConfigManager& config) {
    namespace keys = util::ConfigKeys;
    SigningPolicy policy;

    if (auto mode = config.TryGetString(keys::DERIVATION, keys::SECTION_POLICY)) {
        auto parsed = DerivationPolicyFromString(*mode);
        if (!parsed) {
            BadValue(keys::SECTION_POLICY, keys::DERIVATION);
        }
        policy.derivation = *parsed;
    }

    if (config.HasKey(keys::SWEEP_MAX_FEE_RATIO, keys::SECTION_POLICY)) {
        auto ratio = config.TryGetDouble(keys::SWEEP_MAX_FEE_RATIO, keys::SECTION_POLICY);
        if (!ratio || !std::isfinite(*ratio) || *ratio <= 0 || *ratio >= 1) {
            BadValue(keys::SECTION_POLICY, keys::SWEEP_MAX_FEE_RATIO);
        }
        policy.selection.maxSweepFeeRatio = *ratio;
    }

    DustPolicy& dust = policy.selection.dust;
    dust.p2pkh = ReadUInt(config, keys::SECTION_DUST, keys::DUST_P2PKH, dust.p2pkh);
    dust.p2shP2wpkh = ReadUInt(config, keys::SECTION_DUST, keys::DUST_P2SH_P2WPKH, dust.p2shP2wpkh);
    dust.p2wpkh = ReadUInt(config, keys::SECTION_DUST, keys::DUST_P2WPKH, dust.p2wpkh);

    policy.selection.legacySize =
        ReadSizeModel(config, keys::SECTION_SIZE_LEGACY, policy.selection.legacySize);
    policy.selection.segwitSize =
        ReadSizeModel(config, keys::SECTION_SIZE_SEGWIT, policy.selection.segwitSize);

    LogDebugF(util::LogCategory::CONFIG, "policy: derivation=%s sweep_max_fee_ratio=%.2f",
              DerivationPolicyToString(policy.derivation), policy.selection.maxSweepFeeRatio);
    return policy;
}

std::string SigningPolicy::ToConfigString() const {
    namespace keys = util::ConfigKeys;
    const auto& sel = selection;
    std::ostringstream ss;
    ss << "[" << keys::SECTION_POLICY << "]\n"
       << keys::DERIVATION << " = " << DerivationPolicyToString(derivation) << "\n"
       << keys::SWEEP_MAX_FEE_RATIO << " = " << sel.maxSweepFeeRatio << "\n\n"
       << "[" << keys::SECTION_DUST << "]\n"
       << keys::DUST_P2PKH << " = " << sel.dust.p2pkh << "\n"
       << keys::DUST_P2SH_P2WPKH << " = " << sel.dust.p2shP2wpkh << "\n"
       << keys::DUST_P2WPKH << " = " << sel.dust.p2wpkh << "\n";

    auto writeSize = [&](const char* section, const SizeModel& m) {
        ss << "\n[" << section << "]\n"
           << SIZE_OVERHEAD << " = " << m.overhead << "\n"
           << SIZE_INPUT << " = " << m.input << "\n"
           << SIZE_OUTPUT << " = " << m.output << "\n";
    };
    writeSize(keys::SECTION_SIZE_LEGACY, sel.legacySize);
    writeSize(keys::SECTION_SIZE_SEGWIT, sel.segwitSize);
    return ss.str();
}

} // namespace wallet
} // namespace satchel
