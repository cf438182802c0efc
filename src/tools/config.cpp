#include "config.hpp"
#include "version.hpp"

namespace tapvault {

namespace config {

const char * const CREATE = "create";
const char * const CONTROLBLOCK = "controlblock";
const char * const TWEAK = "tweak";

namespace option {

const char * const CONF = "--conf";
const char * const CHAINMODE = "--mode";
const char * const PUBKEY = "--pubkey";
const char * const HEIGHT = "--height";
const char * const LOCK_DELTA = "--lock-delta";
const char * const THRESHOLD = "--threshold";
const char * const INTERNAL_PUBKEY = "--internal-pubkey";
const char * const LEAF = "--leaf";
const char * const MERKLE_ROOT = "--merkle-root";

namespace mode {
    const char * const MAINNET = "mainnet";
    const char * const TESTNET = "testnet";
    const char * const REGTEST = "regtest";
}

}

}

namespace {

void AddTaprootOptions(CLI::App* app)
{
    using namespace ::tapvault::config;

    app->add_option(option::PUBKEY, "Participant public key, hex: 33 bytes compressed or 32 bytes x-only. Key order defines signature slots")
            ->required()->take_all();
    app->add_option(option::HEIGHT, "Current chain height")->required();
    app->add_option(option::LOCK_DELTA, "Blocks between current height and timelock leaf lock height")->default_str("2000");
    app->add_option(option::THRESHOLD, "Signatures required by the threshold leaf")->default_str("2");
    app->add_option(option::INTERNAL_PUBKEY, "Internal public key, hex. First participant key by default");
}

}

using namespace ::tapvault::config;

Config::Config():mApp("tapvault", "tapvault")
{
    mApp.set_config(option::CONF, "tapvault.conf", "Read the configuration file");
    mApp.set_version_flag("--version,-v", Version::MakeFullVersion());
    mApp.set_help_flag("--help,-h");
    mApp.require_subcommand(1);

    mApp.add_option(option::CHAINMODE, "Mode to operate: mainnet, testnet, regtest")->check([](const std::string& s){
            if (s != option::mode::MAINNET && s != option::mode::TESTNET && s != option::mode::REGTEST) throw CLI::ValidationError("Unknown chain mode: " + s);
            return std::string();
        })->default_str(option::mode::MAINNET);

    //-------------------------------------------------------------------------
    // [create]
    {
        auto create = mApp.add_subcommand(CREATE, "Build taproot output and print it as JSON");
        create->configurable();
        AddTaprootOptions(create);
    }

    //-------------------------------------------------------------------------
    // [controlblock]
    {
        auto controlblock = mApp.add_subcommand(CONTROLBLOCK, "Print control block of a script leaf");
        controlblock->configurable();
        AddTaprootOptions(controlblock);
        controlblock->add_option(option::LEAF, "Leaf index: 0 - threshold leaf, 1 - timelock leaf")->required();
    }

    //-------------------------------------------------------------------------
    // [tweak]
    {
        auto tweak = mApp.add_subcommand(TWEAK, "Print taproot output key for an internal key and merkle root");
        tweak->configurable();
        tweak->add_option(option::PUBKEY, "Internal public key, hex")->required();
        tweak->add_option(option::MERKLE_ROOT, "Script tree merkle root, hex. Key path only output when omitted");
    }
}

IBech32Coder::ChainMode Config::ChainMode() const
{
    const CLI::Option* opt = mApp.get_option(option::CHAINMODE);
    return ParseChainMode(opt->count() ? opt->as<std::string>() : std::string(option::mode::MAINNET));
}

}
