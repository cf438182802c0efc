#pragma once

#include <optional>

#include "CLI11.hpp"
#include "common.hpp"
#include "utils.hpp"

namespace tapvault {

namespace config {

extern const char* const CREATE;
extern const char* const CONTROLBLOCK;
extern const char* const TWEAK;

namespace option {

extern const char* const CONF;
extern const char* const CHAINMODE;
extern const char* const PUBKEY;
extern const char* const HEIGHT;
extern const char* const LOCK_DELTA;
extern const char* const THRESHOLD;
extern const char* const INTERNAL_PUBKEY;
extern const char* const LEAF;
extern const char* const MERKLE_ROOT;

namespace mode {

extern const char* const MAINNET;
extern const char* const TESTNET;
extern const char* const REGTEST;

} // namespace tapvault::config::option::mode

} // namespace tapvault::config::option

} // namespace tapvault::config

class Config {
private:
    CLI::App mApp;

    std::optional<int> Parse(std::vector<std::string>&& reversed_args)
    {
        try
        {
            mApp.parse(std::move(reversed_args));
        }
        catch(const CLI::ParseError &e)
        {
            return mApp.exit(e);
        }
        return {};
    }

public:
    explicit Config();
    ~Config() = default;

    // Returns exit code when the run is complete after parsing: help, version or parse error
    std::optional<int> ProcessConfig(const std::vector<std::string>& args)
    {
        return Parse(stringvector(args.rbegin(), args.rend()));
    }

    std::optional<int> ProcessConfig(int argc, const char* const argv[])
    {
        try
        {
            mApp.parse(argc, argv);
        }
        catch(const CLI::ParseError &e)
        {
            return mApp.exit(e);
        }
        return {};
    }

    const CLI::App& Subcommand(const std::string& name) const
    { return *mApp.get_subcommand(name); }

    bool Selected(const std::string& name) const
    { return mApp.got_subcommand(name); }

    IBech32Coder::ChainMode ChainMode() const;

    template <typename T>
    std::optional<T> Value(const std::string& subcommand, const std::string& name) const
    {
        const CLI::Option* opt = Subcommand(subcommand).get_option(name);
        if (opt->count() == 0) {
            return {};
        }
        return opt->template as<T>();
    }

    template <typename T>
    T Value(const std::string& subcommand, const std::string& name, T default_value) const
    { return Value<T>(subcommand, name).value_or(std::move(default_value)); }
};

} // namespace tapvault
