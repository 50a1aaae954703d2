/*
    Connection ID generator/validator tool
*/

#include <CLI/Validators.hpp>
#include <iostream>
#include <quicid.hpp>

#include "utils.hpp"

using namespace quicid;

int main(int argc, char* argv[])
{
    CLI::App cli{"quicid connection ID tool"};

    bool hashed = false;
    auto* hashed_opt = cli.add_flag("--hashed", hashed, "Use the self-validating hashed generator (8-byte IDs)");

    size_t length = DEFAULT_CID_SIZE;
    cli.add_option("--length", length, "Connection ID length for the random generator")
            ->capture_default_str()
            ->check(CLI::Range(size_t{1}, MAX_CID_SIZE))
            ->excludes(hashed_opt);

    std::string key;
    cli.add_option("-k,--key", key, "Hashed generator key as 16 hex digits; random if omitted")
            ->type_name("HEX")
            ->needs(hashed_opt);

    size_t count = 1;
    cli.add_option("-n,--count", count, "Number of connection IDs to generate")->capture_default_str();

    std::vector<std::string> to_validate;
    cli.add_option("--validate", to_validate, "Hex connection IDs to check against the generator instead of generating")
            ->type_name("HEX");

    std::string log_file, log_level;
    add_log_opts(cli, log_file, log_level);

    try
    {
        cli.parse(argc, argv);
    }
    catch (const CLI::ParseError& e)
    {
        return cli.exit(e);
    }

    setup_logging(log_file, log_level);

    std::unique_ptr<ConnectionIDGenerator> gen;
    try
    {
        if (hashed)
        {
            std::optional<opt::hash_key> hkey;
            if (!key.empty())
                hkey.emplace(std::string_view{key});
            auto hgen = std::make_unique<HashedConnectionIDGenerator>(hkey);
            if (!hkey)
                log::info(test_cat, "Using random key {:016x}", hgen->key());
            gen = std::move(hgen);
        }
        else
            gen = std::make_unique<RandomConnectionIDGenerator>(opt::cid_length{length});
    }
    catch (const std::exception& e)
    {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return 1;
    }

    if (!to_validate.empty())
    {
        int invalid = 0;
        for (const auto& hex : to_validate)
        {
            try
            {
                auto res = gen->validate(ConnectionID::from_hex(hex));
                invalid += res.failure();
                std::cout << hex << " " << res.to_string() << "\n";
            }
            catch (const std::invalid_argument& e)
            {
                ++invalid;
                std::cout << hex << " unparseable (" << e.what() << ")\n";
            }
        }
        return invalid ? 2 : 0;
    }

    try
    {
        for (size_t i = 0; i < count; ++i)
            std::cout << gen->generate_cid().to_string() << "\n";
    }
    catch (const random_source_error& e)
    {
        log::critical(test_cat, "{}", e.what());
        return 1;
    }

    return 0;
}
