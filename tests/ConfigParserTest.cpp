// =================================================================
// tests/ConfigParserTest.cpp
// =================================================================
// Unit tests for ConfigParser and TestgateConfig.

#include "Testgate/CliParser.hpp"
#include "Testgate/ConfigParser.hpp"
#include "Testgate/TestgateConfig.hpp"
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

class ConfigParserTest {
private:
    fs::path test_dir;

public:
    ConfigParserTest() {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        test_dir = fs::temp_directory_path() / ("testgate_config_test_" + std::to_string(stamp));
        fs::create_directories(test_dir);
    }

    ~ConfigParserTest() {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    void testDottedKeys() {
        std::cout << "Testing nested keys are flattened..." << std::endl;

        Testgate::ConfigParser parser;
        bool loaded = parser.loadFromString(
            "storage_dir: /var/lib/testgate\n"
            "git:\n"
            "  binary: /usr/bin/git\n"
            "apply:\n"
            "  leniency:\n"
            "    enabled: false\n"
            "list:\n"
            "  - ignored\n");

        assert(loaded);
        assert(parser.getStringValue("storage_dir") == "/var/lib/testgate");
        assert(parser.getStringValue("git.binary") == "/usr/bin/git");
        assert(parser.getStringValue("apply.leniency.enabled") == "false");
        assert(!parser.hasKey("git"));
        assert(!parser.hasKey("list"));
        assert(parser.getStringValue("missing.key").empty());

        std::cout << "✓ Dotted key test passed" << std::endl;
    }

    void testMalformedYaml() {
        std::cout << "Testing malformed YAML is reported..." << std::endl;

        Testgate::ConfigParser parser;
        assert(!parser.loadFromString("git: [unclosed\n"));
        assert(!parser.getLoadError().empty());

        fs::path bad_file = test_dir / "bad.yml";
        std::ofstream(bad_file) << "git: {binary: git\n";
        Testgate::ConfigParser from_file(bad_file.string());
        assert(!from_file.getLoadError().empty());
        assert(!from_file.hasKey("git.binary"));

        std::cout << "✓ Malformed YAML test passed" << std::endl;
    }

    void testMissingFileUsesDefaults() {
        std::cout << "Testing missing config file..." << std::endl;

        Testgate::ConfigParser parser((test_dir / "nope.yml").string());
        assert(parser.getLoadError().empty());

        Testgate::TestgateConfig config;
        config.loadFromConfig(parser);
        assert(config.storage_dir == ".testgate");
        assert(config.git_binary == "git");
        assert(config.git_max_buffer_bytes == 20u * 1024u * 1024u);
        assert(config.worktree_default_ref == "HEAD");
        assert(config.leniency.enabled);
        assert(config.getWorktreeBaseDir() == ".testgate");
        assert(config.getLogDir() == (fs::path(".testgate") / "logs").string());
        assert(config.validate());

        std::cout << "✓ Missing file test passed" << std::endl;
    }

    void testDefaultConfigRoundTrip() {
        std::cout << "Testing the generated default config loads cleanly..." << std::endl;

        Testgate::ConfigParser parser;
        assert(parser.loadFromString(Testgate::TestgateConfig::defaultConfigYaml()));

        Testgate::TestgateConfig defaults;
        Testgate::TestgateConfig loaded;
        loaded.loadFromConfig(parser);

        assert(loaded.storage_dir == defaults.storage_dir);
        assert(loaded.git_binary == defaults.git_binary);
        assert(loaded.git_max_buffer_bytes == defaults.git_max_buffer_bytes);
        assert(loaded.worktree_default_ref == defaults.worktree_default_ref);
        assert(loaded.leniency.enabled == defaults.leniency.enabled);
        assert(loaded.leniency.identifier_pattern == defaults.leniency.identifier_pattern);
        assert(loaded.console_level == defaults.console_level);
        assert(loaded.file_level == defaults.file_level);
        assert(loaded.console_logging == defaults.console_logging);
        assert(loaded.validate());

        std::cout << "✓ Default config round trip test passed" << std::endl;
    }

    void testLoadedValues() {
        std::cout << "Testing configured values override defaults..." << std::endl;

        Testgate::ConfigParser parser;
        assert(parser.loadFromString(
            "storage_dir: store\n"
            "git:\n"
            "  max_buffer_bytes: 1024\n"
            "worktree:\n"
            "  base_dir: /tmp/wt\n"
            "  default_ref: '  main  '\n"
            "apply:\n"
            "  leniency:\n"
            "    enabled: no\n"
            "logging:\n"
            "  dir: /tmp/logs\n"
            "  console_level: warn\n"
            "  file_level: error\n"
            "  console: off\n"));

        Testgate::TestgateConfig config;
        config.loadFromConfig(parser);
        assert(config.storage_dir == "store");
        assert(config.git_max_buffer_bytes == 1024);
        assert(config.getWorktreeBaseDir() == "/tmp/wt");
        assert(config.worktree_default_ref == "main");
        assert(!config.leniency.enabled);
        assert(config.getLogDir() == "/tmp/logs");
        assert(config.console_level == "warn");
        assert(config.file_level == "error");
        assert(!config.console_logging);

        std::cout << "✓ Loaded values test passed" << std::endl;
    }

    void testValidationFailures() {
        std::cout << "Testing invalid settings fail validation..." << std::endl;

        Testgate::TestgateConfig bad_regex;
        bad_regex.leniency.identifier_pattern = "TC-(";
        assert(!bad_regex.validate());

        // A broken pattern is irrelevant while leniency is off
        bad_regex.leniency.enabled = false;
        assert(bad_regex.validate());

        Testgate::TestgateConfig bad_level;
        bad_level.console_level = "loud";
        assert(!bad_level.validate());

        Testgate::TestgateConfig bad_file_level;
        bad_file_level.file_level = "loud";
        assert(!bad_file_level.validate());

        Testgate::TestgateConfig no_binary;
        no_binary.git_binary = "  ";
        assert(!no_binary.validate());

        Testgate::TestgateConfig no_buffer;
        no_buffer.git_max_buffer_bytes = 0;
        assert(!no_buffer.validate());

        std::cout << "✓ Validation failure test passed" << std::endl;
    }

    void testCommandOverrides() {
        std::cout << "Testing command-line overrides..." << std::endl;

        Testgate::TestgateConfig config;
        Testgate::Commands commands;
        commands.storage_dir = "/elsewhere";
        commands.verbose = true;
        config.applyCommandOverrides(commands);
        assert(config.storage_dir == "/elsewhere");
        assert(config.console_level == "debug");

        Testgate::TestgateConfig quiet_config;
        Testgate::Commands quiet;
        quiet.quiet = true;
        quiet_config.applyCommandOverrides(quiet);
        assert(quiet_config.storage_dir == ".testgate");
        assert(quiet_config.console_level == "error");

        std::cout << "✓ Command override test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ConfigParser unit tests..." << std::endl;

        testDottedKeys();
        testMalformedYaml();
        testMissingFileUsesDefaults();
        testDefaultConfigRoundTrip();
        testLoadedValues();
        testValidationFailures();
        testCommandOverrides();

        std::cout << "All ConfigParser tests passed!" << std::endl;
    }
};

int main() {
    try {
        ConfigParserTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
