// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 ZeroVault contributors

#include <giomm/init.h>
#include <glibmm/optioncontext.h>
#include <glibmm/optionentry.h>
#include <glibmm/optiongroup.h>
#include <format>
#include <iostream>
#include <stdexcept>
#include <string>
#include "core/PasswordGenerator.h"
#include "core/StrengthScorer.h"
#include "utils/Log.h"
#include "utils/SecureMemory.h"
#include "utils/SettingsValidator.h"

namespace {

Glib::OptionEntry make_entry(const char* long_name, gchar short_name, const char* description) {
    Glib::OptionEntry entry;
    entry.set_long_name(long_name);
    if (short_name != '\0') {
        entry.set_short_name(short_name);
    }
    entry.set_description(description);
    return entry;
}

int run_score() {
    std::string line;
    std::getline(std::cin, line);
    const ZeroVault::SecureString password{Glib::ustring(line)};
    ZeroVault::secure_clear(line);

    const auto result = ZeroVault::StrengthScorer::score(password.get().raw());

    std::cout << std::format("score: {}/{}\n", result.score, ZeroVault::StrengthScorer::MAX_SCORE);
    std::cout << std::format("band: {}\n", ZeroVault::to_string(result.band()));
    for (auto code : result.feedback_codes()) {
        std::cout << std::format("feedback: {}\n", code);
    }
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    Gio::init();

    // Installed preferences supply the default length; --length overrides it
    const auto settings = ZeroVault::SettingsValidator::open();
    if (!settings) {
        ZeroVault::Log::debug("Schema {} not installed, using built-in defaults",
                              ZeroVault::SettingsValidator::SCHEMA_ID);
    }

    bool generate = false;
    bool score = false;
    bool verbose = false;
    bool no_upper = false;
    bool no_lower = false;
    bool no_digits = false;
    bool no_symbols = false;
    bool exclude_ambiguous = false;
    int length = settings ? ZeroVault::SettingsValidator::get_generator_length(settings)
                          : ZeroVault::PasswordPolicy{}.length;

    Glib::OptionGroup group("zerovault", "ZeroVault options", "Show ZeroVault options");
    group.add_entry(make_entry("generate", 'g', "Print a random password"), generate);
    group.add_entry(make_entry("length", 'l', "Length of the generated password (8-128)"), length);
    group.add_entry(make_entry("no-upper", '\0', "Leave out uppercase letters"), no_upper);
    group.add_entry(make_entry("no-lower", '\0', "Leave out lowercase letters"), no_lower);
    group.add_entry(make_entry("no-digits", '\0', "Leave out digits"), no_digits);
    group.add_entry(make_entry("no-symbols", '\0', "Leave out symbols"), no_symbols);
    group.add_entry(make_entry("exclude-ambiguous", '\0', "Leave out look-alike characters"), exclude_ambiguous);
    group.add_entry(make_entry("score", 's', "Score a password read from standard input"), score);
    group.add_entry(make_entry("verbose", 'v', "Enable debug logging"), verbose);

    Glib::OptionContext context("- zero-knowledge vault tools");
    context.set_main_group(group);

    try {
        context.parse(argc, argv);
    } catch (const Glib::OptionError& e) {
        std::cerr << std::format("zerovault: {}\n", e.what());
        return 2;
    }

    if (verbose) {
        ZeroVault::Log::set_level(ZeroVault::Log::Level::Debug);
    }

    if (score) {
        return run_score();
    }

    if (!generate) {
        std::cerr << context.get_help();
        return 2;
    }

    ZeroVault::PasswordPolicy policy;
    policy.length = length;
    policy.include_upper = !no_upper;
    policy.include_lower = !no_lower;
    policy.include_digits = !no_digits;
    policy.include_symbols = !no_symbols;
    policy.exclude_ambiguous = exclude_ambiguous;

    try {
        std::string password = ZeroVault::PasswordGenerator::generate(policy);
        std::cout << password << '\n';
        ZeroVault::secure_clear(password);
    } catch (const std::runtime_error& e) {
        ZeroVault::Log::error("Password generation failed: {}", e.what());
        return 1;
    }

    return 0;
}
