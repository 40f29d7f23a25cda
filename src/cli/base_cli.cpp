#include "base_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <iostream>
#include <fmt/format.h>

BaseCLI::BaseCLI() {
    auto config_result = Config::load();
    if (config_result.is_ok()) {
        config = config_result.value;
        config->apply_logging();
    } else {
        config_error = config_result.error;
    }
}

BaseCLI::~BaseCLI() {
    shutdown_engine();
}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::require_config() {
    if (!config.has_value()) {
        std::cout << theme::fail("Config could not be loaded: " + config_error);
        std::cout << theme::step("Fix " + get_config_path().string() + " and try again.");
        return false;
    }
    return true;
}

bool BaseCLI::require_engine() {
    if (!require_config()) {
        return false;
    }
    init_engine();
    return runner != nullptr;
}

void BaseCLI::init_engine() {
    if (runner || !config) {
        return;
    }
    const Config& cfg = config.value();

    progress = std::make_unique<TerminalProgressSink>();
    projects = std::make_unique<FileProjectRegistry>(cfg.data_dir() / PROJECT_STATUS_FILE);
    engine = std::make_unique<TransferEngine>(cfg.transfer().chunk_size_bytes);
    context = std::make_unique<TransferContext>(cfg, *projects, *engine, progress.get());
    runner = std::make_unique<JobRunner>(*context);

    haul_log(fmt::format("cli: engine ready (data dir {})", cfg.data_dir().string()));
}

void BaseCLI::shutdown_engine() {
    // Reverse of construction: the runner borrows the context, which
    // borrows the rest.
    if (runner) {
        runner->shutdown();
    }
    runner.reset();
    context.reset();
    engine.reset();
    projects.reset();
    progress.reset();
}

void BaseCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'help' for available commands.");
        return;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        haul_log(fmt::format("cli: {} threw: {}", command, e.what()));
        std::cout << theme::fail(std::string(e.what()));
    }
}

void BaseCLI::print_help() const {
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Jobs",     {"submit", "start", "cancel", "remove", "jobs", "show"}},
        {"History",  {"history"}},
        {"General",  {"config", "help", "quit", "exit"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        bool has_any = false;
        for (const auto& name : cmd_names) {
            if (commands_.count(name)) {
                has_any = true;
                break;
            }
        }
        if (!has_any) continue;

        std::cout << "\n" << theme::color::BROWN << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::BLUE
                          << fmt::format("    {:<14}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n";
}

std::string BaseCLI::get_prompt_string() const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    std::string prompt = rl_esc(theme::color::BROWN) + "haul" + rl_esc(theme::color::RESET);
    if (runner) {
        int busy = context->limiter().in_use();
        if (busy > 0) {
            prompt += ":" + rl_esc(theme::color::GREEN) + fmt::format("{} copying", busy)
                    + rl_esc(theme::color::RESET);
        }
    }
    return prompt + "> ";
}
