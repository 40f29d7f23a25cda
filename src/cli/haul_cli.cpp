#include "haul_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <sstream>
#include <cstdlib>
#include <core/log.hpp>
#include <readline/readline.h>
#include <readline/history.h>

HaulCLI::HaulCLI() : BaseCLI() {
    register_all_commands();
}

void HaulCLI::register_all_commands() {
    add_command("help", [this](BaseCLI&, const std::string&) {
        this->print_help();
    }, "Show this help message");

    add_command("quit", [this](BaseCLI&, const std::string&) {
        quit_requested_ = true;
    }, "Exit haul (running jobs are interrupted)");

    add_command("exit", [this](BaseCLI&, const std::string&) {
        quit_requested_ = true;
    }, "Exit haul (running jobs are interrupted)");

    register_jobs_commands(*this);
    register_history_commands(*this);
}

void HaulCLI::run_repl() {
    std::cout << theme::banner();

    if (!require_config()) {
        return;
    }
    init_engine();

    std::cout << theme::section("Ready");
    std::cout << theme::kv("Data dir", config->data_dir().string());
    std::cout << theme::kv("Debug log", haul_log_path());
    std::cout << theme::divider();
    std::cout << theme::dim("    Type 'help' for commands, 'quit' to exit.") << "\n\n";

    std::string line;
    while (!quit_requested_) {
        std::string prompt = get_prompt_string();
        char* raw = readline(prompt.c_str());
        if (!raw) {
            break;  // EOF / Ctrl-D
        }

        line = raw;
        free(raw);

        if (line.empty()) {
            continue;
        }

        add_history(line.c_str());

        std::istringstream iss(line);
        std::string command;
        iss >> command;

        std::string args;
        std::getline(iss, args);
        if (!args.empty() && args[0] == ' ') {
            args = args.substr(1);
        }

        execute_command(command, args);
    }

    if (runner) {
        std::cout << theme::dim("Stopping jobs...") << "\n";
    }
    shutdown_engine();
}

int HaulCLI::run_command(const std::string& command, const std::vector<std::string>& args) {
    if (!commands_.count(command)) {
        std::cout << theme::fail("Unknown command: " + command);
        return 1;
    }

    // Re-quote so split_args sees the same words the shell gave us
    std::string joined;
    for (const auto& a : args) {
        if (!joined.empty()) joined += " ";
        joined += a.find(' ') != std::string::npos ? "\"" + a + "\"" : a;
    }

    execute_command(command, joined);

    if (runner) {
        runner->wait_idle();
    }
    shutdown_engine();
    return 0;
}
