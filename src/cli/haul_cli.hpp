#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>

// Forward declarations for command registration
void register_jobs_commands(BaseCLI& cli);
void register_history_commands(BaseCLI& cli);

class HaulCLI : public BaseCLI {
public:
    HaulCLI();

    void run_repl();

    // One-shot: run a single command, then wait for any job it started.
    // Returns the process exit code.
    int run_command(const std::string& command, const std::vector<std::string>& args);

private:
    void register_all_commands();

    bool quit_requested_ = false;
};
