#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <core/config.hpp>
#include <history/project_registry.hpp>
#include <transfer/transfer_engine.hpp>
#include <transfer/transfer_context.hpp>
#include <transfer/job_runner.hpp>
#include "terminal_progress.hpp"

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI();

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    bool require_config();
    bool require_engine();

    // Build the engine from config; a no-op once built.
    void init_engine();
    void shutdown_engine();

    void execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    // Public state
    std::optional<Config> config;
    std::string config_error;
    std::unique_ptr<TerminalProgressSink> progress;
    std::unique_ptr<FileProjectRegistry> projects;
    std::unique_ptr<TransferEngine> engine;
    std::unique_ptr<TransferContext> context;
    std::unique_ptr<JobRunner> runner;

    // Returns the prompt string for readline
    std::string get_prompt_string() const;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};
