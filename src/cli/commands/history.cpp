#include "../base_cli.hpp"
#include "../theme.hpp"
#include <core/utils.hpp>
#include <util/string_utils.hpp>
#include <iostream>
#include <fmt/format.h>

static void print_record(const HistoryRecord& r) {
    std::string counts = fmt::format("{} copied, {} skipped", r.files_copied, r.files_skipped);
    if (r.kind == "import") {
        counts += fmt::format(" ({} photos, {} videos)", r.photos_copied, r.videos_copied);
    }
    std::cout << fmt::format("  {:<20} {:<21} {:<16} {:<36} {:>10}\n",
                             r.completed_at, theme::status_word(r.status),
                             r.project_name.empty() ? "-" : r.project_name,
                             counts, format_bytes(r.total_bytes));
    std::cout << theme::dim(fmt::format("    -> {}", r.destination_path)) << "\n";
    if (r.error_message) {
        std::cout << theme::dim("    " + *r.error_message) << "\n";
    }
}

static void do_history(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_engine()) return;

    auto words = StringUtils::split_args(arg);
    std::string which = words.empty() ? "backup" : words[0];
    HistoryLog* log = nullptr;
    if (which == "backup") {
        log = &cli.context->backup_history();
    } else if (which == "import") {
        log = &cli.context->import_history();
    } else {
        std::cout << theme::fail("Usage: history [backup|import] [project-id]");
        return;
    }

    auto records = words.size() > 1 ? log->list_for_project(words[1]) : log->list();
    if (records.empty()) {
        std::cout << theme::dim("  No " + which + " history.") << "\n";
        return;
    }

    std::cout << "\n";
    for (const auto& r : records) {
        print_record(r);
    }
    std::cout << "\n";
}

static void do_config(BaseCLI& cli, const std::string& arg) {
    if (arg == "init") {
        auto created = create_default_config();
        if (created.is_err()) {
            std::cout << theme::fail(created.error);
        } else {
            std::cout << theme::ok("Config at " + get_config_path().string());
        }
        return;
    }
    if (!cli.require_config()) return;

    const Config& c = cli.config.value();
    std::cout << theme::section("Config");
    std::cout << theme::kv("File", get_config_path().string()
                           + (config_exists() ? "" : " (not present, defaults)"));
    std::cout << theme::kv("Copies", std::to_string(c.transfer().max_concurrent_copies));
    std::cout << theme::kv("Chunk", format_bytes(c.transfer().chunk_size_bytes));
    std::cout << theme::kv("Attempts", fmt::format("{} (backoff from {}ms)",
                           c.transfer().max_attempts, c.transfer().base_delay_ms));
    std::cout << theme::kv("Workers", std::to_string(c.transfer().workers));
    std::cout << theme::kv("Queue", std::to_string(c.progress().queue_capacity));
    std::cout << theme::kv("Data dir", c.data_dir().string());
    std::cout << theme::kv("History cap", std::to_string(c.history().max_entries));
    std::cout << "\n";
}

void register_history_commands(BaseCLI& cli) {
    cli.add_command("history", do_history, "Past backups or imports, newest first");
    cli.add_command("config", do_config, "Show settings ('config init' writes defaults)");
}
