#include "project_registry.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>

namespace {

YAML::Node load_projects(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return YAML::Node(YAML::NodeType::Map);
    }
    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (root["projects"] && root["projects"].IsMap()) {
            return root["projects"];
        }
    } catch (const std::exception& e) {
        haul_log(fmt::format("projects: ignoring unreadable {}: {}", path.string(), e.what()));
    }
    return YAML::Node(YAML::NodeType::Map);
}

} // namespace

FileProjectRegistry::FileProjectRegistry(const fs::path& path) : path_(path) {}

Result<void> FileProjectRegistry::set_status(const std::string& project_id,
                                             const std::string& status) {
    if (project_id.empty()) {
        return Result<void>::Err(ErrorKind::InvalidInput, "Project id is empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    YAML::Node projects = load_projects(path_);

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "projects" << YAML::Value << YAML::BeginMap;
    for (const auto& kv : projects) {
        std::string id = kv.first.as<std::string>("");
        if (id.empty() || id == project_id) continue;
        out << YAML::Key << id << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "status" << YAML::Value << kv.second["status"].as<std::string>("");
        out << YAML::Key << "updated_at" << YAML::Value << kv.second["updated_at"].as<std::string>("");
        out << YAML::EndMap;
    }
    out << YAML::Key << project_id << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "status" << YAML::Value << status;
    out << YAML::Key << "updated_at" << YAML::Value << now_iso();
    out << YAML::EndMap;
    out << YAML::EndMap;
    out << YAML::EndMap;

    std::error_code ec;
    fs::create_directories(path_.parent_path(), ec);
    std::ofstream fout(path_.string(), std::ios::trunc);
    if (!fout) {
        return Result<void>::Err(ErrorKind::IoFailure, "Cannot write " + path_.string());
    }
    fout << out.c_str() << "\n";
    if (!fout.flush()) {
        return Result<void>::Err(ErrorKind::IoFailure, "Cannot write " + path_.string());
    }

    haul_log(fmt::format("projects: {} -> {}", project_id, status));
    return Result<void>::Ok();
}

std::optional<std::string> FileProjectRegistry::status(const std::string& project_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const YAML::Node projects = load_projects(path_);
    const YAML::Node entry = projects[project_id];
    if (!entry || !entry["status"]) {
        return std::nullopt;
    }
    return entry["status"].as<std::string>("");
}
