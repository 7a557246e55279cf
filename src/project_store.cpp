#include "project_store.hpp"
#include "fs_utils.hpp"
#include "json_util.hpp"
#include "logger.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace projsync {

namespace {

const char* kProjectsKey = "projects";

bool project_from_record(const json::FlatObject& record, Project& project) {
    static const char* required[] = {"name", "local_path", "remote_host", "remote_path"};
    for (const char* key : required) {
        auto it = record.find(key);
        if (it == record.end() || it->second.empty()) {
            return false;
        }
    }

    project.name = record.at("name");
    project.local_path = record.at("local_path");
    project.remote_host = record.at("remote_host");
    project.remote_path = record.at("remote_path");

    auto branch = record.find("git_branch");
    project.git_branch = (branch != record.end() && !branch->second.empty())
                             ? branch->second
                             : kDefaultBranch;
    return true;
}

} // namespace

ProjectStore::ProjectStore(std::string path) : path_(std::move(path)) {}

bool ProjectStore::load() {
    projects_.clear();
    selected_.clear();

    if (!safe_exists(path_)) {
        Logger::info("[Store] No project store at " + path_ + ", starting with an empty list");
        return false;
    }

    std::ifstream file(path_);
    if (!file.is_open()) {
        Logger::error("[Store] Cannot open project store " + path_);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    file.close();

    std::vector<json::FlatObject> records;
    if (!json::parse_object_array(buffer.str(), kProjectsKey, records)) {
        Logger::warn("[Store] Project store is corrupt, starting with an empty list: " + path_);
        return false;
    }

    std::vector<Project> loaded;
    for (const auto& record : records) {
        Project project;
        if (!project_from_record(record, project)) {
            Logger::warn("[Store] Project record with missing fields, starting with an empty list: " + path_);
            return false;
        }
        bool duplicate = false;
        for (const auto& existing : loaded) {
            if (existing.name == project.name) {
                duplicate = true;
                break;
            }
        }
        if (duplicate) {
            Logger::warn("[Store] Ignoring duplicate project name: " + project.name);
            continue;
        }
        loaded.push_back(project);
    }

    projects_ = std::move(loaded);
    Logger::info("[Store] Loaded " + std::to_string(projects_.size()) + " projects");
    return true;
}

std::string ProjectStore::to_json() const {
    std::stringstream ss;
    ss << "{\n";
    ss << "  \"" << kProjectsKey << "\": [";
    for (size_t i = 0; i < projects_.size(); i++) {
        const Project& p = projects_[i];
        ss << (i == 0 ? "\n" : ",\n");
        ss << "    {\n";
        ss << "      \"name\": \"" << json::escape(p.name) << "\",\n";
        ss << "      \"local_path\": \"" << json::escape(p.local_path) << "\",\n";
        ss << "      \"remote_host\": \"" << json::escape(p.remote_host) << "\",\n";
        ss << "      \"remote_path\": \"" << json::escape(p.remote_path) << "\",\n";
        ss << "      \"git_branch\": \"" << json::escape(p.git_branch) << "\"\n";
        ss << "    }";
    }
    if (!projects_.empty()) ss << "\n  ";
    ss << "]\n";
    ss << "}\n";
    return ss.str();
}

bool ProjectStore::save() const {
    std::string dir = fs::path(path_).parent_path().string();
    if (!dir.empty() && !safe_create_directories(dir)) {
        return false;
    }

    // Write to a sibling file and rename so a crash never leaves a half-written store
    std::string tmp_path = path_ + ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::trunc);
        if (!file.is_open()) {
            Logger::error("[Store] Failed to open project store for writing: " + tmp_path);
            return false;
        }
        file << to_json();
        file.close();
        if (!file) {
            Logger::error("[Store] Failed to write project store: " + tmp_path);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, path_, ec);
    if (ec) {
        Logger::error("[Store] Failed to replace project store " + path_ + ": " + ec.message());
        fs::remove(tmp_path, ec);
        return false;
    }

    Logger::debug("[Store] Saved " + std::to_string(projects_.size()) + " projects");
    return true;
}

int ProjectStore::index_of(const std::string& name) const {
    for (size_t i = 0; i < projects_.size(); i++) {
        if (projects_[i].name == name) return static_cast<int>(i);
    }
    return -1;
}

bool ProjectStore::add(const Project& project, std::string* error) {
    if (!Project::validate(project, error)) {
        Logger::warn("[Store] Rejected project '" + project.name + "'");
        return false;
    }
    if (index_of(project.name) >= 0) {
        if (error) *error = "A project named '" + project.name + "' already exists";
        return false;
    }

    projects_.push_back(project);
    if (!save()) {
        projects_.pop_back();
        if (error) *error = "Could not save project to " + path_;
        return false;
    }
    Logger::info("[Store] Added project '" + project.name + "'");
    return true;
}

bool ProjectStore::update(const std::string& original_name, const Project& project, std::string* error) {
    int index = index_of(original_name);
    if (index < 0) {
        if (error) *error = "No project named '" + original_name + "'";
        return false;
    }
    if (!Project::validate(project, error)) {
        Logger::warn("[Store] Rejected update of '" + original_name + "'");
        return false;
    }
    if (project.name != original_name && index_of(project.name) >= 0) {
        if (error) *error = "A project named '" + project.name + "' already exists";
        return false;
    }

    Project previous = projects_[static_cast<size_t>(index)];
    std::string previous_selected = selected_;
    projects_[static_cast<size_t>(index)] = project;
    if (selected_ == original_name) {
        selected_ = project.name;
    }
    if (!save()) {
        projects_[static_cast<size_t>(index)] = previous;
        selected_ = previous_selected;
        if (error) *error = "Could not save project to " + path_;
        return false;
    }
    Logger::info("[Store] Updated project '" + original_name + "'");
    return true;
}

bool ProjectStore::remove(const std::string& name) {
    int index = index_of(name);
    if (index < 0) return false;

    Project removed = projects_[static_cast<size_t>(index)];
    std::string previous_selected = selected_;
    projects_.erase(projects_.begin() + index);
    if (selected_ == name) {
        selected_.clear();
    }
    if (!save()) {
        projects_.insert(projects_.begin() + index, removed);
        selected_ = previous_selected;
        return false;
    }
    Logger::info("[Store] Removed project '" + name + "'");
    return true;
}

std::optional<Project> ProjectStore::find(const std::string& name) const {
    int index = index_of(name);
    if (index < 0) return std::nullopt;
    return projects_[static_cast<size_t>(index)];
}

std::vector<std::string> ProjectStore::names() const {
    std::vector<std::string> result;
    result.reserve(projects_.size());
    for (const auto& p : projects_) {
        result.push_back(p.name);
    }
    return result;
}

bool ProjectStore::select(const std::string& name) {
    if (index_of(name) < 0) {
        selected_.clear();
        return false;
    }
    selected_ = name;
    return true;
}

std::optional<Project> ProjectStore::selected() const {
    if (selected_.empty()) return std::nullopt;
    return find(selected_);
}

} // namespace projsync
