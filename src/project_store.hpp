#pragma once

#include "project.hpp"
#include <string>
#include <vector>
#include <optional>

namespace projsync {

/**
 * ProjectStore - ordered list of projects persisted as JSON
 *
 * Every mutation is written through to disk immediately. A missing or
 * unreadable store file loads as an empty list. The store also tracks
 * which project is currently selected in the UI.
 *
 * File format (projects.json):
 *   {"projects": [ {"name": ..., "local_path": ..., "remote_host": ...,
 *                   "remote_path": ..., "git_branch": ...}, ... ]}
 */
class ProjectStore {
public:
    explicit ProjectStore(std::string path);

    // Replace the in-memory list with the file contents. Returns false
    // when the file is missing or corrupt (the list is then empty).
    bool load();
    bool save() const;

    // Mutations validate the record, reject duplicate names and save.
    // A failed save undoes the change.
    bool add(const Project& project, std::string* error);
    bool update(const std::string& original_name, const Project& project, std::string* error);
    bool remove(const std::string& name);

    std::optional<Project> find(const std::string& name) const;
    std::vector<std::string> names() const;
    const std::vector<Project>& projects() const { return projects_; }
    bool empty() const { return projects_.empty(); }
    const std::string& path() const { return path_; }

    // Selection
    bool select(const std::string& name);
    void clear_selection() { selected_.clear(); }
    std::optional<Project> selected() const;
    const std::string& selected_name() const { return selected_; }

    std::string to_json() const;

private:
    int index_of(const std::string& name) const;

    std::string path_;
    std::vector<Project> projects_;
    std::string selected_;
};

} // namespace projsync
