#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// Tasks and projects as far as the focus engine needs them. Fields this side does not
// model stay in `raw` so a rewrite of the shared blob does not drop them.
struct Task {
    std::string id;
    std::optional<std::string> projectId;
    std::string title;
    bool completed = false;
    nlohmann::json raw = nlohmann::json::object();
};

struct Project {
    std::string id;
    std::string name;
    std::optional<std::string> parentId;
    nlohmann::json raw = nlohmann::json::object();
};

class TaskBoard {
  public:
    TaskBoard() = default;
    TaskBoard(std::vector<Task> tasks, std::vector<Project> projects);

    const std::vector<Task> &Tasks() const {
        return m_Tasks;
    }
    const std::vector<Project> &Projects() const {
        return m_Projects;
    }

    const Task *FindTask(const std::string &id) const;
    const Project *FindProject(const std::string &id) const;
    // Project of the task, if the task exists and has one that still exists.
    const Project *ProjectOfTask(const std::string &taskId) const;

    // The project and all of its sub-projects, depth first. Empty if unknown.
    std::vector<std::string> ProjectTree(const std::string &projectId) const;
    std::vector<std::string> TaskIdsInProject(const std::string &projectId) const;

    bool SetTaskCompleted(const std::string &id, bool completed);
    bool RemoveTask(const std::string &id);

  private:
    std::vector<Task> m_Tasks;
    std::vector<Project> m_Projects;
};
