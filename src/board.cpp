#include "board.hpp"

#include <algorithm>
#include <unordered_set>

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
TaskBoard::TaskBoard(std::vector<Task> tasks, std::vector<Project> projects)
    : m_Tasks(std::move(tasks)), m_Projects(std::move(projects)) {
}

// ─────────────────────────────────────
const Task *TaskBoard::FindTask(const std::string &id) const {
    auto it = std::find_if(m_Tasks.begin(), m_Tasks.end(),
                           [&](const Task &t) { return t.id == id; });
    return it == m_Tasks.end() ? nullptr : &*it;
}

// ─────────────────────────────────────
const Project *TaskBoard::FindProject(const std::string &id) const {
    auto it = std::find_if(m_Projects.begin(), m_Projects.end(),
                           [&](const Project &p) { return p.id == id; });
    return it == m_Projects.end() ? nullptr : &*it;
}

// ─────────────────────────────────────
const Project *TaskBoard::ProjectOfTask(const std::string &taskId) const {
    const Task *task = FindTask(taskId);
    if (!task || !task->projectId) {
        return nullptr;
    }
    return FindProject(*task->projectId);
}

// ─────────────────────────────────────
std::vector<std::string> TaskBoard::ProjectTree(const std::string &projectId) const {
    std::vector<std::string> out;
    if (!FindProject(projectId)) {
        return out;
    }

    // parentId links come from user data; guard against cycles.
    std::unordered_set<std::string> seen;
    std::vector<std::string> stack{projectId};
    while (!stack.empty()) {
        std::string id = stack.back();
        stack.pop_back();
        if (!seen.insert(id).second) {
            continue;
        }
        out.push_back(id);
        for (auto it = m_Projects.rbegin(); it != m_Projects.rend(); ++it) {
            if (it->parentId && *it->parentId == id) {
                stack.push_back(it->id);
            }
        }
    }
    return out;
}

// ─────────────────────────────────────
std::vector<std::string> TaskBoard::TaskIdsInProject(const std::string &projectId) const {
    const auto tree = ProjectTree(projectId);
    const std::unordered_set<std::string> projects(tree.begin(), tree.end());

    std::vector<std::string> out;
    for (const auto &t : m_Tasks) {
        if (t.projectId && projects.count(*t.projectId)) {
            out.push_back(t.id);
        }
    }
    return out;
}

// ─────────────────────────────────────
bool TaskBoard::SetTaskCompleted(const std::string &id, bool completed) {
    for (auto &t : m_Tasks) {
        if (t.id == id) {
            t.completed = completed;
            spdlog::debug("TaskBoard: task '{}' completed={}", id, completed);
            return true;
        }
    }
    return false;
}

// ─────────────────────────────────────
bool TaskBoard::RemoveTask(const std::string &id) {
    const auto before = m_Tasks.size();
    m_Tasks.erase(std::remove_if(m_Tasks.begin(), m_Tasks.end(),
                                 [&](const Task &t) { return t.id == id; }),
                  m_Tasks.end());
    return m_Tasks.size() != before;
}
