/**
 * @file workspace_manager.cpp
 * @brief WorkspaceManager implementation.
 * @author Dimitris Kafetzis
 */

#include "workspace/workspace_manager.hpp"

#include <cctype>
#include <system_error>

namespace parallel_orchestrator {

namespace fs = std::filesystem;

namespace {

std::string sanitize_ref(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        bool ok = std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '/';
        out += ok ? static_cast<char>(c) : '-';
    }
    // git refuses ".." anywhere and a trailing '.'
    for (auto pos = out.find(".."); pos != std::string::npos; pos = out.find("..")) {
        out.replace(pos, 2, "-");
    }
    while (!out.empty() && (out.back() == '.' || out.back() == '/')) out.pop_back();
    return out;
}

}  // anonymous namespace

WorkspaceManager::WorkspaceManager(WorkspaceConfig config, std::unique_ptr<IWorkspaceBackend> backend)
    : config_(std::move(config))
    , backend_(std::move(backend)) {}

std::shared_ptr<std::mutex> WorkspaceManager::lock_for(const TaskId& task_id) {
    std::lock_guard lock(table_mutex_);
    auto& slot = task_locks_[task_id];
    if (!slot) slot = std::make_shared<std::mutex>();
    return slot;
}

fs::path WorkspaceManager::path_for(const TaskId& task_id) const {
    return config_.root / sanitize_ref(task_id);
}

std::string WorkspaceManager::branch_for(const TaskId& task_id) const {
    return config_.branch_prefix + sanitize_ref(task_id);
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<Workspace> WorkspaceManager::create(const TaskId& task_id, const std::string& base_ref) {
    if (task_id.empty()) {
        return Error{ErrorKind::InvalidArgument, "task id must not be empty"};
    }

    auto task_lock = lock_for(task_id);
    std::lock_guard guard(*task_lock);

    {
        std::lock_guard lock(table_mutex_);
        if (live_.contains(task_id)) {
            return Error{ErrorKind::WorkspaceExists,
                         "workspace for '" + task_id + "' already exists"};
        }
    }

    Workspace ws{task_id, path_for(task_id), branch_for(task_id), WorkspaceStatus::Created};

    std::error_code ec;
    if (fs::exists(ws.path, ec)) {
        return Error{ErrorKind::WorkspaceExists,
                     "stale workspace directory " + ws.path.string() + " for '" + task_id + "'"};
    }

    const auto& ref = base_ref.empty() ? config_.base_ref : base_ref;
    if (auto created = backend_->create(ws.path, ws.branch_name, ref); !created) {
        return created.error();
    }

    std::lock_guard lock(table_mutex_);
    live_.emplace(task_id, ws);
    return ws;
}

Result<bool> WorkspaceManager::remove(const TaskId& task_id) {
    auto task_lock = lock_for(task_id);
    std::lock_guard guard(*task_lock);

    std::optional<Workspace> ws;
    {
        std::lock_guard lock(table_mutex_);
        if (auto it = live_.find(task_id); it != live_.end()) ws = it->second;
    }

    if (!ws) {
        auto path = path_for(task_id);
        auto branch = branch_for(task_id);
        std::error_code ec;
        if (!fs::exists(path, ec) && !backend_->branch_exists(branch)) {
            return false;
        }
        ws = Workspace{task_id, path, branch, WorkspaceStatus::Active};
    }

    if (auto removed = backend_->remove(ws->path, ws->branch_name); !removed) {
        return removed.error();
    }

    std::lock_guard lock(table_mutex_);
    live_.erase(task_id);
    return true;
}

void WorkspaceManager::mark_active(const TaskId& task_id) {
    std::lock_guard lock(table_mutex_);
    if (auto it = live_.find(task_id); it != live_.end()) {
        it->second.status = WorkspaceStatus::Active;
    }
}

std::optional<Workspace> WorkspaceManager::get(const TaskId& task_id) const {
    std::lock_guard lock(table_mutex_);
    auto it = live_.find(task_id);
    if (it == live_.end()) return std::nullopt;
    return it->second;
}

std::vector<Workspace> WorkspaceManager::list() const {
    std::lock_guard lock(table_mutex_);
    std::vector<Workspace> out;
    out.reserve(live_.size());
    for (const auto& [_, ws] : live_) out.push_back(ws);
    return out;
}

Result<size_t> WorkspaceManager::cleanup_all() {
    size_t removed = 0;
    std::optional<Error> first_error;
    for (const auto& ws : list()) {
        auto r = remove(ws.task_id);
        if (!r) {
            if (!first_error) first_error = r.error();
            continue;
        }
        if (*r) ++removed;
    }
    if (first_error) return *first_error;
    return removed;
}

}  // namespace parallel_orchestrator
