/**
 * @file checkpoint_manager.cpp
 * @brief CheckpointManager implementation (toml++ serialization).
 * @author Dimitris Kafetzis
 */

#include "state/checkpoint_manager.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace parallel_orchestrator {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kExtension = ".toml";

int64_t to_epoch_ms(Timestamp tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

Timestamp from_epoch_ms(int64_t ms) {
    return Timestamp{std::chrono::milliseconds{ms}};
}

toml::array to_array(const std::vector<std::string>& values) {
    toml::array arr;
    for (const auto& v : values) arr.push_back(v);
    return arr;
}

std::vector<std::string> from_array(const toml::table& tbl, std::string_view key) {
    std::vector<std::string> out;
    if (auto* arr = tbl[key].as_array()) {
        for (const auto& elem : *arr) {
            if (auto s = elem.value<std::string>()) out.push_back(*s);
        }
    }
    return out;
}

// ── Encoding ─────────────────────────────────

toml::table encode_footprint(const TaskFootprint& fp) {
    return toml::table{
        {"target_files", to_array(fp.target_files)},
        {"target_dirs", to_array(fp.target_dirs)},
        {"imports", to_array(fp.imports)},
        {"components", to_array(fp.components)},
        {"interfaces", to_array(fp.interfaces)},
        {"data_models", to_array(fp.data_models)},
        {"test_fixtures", to_array(fp.test_fixtures)},
        {"exclusive_resources", to_array(fp.exclusive_resources)},
        {"cpu_intensive", fp.cpu_intensive},
        {"memory_intensive", fp.memory_intensive},
    };
}

toml::table encode_result(const ExecutionResult& r) {
    toml::table tbl{
        {"attempt", static_cast<int64_t>(r.attempt)},
        {"status", std::string{to_string(r.status)}},
        {"start_ms", to_epoch_ms(r.start_time)},
        {"end_ms", to_epoch_ms(r.end_time)},
        {"exit_code", static_cast<int64_t>(r.exit_code)},
        {"stdout_ref", r.stdout_ref},
        {"stderr_ref", r.stderr_ref},
    };
    if (r.error_message) tbl.insert_or_assign("error_message", *r.error_message);
    return tbl;
}

toml::table encode_task(const TaskModel& t) {
    toml::table tbl{
        {"id", t.id},
        {"name", t.name},
        {"description", t.description},
        {"dependencies", to_array(t.dependencies)},
        {"complexity", std::string{to_string(t.complexity)}},
        {"complexity_score", t.complexity_score},
        {"estimated_duration_ms", static_cast<int64_t>(t.estimated_duration.count())},
        {"status", std::string{to_string(t.status)}},
        {"attempts", static_cast<int64_t>(t.attempts)},
        {"footprint", encode_footprint(t.footprint)},
    };
    if (t.parent) tbl.insert_or_assign("parent", *t.parent);
    if (t.workspace_ref) tbl.insert_or_assign("workspace_ref", *t.workspace_ref);
    if (t.status_reason) tbl.insert_or_assign("status_reason", *t.status_reason);
    if (t.result) tbl.insert_or_assign("result", encode_result(*t.result));
    return tbl;
}

// ── Decoding ─────────────────────────────────

TaskFootprint decode_footprint(const toml::table& tbl) {
    TaskFootprint fp;
    fp.target_files = from_array(tbl, "target_files");
    fp.target_dirs = from_array(tbl, "target_dirs");
    fp.imports = from_array(tbl, "imports");
    fp.components = from_array(tbl, "components");
    fp.interfaces = from_array(tbl, "interfaces");
    fp.data_models = from_array(tbl, "data_models");
    fp.test_fixtures = from_array(tbl, "test_fixtures");
    fp.exclusive_resources = from_array(tbl, "exclusive_resources");
    fp.cpu_intensive = tbl["cpu_intensive"].value_or(false);
    fp.memory_intensive = tbl["memory_intensive"].value_or(false);
    return fp;
}

Result<ExecutionResult> decode_result(const toml::table& tbl, const TaskId& id, const std::string& source) {
    ExecutionResult r;
    r.task_id = id;
    r.attempt = static_cast<uint32_t>(tbl["attempt"].value_or(int64_t{0}));
    auto status = parse_task_status(tbl["status"].value_or(std::string{}));
    if (!status) {
        return Error{ErrorKind::CheckpointIO, source + ": task '" + id + "' has an invalid result status"};
    }
    r.status = *status;
    r.start_time = from_epoch_ms(tbl["start_ms"].value_or(int64_t{0}));
    r.end_time = from_epoch_ms(tbl["end_ms"].value_or(int64_t{0}));
    r.exit_code = static_cast<int>(tbl["exit_code"].value_or(int64_t{-1}));
    r.stdout_ref = tbl["stdout_ref"].value_or(std::string{});
    r.stderr_ref = tbl["stderr_ref"].value_or(std::string{});
    if (auto msg = tbl["error_message"].value<std::string>()) r.error_message = *msg;
    return r;
}

Result<TaskModel> decode_task(const toml::table& tbl, const std::string& source) {
    TaskModel t;
    t.id = tbl["id"].value_or(std::string{});
    if (t.id.empty()) {
        return Error{ErrorKind::CheckpointIO, source + ": task record without id"};
    }
    t.name = tbl["name"].value_or(std::string{});
    t.description = tbl["description"].value_or(std::string{});
    t.dependencies = from_array(tbl, "dependencies");

    auto complexity = parse_complexity(tbl["complexity"].value_or(std::string{"low"}));
    auto status = parse_task_status(tbl["status"].value_or(std::string{}));
    if (!complexity || !status) {
        return Error{ErrorKind::CheckpointIO, source + ": task '" + t.id + "' has an invalid status or complexity"};
    }
    t.complexity = *complexity;
    t.status = *status;
    t.complexity_score = tbl["complexity_score"].value_or(0.0);
    t.estimated_duration = Duration{tbl["estimated_duration_ms"].value_or(int64_t{0})};
    t.attempts = static_cast<uint32_t>(tbl["attempts"].value_or(int64_t{0}));

    if (auto v = tbl["parent"].value<std::string>()) t.parent = *v;
    if (auto v = tbl["workspace_ref"].value<std::string>()) t.workspace_ref = *v;
    if (auto v = tbl["status_reason"].value<std::string>()) t.status_reason = *v;
    if (auto* fp = tbl["footprint"].as_table()) t.footprint = decode_footprint(*fp);
    if (auto* res = tbl["result"].as_table()) {
        auto decoded = decode_result(*res, t.id, source);
        if (!decoded) return decoded.error();
        t.result = std::move(*decoded);
    }
    return t;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// WorkflowState
// ─────────────────────────────────────────────

const TaskModel* WorkflowState::find(const TaskId& id) const {
    auto it = std::find_if(tasks.begin(), tasks.end(), [&](const TaskModel& t) { return t.id == id; });
    return it == tasks.end() ? nullptr : &*it;
}

TaskModel* WorkflowState::find(const TaskId& id) {
    auto it = std::find_if(tasks.begin(), tasks.end(), [&](const TaskModel& t) { return t.id == id; });
    return it == tasks.end() ? nullptr : &*it;
}

// ─────────────────────────────────────────────
// CheckpointManager
// ─────────────────────────────────────────────

CheckpointManager::CheckpointManager(fs::path directory, uint32_t max_attempts, Logger* logger)
    : directory_(std::move(directory))
    , max_attempts_(max_attempts)
    , logger_(logger) {}

fs::path CheckpointManager::path_for(const RunId& run_id) const {
    return directory_ / (run_id + std::string{kExtension});
}

std::string CheckpointManager::serialize(const WorkflowState& state) {
    toml::table root{
        {"schema_version", WorkflowState::kSchemaVersion},
        {"run_id", state.run_id},
        {"sequence", static_cast<int64_t>(state.sequence)},
        {"phase", std::string{to_string(state.phase)}},
        {"current_group", static_cast<int64_t>(state.current_group)},
        {"created_at", to_epoch_ms(state.created_at)},
        {"updated_at", to_epoch_ms(state.updated_at)},
        {"inputs", to_array(state.inputs)},
    };

    toml::array groups;
    for (const auto& group : state.groups) groups.push_back(to_array(group));
    root.insert_or_assign("groups", std::move(groups));

    toml::array tasks;
    for (const auto& task : state.tasks) tasks.push_back(encode_task(task));
    root.insert_or_assign("task", std::move(tasks));

    toml::array conflicts;
    for (const auto& [pair, descriptor] : state.conflicts.entries()) {
        std::vector<std::string> dims;
        for (auto dim : descriptor.list()) dims.emplace_back(to_string(dim));
        conflicts.push_back(toml::table{
            {"a", pair.first},
            {"b", pair.second},
            {"dimensions", to_array(dims)},
        });
    }
    root.insert_or_assign("conflict", std::move(conflicts));

    std::ostringstream out;
    out << root << '\n';
    return out.str();
}

Result<WorkflowState> CheckpointManager::parse(std::string_view text, const std::string& source) {
    toml::table root;
    try {
        root = toml::parse(text, source);
    } catch (const toml::parse_error& e) {
        return Error{ErrorKind::CheckpointIO,
                     source + ": malformed checkpoint: " + std::string{e.description()}};
    }

    const auto version = root["schema_version"].value_or(int64_t{0});
    if (version != WorkflowState::kSchemaVersion) {
        return Error{ErrorKind::CheckpointIO,
                     source + ": unsupported schema_version " + std::to_string(version)};
    }

    WorkflowState state;
    state.run_id = root["run_id"].value_or(std::string{});
    if (state.run_id.empty()) {
        return Error{ErrorKind::CheckpointIO, source + ": missing run_id"};
    }
    auto phase = parse_run_phase(root["phase"].value_or(std::string{}));
    if (!phase) {
        return Error{ErrorKind::CheckpointIO, source + ": invalid phase"};
    }
    state.phase = *phase;
    state.sequence = static_cast<uint64_t>(root["sequence"].value_or(int64_t{0}));
    state.current_group = static_cast<uint32_t>(root["current_group"].value_or(int64_t{0}));
    state.created_at = from_epoch_ms(root["created_at"].value_or(int64_t{0}));
    state.updated_at = from_epoch_ms(root["updated_at"].value_or(int64_t{0}));
    state.inputs = from_array(root, "inputs");

    if (auto* groups = root["groups"].as_array()) {
        for (const auto& node : *groups) {
            std::vector<TaskId> group;
            if (auto* members = node.as_array()) {
                for (const auto& m : *members) {
                    if (auto s = m.value<std::string>()) group.push_back(*s);
                }
            }
            state.groups.push_back(std::move(group));
        }
    }

    if (auto* tasks = root["task"].as_array()) {
        for (const auto& node : *tasks) {
            auto* tbl = node.as_table();
            if (!tbl) {
                return Error{ErrorKind::CheckpointIO, source + ": task entry is not a table"};
            }
            auto task = decode_task(*tbl, source);
            if (!task) return task.error();
            state.tasks.push_back(std::move(*task));
        }
    }

    if (auto* conflicts = root["conflict"].as_array()) {
        for (const auto& node : *conflicts) {
            auto* tbl = node.as_table();
            if (!tbl) continue;
            ConflictDescriptor descriptor;
            for (const auto& name : from_array(*tbl, "dimensions")) {
                if (auto dim = parse_conflict_dimension(name)) descriptor.set(*dim);
            }
            if (descriptor.has_conflict()) {
                state.conflicts.add((*tbl)["a"].value_or(std::string{}),
                                    (*tbl)["b"].value_or(std::string{}), descriptor);
            }
        }
    }
    return state;
}

Result<void> CheckpointManager::save(WorkflowState& state) {
    std::lock_guard lock(write_mutex_);

    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        return Error{ErrorKind::CheckpointIO,
                     "cannot create checkpoint directory " + directory_.string() + ": " + ec.message()};
    }

    ++state.sequence;
    state.updated_at = std::chrono::system_clock::now();
    if (state.created_at == Timestamp{}) state.created_at = state.updated_at;

    const auto target = path_for(state.run_id);
    auto temp = target;
    temp += ".tmp." + std::to_string(::getpid());

    {
        std::ofstream out(temp, std::ios::trunc | std::ios::binary);
        out << serialize(state);
        out.flush();
        if (!out) {
            fs::remove(temp, ec);
            return Error{ErrorKind::CheckpointIO, "failed writing " + temp.string()};
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        return Error{ErrorKind::CheckpointIO,
                     "cannot replace " + target.string() + ": " + ec.message()};
    }
    return {};
}

Result<WorkflowState> CheckpointManager::load(const RunId& run_id) const {
    const auto path = path_for(run_id);
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorKind::CheckpointIO, "no checkpoint for run '" + run_id + "' at " + path.string()};
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    auto state = parse(buffer.str(), path.string());
    if (!state) return state.error();

    const size_t recovered = recover_interrupted(*state, max_attempts_);
    if (recovered > 0 && logger_) {
        logger_->log(LogLevel::Warn, "checkpoint",
                     "run " + run_id + ": " + std::to_string(recovered)
                     + " task(s) were running at shutdown and count as failed attempts");
    }
    return state;
}

Result<std::vector<RunId>> CheckpointManager::detect_resumable_runs() const {
    std::vector<RunId> runs;
    std::error_code ec;
    if (!fs::exists(directory_, ec)) return runs;

    fs::directory_iterator it(directory_, ec);
    if (ec) {
        return Error{ErrorKind::CheckpointIO,
                     "cannot list " + directory_.string() + ": " + ec.message()};
    }
    for (const auto& entry : it) {
        if (!entry.is_regular_file() || entry.path().extension() != kExtension) continue;

        std::ifstream in(entry.path(), std::ios::binary);
        std::stringstream buffer;
        buffer << in.rdbuf();
        auto state = parse(buffer.str(), entry.path().string());
        if (!state) {
            if (logger_) logger_->log(LogLevel::Warn, "checkpoint", "skipping " + state.error().describe());
            continue;
        }
        if (state->phase != RunPhase::Completed) runs.push_back(state->run_id);
    }
    std::sort(runs.begin(), runs.end());
    return runs;
}

Result<bool> CheckpointManager::remove(const RunId& run_id) {
    std::lock_guard lock(write_mutex_);
    std::error_code ec;
    const bool removed = fs::remove(path_for(run_id), ec);
    if (ec) {
        return Error{ErrorKind::CheckpointIO,
                     "cannot remove checkpoint of run '" + run_id + "': " + ec.message()};
    }
    return removed;
}

size_t CheckpointManager::recover_interrupted(WorkflowState& state, uint32_t max_attempts) {
    size_t recovered = 0;
    for (auto& task : state.tasks) {
        if (task.status != TaskStatus::Running && task.status != TaskStatus::TimedOut) continue;

        if (task.attempts == 0) task.attempts = 1;

        ExecutionResult result;
        result.task_id = task.id;
        result.attempt = task.attempts;
        result.status = TaskStatus::Failed;
        result.start_time = task.result ? task.result->start_time : state.updated_at;
        result.end_time = state.updated_at;
        result.error_message = std::string{kInterruptedReason};

        task.result = std::move(result);
        task.status = task.attempts < max_attempts ? TaskStatus::Queued : TaskStatus::Failed;
        task.status_reason = std::string{kInterruptedReason};
        ++recovered;
    }
    return recovered;
}

}  // namespace parallel_orchestrator
