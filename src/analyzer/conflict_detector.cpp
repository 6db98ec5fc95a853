/**
 * @file conflict_detector.cpp
 * @brief ConflictDetector and ConflictMatrix implementation.
 * @author Dimitris Kafetzis
 */

#include "analyzer/conflict_detector.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <unordered_set>

namespace parallel_orchestrator {

namespace {

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

/// Strip "./" prefixes and trailing separators so "src/" and "./src" compare equal.
std::string normalize_path(std::string_view p) {
    std::string out(p);
    while (out.starts_with("./")) out.erase(0, 2);
    while (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

/// True when `child` equals `dir` or lies underneath it.
bool is_under(const std::string& child, const std::string& dir) {
    if (dir.empty() || dir == ".") return true;
    if (child == dir) return true;
    return child.size() > dir.size()
        && child.compare(0, dir.size(), dir) == 0
        && child[dir.size()] == '/';
}

bool intersects(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    if (a.empty() || b.empty()) return false;
    std::unordered_set<std::string> seen;
    for (const auto& s : a) seen.insert(lower(s));
    return std::any_of(b.begin(), b.end(),
                       [&](const std::string& s) { return seen.contains(lower(s)); });
}

std::string strip_extension(const std::string& path) {
    auto slash = path.find_last_of('/');
    auto dot = path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) return path;
    return path.substr(0, dot);
}

/// Does an import declaration refer to the given target file?
bool import_refers_to(const std::string& import_decl, const std::string& file) {
    auto imp = normalize_path(import_decl);
    auto target = normalize_path(file);
    if (imp == target) return true;

    auto no_ext = strip_extension(target);
    if (imp == no_ext) return true;

    std::string dotted = no_ext;
    std::replace(dotted.begin(), dotted.end(), '/', '.');
    if (imp == dotted) return true;
    // "from pkg.module import x" style references ending in the module path
    if (dotted.size() > imp.size() && dotted.ends_with("." + imp)) return true;

    bool bare = imp.find_first_of("/.") == std::string::npos;
    if (bare) {
        auto slash = no_ext.find_last_of('/');
        auto stem = slash == std::string::npos ? no_ext : no_ext.substr(slash + 1);
        return imp == stem;
    }
    return false;
}

bool imports_other(const TaskFootprint& importer, const TaskFootprint& other) {
    for (const auto& imp : importer.imports) {
        for (const auto& file : other.target_files) {
            if (import_refers_to(imp, file)) return true;
        }
    }
    return false;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Dimension parsing / descriptor helpers
// ─────────────────────────────────────────────

std::optional<ConflictDimension> parse_conflict_dimension(std::string_view text) noexcept {
    static constexpr std::array all{
        ConflictDimension::File, ConflictDimension::Semantic, ConflictDimension::Resource,
        ConflictDimension::Interface, ConflictDimension::State, ConflictDimension::TestEnvironment
    };
    for (auto dim : all) {
        if (to_string(dim) == text) return dim;
    }
    return std::nullopt;
}

std::vector<ConflictDimension> ConflictDescriptor::list() const {
    std::vector<ConflictDimension> out;
    for (size_t i = 0; i < kConflictDimensionCount; ++i) {
        if (dimensions.test(i)) out.push_back(static_cast<ConflictDimension>(i));
    }
    return out;
}

std::string ConflictDescriptor::describe() const {
    std::string out;
    for (auto dim : list()) {
        if (!out.empty()) out += ',';
        out += to_string(dim);
    }
    return out;
}

// ─────────────────────────────────────────────
// ConflictMatrix
// ─────────────────────────────────────────────

ConflictMatrix::Pair ConflictMatrix::key(const TaskId& a, const TaskId& b) {
    return a < b ? Pair{a, b} : Pair{b, a};
}

void ConflictMatrix::add(const TaskId& a, const TaskId& b, ConflictDescriptor descriptor) {
    if (a == b || !descriptor.has_conflict()) return;
    entries_[key(a, b)] = descriptor;
}

bool ConflictMatrix::conflicts(const TaskId& a, const TaskId& b) const {
    if (a == b) return false;
    return entries_.contains(key(a, b));
}

ConflictDescriptor ConflictMatrix::get(const TaskId& a, const TaskId& b) const {
    auto it = entries_.find(key(a, b));
    if (it == entries_.end()) return {};
    return it->second;
}

std::vector<TaskId> ConflictMatrix::conflicting_with(const TaskId& id) const {
    std::vector<TaskId> out;
    for (const auto& [pair, _] : entries_) {
        if (pair.first == id) out.push_back(pair.second);
        else if (pair.second == id) out.push_back(pair.first);
    }
    return out;
}

// ─────────────────────────────────────────────
// Dimensions
// ─────────────────────────────────────────────

bool ConflictDetector::file_conflict(const TaskFootprint& a, const TaskFootprint& b) {
    std::vector<std::string> files_a, files_b, dirs_a, dirs_b;
    for (const auto& f : a.target_files) files_a.push_back(normalize_path(f));
    for (const auto& f : b.target_files) files_b.push_back(normalize_path(f));
    for (const auto& d : a.target_dirs) dirs_a.push_back(normalize_path(d));
    for (const auto& d : b.target_dirs) dirs_b.push_back(normalize_path(d));

    // Shared target file
    for (const auto& fa : files_a) {
        if (std::find(files_b.begin(), files_b.end(), fa) != files_b.end()) return true;
    }

    // Overlapping directories
    for (const auto& da : dirs_a) {
        for (const auto& db : dirs_b) {
            if (is_under(da, db) || is_under(db, da)) return true;
        }
    }

    // A file of one task inside a directory claimed by the other
    for (const auto& fa : files_a) {
        for (const auto& db : dirs_b) {
            if (is_under(fa, db)) return true;
        }
    }
    for (const auto& fb : files_b) {
        for (const auto& da : dirs_a) {
            if (is_under(fb, da)) return true;
        }
    }

    return imports_other(a, b) || imports_other(b, a);
}

bool ConflictDetector::semantic_conflict(const TaskFootprint& a, const TaskFootprint& b) {
    return intersects(a.components, b.components);
}

bool ConflictDetector::resource_conflict(const TaskFootprint& a, const TaskFootprint& b) {
    if (a.cpu_intensive && b.cpu_intensive) return true;
    if (a.memory_intensive && b.memory_intensive) return true;
    return intersects(a.exclusive_resources, b.exclusive_resources);
}

bool ConflictDetector::interface_conflict(const TaskFootprint& a, const TaskFootprint& b) {
    return intersects(a.interfaces, b.interfaces);
}

bool ConflictDetector::state_conflict(const TaskFootprint& a, const TaskFootprint& b) {
    return intersects(a.data_models, b.data_models);
}

bool ConflictDetector::test_environment_conflict(const TaskFootprint& a, const TaskFootprint& b) {
    return intersects(a.test_fixtures, b.test_fixtures);
}

// ─────────────────────────────────────────────
// Detection
// ─────────────────────────────────────────────

ConflictDescriptor ConflictDetector::detect(const TaskModel& a, const TaskModel& b) const {
    ConflictDescriptor d;
    if (a.id == b.id) return d;

    const auto& fa = a.footprint;
    const auto& fb = b.footprint;

    if (file_conflict(fa, fb))             d.set(ConflictDimension::File);
    if (semantic_conflict(fa, fb))         d.set(ConflictDimension::Semantic);
    if (resource_conflict(fa, fb))         d.set(ConflictDimension::Resource);
    if (interface_conflict(fa, fb))        d.set(ConflictDimension::Interface);
    if (state_conflict(fa, fb))            d.set(ConflictDimension::State);
    if (test_environment_conflict(fa, fb)) d.set(ConflictDimension::TestEnvironment);
    return d;
}

ConflictMatrix ConflictDetector::build_matrix(const std::vector<TaskModel>& tasks) const {
    ConflictMatrix matrix;
    for (size_t i = 0; i < tasks.size(); ++i) {
        for (size_t j = i + 1; j < tasks.size(); ++j) {
            auto d = detect(tasks[i], tasks[j]);
            if (d.has_conflict()) {
                matrix.add(tasks[i].id, tasks[j].id, d);
            }
        }
    }
    return matrix;
}

}  // namespace parallel_orchestrator
