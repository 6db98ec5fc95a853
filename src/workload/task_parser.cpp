/**
 * @file task_parser.cpp
 * @brief TaskParser implementation (toml++ and pattern extraction).
 * @author Dimitris Kafetzis
 */

#include "workload/task_parser.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>
#include <set>
#include <sstream>

namespace parallel_orchestrator {

namespace {

std::string trim(std::string_view s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return std::string{s.substr(begin, end - begin)};
}

std::vector<std::string> strings_of(const toml::table& tbl, std::string_view key) {
    std::vector<std::string> out;
    if (auto* arr = tbl[key].as_array()) {
        for (const auto& elem : *arr) {
            if (auto s = elem.value<std::string>()) out.push_back(*s);
        }
    } else if (auto s = tbl[key].value<std::string>()) {
        out.push_back(*s);
    }
    return out;
}

Result<TaskSpec> spec_from_table(const toml::table& tbl, const std::string& source, size_t index) {
    TaskSpec spec;
    spec.source = source;
    spec.description = trim(tbl["description"].value_or(std::string{}));
    spec.name = trim(tbl["name"].value_or(std::string{}));

    if (spec.description.empty()) {
        return Error{ErrorKind::InputParse,
                     source + ": task #" + std::to_string(index + 1) + " has no description"};
    }
    if (spec.name.empty()) {
        spec.name = std::filesystem::path(source).stem().string();
        if (index > 0) spec.name += "-" + std::to_string(index + 1);
    }

    auto& fp = spec.footprint;
    fp.target_files = strings_of(tbl, "target_files");
    fp.target_dirs = strings_of(tbl, "target_dirs");
    fp.imports = strings_of(tbl, "imports");
    fp.components = strings_of(tbl, "components");
    fp.interfaces = strings_of(tbl, "interfaces");
    fp.data_models = strings_of(tbl, "data_models");
    fp.test_fixtures = strings_of(tbl, "test_fixtures");
    fp.exclusive_resources = strings_of(tbl, "exclusive_resources");
    fp.cpu_intensive = tbl["cpu_intensive"].value_or(false);
    fp.memory_intensive = tbl["memory_intensive"].value_or(false);

    spec.depends_on = strings_of(tbl, "depends_on");
    if (auto minutes = tbl["estimated_minutes"].value<int64_t>(); minutes && *minutes > 0) {
        spec.estimated_minutes = static_cast<uint32_t>(*minutes);
    }
    return spec;
}

// Longer tokens are blobs (base64, minified assets, log lines), never paths.
constexpr size_t kMaxPathTokenLength = 4096;

constexpr std::string_view kSourceExtensions[] = {
    "cpp", "hpp", "cc", "hh", "h", "c", "py", "js", "ts", "rs", "go", "java",
    "md", "json", "yaml", "yml", "toml"};

bool is_path_delimiter(char c) {
    switch (c) {
        case '`': case '\'': case '"': case '(': case ')': case '[': case ']':
        case ',': case ':': case ';':
            return true;
        default:
            return std::isspace(static_cast<unsigned char>(c)) != 0;
    }
}

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '-';
}

/// `dir/.../stem.ext`: directory segments of [A-Za-z0-9_.-], a stem starting
/// with a letter or '_', and a known source extension.
bool looks_like_source_path(std::string_view token) {
    auto slash = token.rfind('/');
    auto dirs = slash == std::string_view::npos ? std::string_view{} : token.substr(0, slash + 1);
    auto file = slash == std::string_view::npos ? token : token.substr(slash + 1);

    size_t segment = 0;
    for (char c : dirs) {
        if (c == '/') {
            if (segment == 0) return false;
            segment = 0;
        } else if (is_word_char(c) || c == '.') {
            ++segment;
        } else {
            return false;
        }
    }

    auto dot = file.rfind('.');
    if (dot == std::string_view::npos || dot == 0) return false;
    auto stem = file.substr(0, dot);
    auto ext = file.substr(dot + 1);
    if (!(std::isalpha(static_cast<unsigned char>(stem.front())) || stem.front() == '_')) return false;
    if (!std::all_of(stem.begin(), stem.end(), is_word_char)) return false;
    return std::find(std::begin(kSourceExtensions), std::end(kSourceExtensions), ext)
           != std::end(kSourceExtensions);
}

/// For a line "Depends on: a, b" (optionally bulleted, any case) returns "a, b".
std::optional<std::string_view> depends_on_list(std::string_view line) {
    if (!line.empty() && (line.front() == '-' || line.front() == '*')) {
        line.remove_prefix(1);
        while (!line.empty() && std::isspace(static_cast<unsigned char>(line.front()))) line.remove_prefix(1);
    }
    constexpr std::string_view kPrefix = "depends on:";
    if (line.size() < kPrefix.size()) return std::nullopt;
    for (size_t i = 0; i < kPrefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(line[i])) != kPrefix[i]) return std::nullopt;
    }
    auto rest = line.substr(kPrefix.size());
    if (rest.find_first_not_of(" \t") == std::string_view::npos) return std::nullopt;
    return rest;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Files
// ─────────────────────────────────────────────

Result<std::vector<TaskSpec>> TaskParser::parse_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorKind::InputParse, "cannot read task input: " + path.string()};
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    auto text = buffer.str();

    if (path.extension() == ".toml") {
        return parse_toml(text, path.string());
    }

    auto spec = parse_prompt(text, path.string());
    if (!spec) return spec.error();
    return std::vector<TaskSpec>{std::move(*spec)};
}

Result<std::vector<TaskSpec>> TaskParser::parse_files(const std::vector<std::filesystem::path>& paths) {
    std::vector<TaskSpec> all;
    for (const auto& path : paths) {
        auto specs = parse_file(path);
        if (!specs) return specs.error();
        for (auto& spec : *specs) {
            all.push_back(std::move(spec));
        }
    }
    if (all.empty()) {
        return Error{ErrorKind::InputParse, "no task inputs given"};
    }
    return all;
}

// ─────────────────────────────────────────────
// TOML
// ─────────────────────────────────────────────

Result<std::vector<TaskSpec>> TaskParser::parse_toml(std::string_view text, const std::string& source) {
    toml::table tbl;
    try {
        tbl = toml::parse(text, source);
    } catch (const toml::parse_error& err) {
        return Error{ErrorKind::InputParse,
                     source + ": TOML parse error: " + std::string{err.description()}};
    }

    std::vector<TaskSpec> specs;
    if (auto* tasks = tbl["task"].as_array()) {
        size_t index = 0;
        for (const auto& node : *tasks) {
            const auto* task_tbl = node.as_table();
            if (!task_tbl) {
                return Error{ErrorKind::InputParse, source + ": [[task]] entries must be tables"};
            }
            auto spec = spec_from_table(*task_tbl, source, index++);
            if (!spec) return spec.error();
            specs.push_back(std::move(*spec));
        }
    } else {
        auto spec = spec_from_table(tbl, source, 0);
        if (!spec) return spec.error();
        specs.push_back(std::move(*spec));
    }

    if (specs.empty()) {
        return Error{ErrorKind::InputParse, source + ": no tasks defined"};
    }
    return specs;
}

// ─────────────────────────────────────────────
// Prompt documents
// ─────────────────────────────────────────────

Result<TaskSpec> TaskParser::parse_prompt(std::string_view text, const std::string& source) {
    TaskSpec spec;
    spec.source = source;
    spec.description = trim(text);
    if (spec.description.empty()) {
        return Error{ErrorKind::InputParse, source + ": prompt file is empty"};
    }

    std::istringstream lines{std::string{text}};
    std::string line;
    while (std::getline(lines, line)) {
        auto trimmed = trim(line);
        if (spec.name.empty() && trimmed.starts_with("# ")) {
            spec.name = trim(std::string_view{trimmed}.substr(2));
            continue;
        }
        if (auto list = depends_on_list(trimmed)) {
            std::stringstream names(std::string{*list});
            std::string name;
            while (std::getline(names, name, ',')) {
                auto dep = trim(name);
                if (!dep.empty()) spec.depends_on.push_back(dep);
            }
        }
    }

    if (spec.name.empty()) {
        spec.name = std::filesystem::path(source).stem().string();
    }
    spec.footprint.target_files = extract_target_files(text);
    return spec;
}

std::vector<std::string> TaskParser::extract_target_files(std::string_view text) {
    std::set<std::string> found;
    size_t pos = 0;
    while (pos < text.size()) {
        while (pos < text.size() && is_path_delimiter(text[pos])) ++pos;
        size_t end = pos;
        while (end < text.size() && !is_path_delimiter(text[end])) ++end;

        auto token = text.substr(pos, end - pos);
        pos = end;
        if (token.size() > kMaxPathTokenLength) continue;
        while (!token.empty() && token.back() == '.') token.remove_suffix(1);
        if (looks_like_source_path(token)) found.emplace(token);
    }
    return {found.begin(), found.end()};
}

}  // namespace parallel_orchestrator
