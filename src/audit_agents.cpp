#include "audit_agents.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <optional>
#include <regex>
#include <set>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <unordered_set>

namespace fs = std::filesystem;

namespace conductor {

namespace {

constexpr std::uintmax_t max_scanned_file_size = 1024 * 1024;
constexpr std::size_t long_line_threshold = 120;

// std::regex recurses per matched character, so long lines (minified
// bundles) are searched in overlapping windows. The overlap covers the
// longest quoted value the credential rule accepts.
constexpr std::size_t scan_window = 4096;
constexpr std::size_t scan_overlap = 512;

const std::unordered_set<std::string> dependency_dirs = {
    "node_modules", "venv", ".venv", "__pycache__", "vendor", "bower_components"
};

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool is_remote(const std::string& repo) {
    return repo.find("://") != std::string::npos || repo.rfind("git@", 0) == 0;
}

struct secret_rule {
    const char* name;
    const char* severity;
    std::regex pattern;
};

const std::vector<secret_rule>& secret_rules() {
    static const std::vector<secret_rule> rules = {
        {"private_key", "CRITICAL",
         std::regex("-----BEGIN (RSA |EC |DSA |OPENSSH )?PRIVATE KEY-----")},
        {"aws_access_key", "HIGH", std::regex("AKIA[0-9A-Z]{16}")},
        {"github_token", "HIGH", std::regex("gh[pousr]_[A-Za-z0-9]{36}")},
        {"hardcoded_credential", "MEDIUM",
         std::regex("(password|passwd|secret|api[_-]?key|token)\\s*[:=]\\s*[\"'][^\"']{6,256}[\"']",
                    std::regex::icase)},
    };
    return rules;
}

bool search_line(const std::string& line, const std::regex& pattern) {
    if (line.size() <= scan_window) return std::regex_search(line, pattern);
    for (std::size_t pos = 0; pos < line.size(); pos += scan_window - scan_overlap) {
        auto len = std::min(scan_window, line.size() - pos);
        if (std::regex_search(line.begin() + pos, line.begin() + pos + len, pattern)) return true;
        if (pos + len == line.size()) break;
    }
    return false;
}

// Repository checkout and inventory written by repo_cloner.
struct repo_view {
    fs::path root;
    nlohmann::json files;
};

std::optional<repo_view> load_repo(task_context& ctx, std::string& error) {
    auto path = ctx.context().get(ctx.run_path("{run}/repo/path"));
    auto files = ctx.context().get(ctx.run_path("{run}/repo/files"));
    if (!path || !path->is_string() || !files || !files->is_array()) {
        error = "repository inventory missing from context";
        return std::nullopt;
    }
    return repo_view{fs::path(path->get<std::string>()), std::move(*files)};
}

} // namespace

std::string language_for(const std::string& extension) {
    static const std::unordered_map<std::string, std::string> languages = {
        {".py", "python"}, {".js", "javascript"}, {".jsx", "javascript"},
        {".ts", "typescript"}, {".tsx", "typescript"}, {".java", "java"},
        {".php", "php"}, {".rb", "ruby"}, {".go", "go"}, {".rs", "rust"},
        {".c", "c"}, {".h", "c"}, {".cc", "cpp"}, {".cpp", "cpp"}, {".cxx", "cpp"},
        {".hpp", "cpp"}, {".hxx", "cpp"}, {".cs", "csharp"}, {".swift", "swift"},
        {".kt", "kotlin"}, {".scala", "scala"}, {".dart", "dart"}, {".m", "objc"},
        {".mm", "objc"}, {".sh", "shell"}, {".bash", "shell"}, {".ps1", "powershell"},
        {".lua", "lua"}, {".pl", "perl"}, {".r", "r"}, {".hs", "haskell"},
        {".ml", "ocaml"}, {".fs", "fsharp"}, {".clj", "clojure"}, {".ex", "elixir"},
        {".exs", "elixir"}, {".html", "html"}, {".css", "css"}, {".scss", "css"},
        {".vue", "vue"}, {".svelte", "svelte"}
    };
    auto it = languages.find(lower(extension));
    return it == languages.end() ? std::string() : it->second;
}

bool is_sensitive_file(const std::string& filename) {
    static const std::array<std::string_view, 16> exact = {
        ".env", ".envrc", "id_rsa", "id_dsa", "id_ecdsa", "id_ed25519",
        "credentials", "credentials.json", "secrets.yml", "secrets.json",
        "docker-compose.yml", "dockerfile", "terraform.tfvars",
        "application.properties", "appsettings.json", "web.config"
    };
    static const std::array<std::string_view, 8> suffixes = {
        ".pem", ".key", ".p12", ".pfx", ".jks", ".crt", ".tfvars", ".keystore"
    };
    static const std::array<std::string_view, 5> fragments = {
        "secret", "password", "credential", "private_key", "token"
    };

    auto name = lower(filename);
    if (std::find(exact.begin(), exact.end(), name) != exact.end()) return true;
    if (name.rfind(".env.", 0) == 0) return true;
    for (auto s : suffixes) {
        if (name.size() >= s.size() && name.compare(name.size() - s.size(), s.size(), s) == 0) {
            return true;
        }
    }
    for (auto f : fragments) {
        if (name.find(f) != std::string::npos) return true;
    }
    return false;
}

std::string overall_risk(const nlohmann::json& security_summary, double maintainability) {
    static const std::array<const char*, 4> names = {"LOW", "MEDIUM", "HIGH", "CRITICAL"};

    int level = 0;
    auto by_severity = security_summary.value("by_severity", nlohmann::json::object());
    if (by_severity.value("CRITICAL", 0) > 0)      level = 3;
    else if (by_severity.value("HIGH", 0) > 0)     level = 2;
    else if (by_severity.value("MEDIUM", 0) > 0)   level = 1;

    if (maintainability < 3.0) level = std::min(level + 1, 3);
    return names[level];
}

// --- repo_cloner ---

task_result repo_cloner::run_task(task_context& ctx) {
    const auto& repo = ctx.options().repository;
    if (repo.empty()) return task_result::fail("no repository given");
    if (is_remote(repo)) {
        return task_result::fail("remote repository '" + repo +
                                 "' is not supported; pass a local checkout");
    }

    std::error_code ec;
    fs::path root = fs::canonical(repo, ec);
    if (ec || !fs::is_directory(root, ec)) {
        return task_result::fail("repository path '" + repo + "' is not a directory");
    }

    bool include_deps = ctx.options().analysis.include_deps;
    nlohmann::json files = nlohmann::json::array();
    std::set<std::string> languages;

    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) return task_result::fail("cannot read '" + root.string() + "': " + ec.message());

    for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) return task_result::fail("walking '" + root.string() + "' failed: " + ec.message());
        if (ctx.cancelled()) return task_result::fail("cancelled");

        const auto& entry = *it;
        auto name = entry.path().filename().string();

        if (entry.is_directory(ec)) {
            bool hidden = !name.empty() && name[0] == '.';
            if (hidden || (!include_deps && dependency_dirs.count(name))) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!entry.is_regular_file(ec)) continue;
        // Dotfiles are skipped except the ones that usually hold secrets
        if (!name.empty() && name[0] == '.' && !is_sensitive_file(name)) continue;

        auto rel = fs::relative(entry.path(), root, ec).generic_string();
        auto language = language_for(entry.path().extension().string());
        if (!language.empty()) languages.insert(language);

        auto lname = lower(rel);
        files.push_back({
            {"path", rel},
            {"size", entry.file_size(ec)},
            {"language", language},
            {"is_security_related", is_sensitive_file(name)},
            {"is_config", language.empty() &&
                          (lname.find("config") != std::string::npos ||
                           entry.path().extension() == ".yml" ||
                           entry.path().extension() == ".yaml" ||
                           entry.path().extension() == ".toml" ||
                           entry.path().extension() == ".ini")},
            {"is_test", lname.find("test") != std::string::npos ||
                        lname.find("spec") != std::string::npos}
        });
    }

    nlohmann::json langs(languages);
    auto file_count = files.size();

    ctx.context().set(ctx.run_path("{run}/repo/path"), root.string());
    ctx.context().set(ctx.run_path("{run}/repo/languages"), langs);
    // Written last: dependents wait on this path
    ctx.context().set(ctx.run_path("{run}/repo/files"), std::move(files));

    ctx.broker().publish("repo/cloned", {{"run", ctx.run_id()}, {"files", file_count}});

    return task_result::ok({{"path", root.string()}, {"files", file_count}, {"languages", langs}});
}

// --- security_scanner ---

task_result security_scanner::run_task(task_context& ctx) {
    std::string error;
    auto repo = load_repo(ctx, error);
    if (!repo) return task_result::fail(error);

    bool deep = ctx.options().analysis.deep_analysis;
    nlohmann::json findings = nlohmann::json::array();
    std::map<std::string, int> by_severity;

    for (const auto& file : repo->files) {
        if (ctx.cancelled()) return task_result::fail("cancelled");

        auto rel = file.value("path", std::string());
        if (file.value("is_security_related", false)) {
            findings.push_back({{"file", rel}, {"rule", "sensitive_file"}, {"severity", "MEDIUM"}});
            by_severity["MEDIUM"] += 1;
        }

        if (!deep || file.value("size", std::uintmax_t{0}) > max_scanned_file_size) continue;

        std::ifstream in(repo->root / rel);
        if (!in) continue;

        std::string line;
        int line_no = 0;
        while (std::getline(in, line)) {
            ++line_no;
            for (const auto& rule : secret_rules()) {
                if (!search_line(line, rule.pattern)) continue;
                findings.push_back({
                    {"file", rel}, {"line", line_no},
                    {"rule", rule.name}, {"severity", rule.severity}
                });
                by_severity[rule.severity] += 1;
            }
        }
    }

    nlohmann::json summary = {
        {"total", findings.size()},
        {"by_severity", by_severity},
        {"deep_analysis", deep}
    };

    ctx.context().set(ctx.run_path("{run}/security/findings"), findings);
    ctx.context().set(ctx.run_path("{run}/security/summary"), summary);
    return task_result::ok(summary);
}

// --- code_reviewer ---

task_result code_reviewer::run_task(task_context& ctx) {
    std::string error;
    auto repo = load_repo(ctx, error);
    if (!repo) return task_result::fail(error);

    struct language_stats {
        int files = 0;
        int lines = 0;
        int long_lines = 0;
        int todos = 0;
    };
    std::map<std::string, language_stats> stats;
    std::vector<std::pair<std::uintmax_t, std::string>> sizes;
    int test_files = 0;

    for (const auto& file : repo->files) {
        if (ctx.cancelled()) return task_result::fail("cancelled");

        auto language = file.value("language", std::string());
        if (language.empty()) continue;

        auto rel = file.value("path", std::string());
        auto size = file.value("size", std::uintmax_t{0});
        sizes.emplace_back(size, rel);
        if (file.value("is_test", false)) ++test_files;

        auto& s = stats[language];
        s.files += 1;
        if (size > max_scanned_file_size) continue;

        std::ifstream in(repo->root / rel);
        std::string line;
        while (std::getline(in, line)) {
            s.lines += 1;
            if (line.size() > long_line_threshold) s.long_lines += 1;
            if (line.find("TODO") != std::string::npos || line.find("FIXME") != std::string::npos) {
                s.todos += 1;
            }
        }
    }

    int total_lines = 0, long_lines = 0, todos = 0, code_files = 0;
    nlohmann::json per_language = nlohmann::json::object();
    for (const auto& [language, s] : stats) {
        per_language[language] = {
            {"files", s.files}, {"lines", s.lines},
            {"long_lines", s.long_lines}, {"todos", s.todos}
        };
        total_lines += s.lines;
        long_lines += s.long_lines;
        todos += s.todos;
        code_files += s.files;
    }

    // 10 minus penalties for long lines, TODO density and missing tests
    double score = 10.0;
    if (total_lines > 0) {
        score -= std::min(4.0, 40.0 * long_lines / total_lines);
        score -= std::min(3.0, 300.0 * todos / total_lines);
    }
    if (code_files > 0 && test_files == 0) score -= 2.0;
    score = std::max(0.0, std::round(score * 10.0) / 10.0);

    std::sort(sizes.begin(), sizes.end(), std::greater<>());
    nlohmann::json largest = nlohmann::json::array();
    for (std::size_t i = 0; i < sizes.size() && i < 5; ++i) {
        largest.push_back({{"path", sizes[i].second}, {"size", sizes[i].first}});
    }

    nlohmann::json summary = {
        {"code_files", code_files},
        {"test_files", test_files},
        {"lines", total_lines},
        {"long_lines", long_lines},
        {"todos", todos},
        {"maintainability_score", score},
        {"languages", per_language},
        {"largest_files", largest}
    };

    ctx.context().set(ctx.run_path("{run}/code_review/summary"), summary);
    return task_result::ok({{"maintainability_score", score}, {"code_files", code_files}});
}

// --- reporter ---

task_result reporter::run_task(task_context& ctx) {
    auto& store = ctx.context();
    auto files = store.get(ctx.run_path("{run}/repo/files"));
    auto languages = store.get(ctx.run_path("{run}/repo/languages"));
    auto security = store.get(ctx.run_path("{run}/security/summary"));
    auto findings = store.get(ctx.run_path("{run}/security/findings"));
    auto review = store.get(ctx.run_path("{run}/code_review/summary"));

    if (!files) return task_result::fail("repository inventory missing from context");

    double maintainability = review ? review->value("maintainability_score", 5.0) : 5.0;
    std::string risk = security ? overall_risk(*security, maintainability) : "UNKNOWN";

    nlohmann::json critical = nlohmann::json::array();
    if (findings) {
        for (const auto& f : *findings) {
            auto sev = f.value("severity", std::string());
            if (sev == "CRITICAL" || sev == "HIGH") critical.push_back(f);
            if (critical.size() >= 10) break;
        }
    }

    auto now = std::chrono::system_clock::now();
    nlohmann::json report = {
        {"metadata", {
            {"run", ctx.run_id()},
            {"repository", ctx.options().repository},
            {"generated_at_ms", std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()).count()}
        }},
        {"executive_summary", {
            {"overall_risk_level", risk},
            {"code_quality_score", maintainability},
            {"total_files_analyzed", files->size()},
            {"languages_detected", languages ? *languages : nlohmann::json::array()},
            {"critical_findings", critical}
        }},
        {"security_analysis", {
            {"status", security.has_value()},
            {"summary", security ? *security : nlohmann::json()},
            {"findings", findings ? *findings : nlohmann::json::array()}
        }},
        {"code_review", {
            {"status", review.has_value()},
            {"summary", review ? *review : nlohmann::json()}
        }}
    };

    store.set(ctx.run_path("{run}/report"), report);
    ctx.broker().publish("report/ready", {{"run", ctx.run_id()}, {"risk", risk}});
    return task_result::ok({{"overall_risk_level", risk}});
}

} // namespace conductor
