#include "context_path.hpp"

namespace conductor {

std::vector<std::string> split_path(std::string_view path) {
    std::vector<std::string> segments;
    std::size_t pos = 0;
    while (pos <= path.size()) {
        auto slash = path.find('/', pos);
        if (slash == std::string_view::npos) slash = path.size();
        if (slash > pos) segments.emplace_back(path.substr(pos, slash - pos));
        pos = slash + 1;
    }
    return segments;
}

std::string join_path(const std::vector<std::string>& segments) {
    std::string out;
    for (const auto& seg : segments) {
        if (!out.empty()) out += '/';
        out += seg;
    }
    return out;
}

std::string normalize_path(std::string_view path) {
    return join_path(split_path(path));
}

bool path_has_prefix(std::string_view path, std::string_view prefix) {
    if (prefix.empty()) return true;
    if (path.size() < prefix.size()) return false;
    if (path.compare(0, prefix.size(), prefix) != 0) return false;
    return path.size() == prefix.size() || path[prefix.size()] == '/';
}

std::string common_prefix(const std::vector<std::string>& paths) {
    if (paths.empty()) return {};
    auto common = split_path(paths.front());
    for (std::size_t i = 1; i < paths.size() && !common.empty(); ++i) {
        auto segments = split_path(paths[i]);
        std::size_t n = 0;
        while (n < common.size() && n < segments.size() && common[n] == segments[n]) ++n;
        common.resize(n);
    }
    return join_path(common);
}

std::string expand_run_placeholder(std::string_view path, std::string_view run_id) {
    static constexpr std::string_view token = "{run}";
    std::string out;
    out.reserve(path.size() + run_id.size());
    std::size_t pos = 0;
    while (true) {
        auto hit = path.find(token, pos);
        if (hit == std::string_view::npos) {
            out.append(path.substr(pos));
            break;
        }
        out.append(path.substr(pos, hit - pos));
        out.append(run_id);
        pos = hit + token.size();
    }
    return normalize_path(out);
}

} // namespace conductor
