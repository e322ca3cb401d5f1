/**
 * @file remote_path.cpp
 * @brief Implementation of remote path helpers
 */

#include <cymo/core/remote_path.h>

namespace cymo {

namespace {

auto split_components(std::string_view path) -> std::vector<std::string_view> {
    std::vector<std::string_view> components;
    size_t pos = 0;
    while (pos < path.size()) {
        auto next = path.find('/', pos);
        if (next == std::string_view::npos) {
            next = path.size();
        }
        if (next > pos) {
            components.push_back(path.substr(pos, next - pos));
        }
        pos = next + 1;
    }
    return components;
}

}  // namespace

auto normalize_remote_path(std::string_view path) -> std::string {
    std::vector<std::string_view> stack;
    for (auto component : split_components(path)) {
        if (component == ".") {
            continue;
        }
        if (component == "..") {
            if (!stack.empty()) {
                stack.pop_back();
            }
            continue;
        }
        stack.push_back(component);
    }

    if (stack.empty()) {
        return "/";
    }

    std::string result;
    for (auto component : stack) {
        result += '/';
        result.append(component.data(), component.size());
    }
    return result;
}

auto clean_remote_path(std::string_view path) -> std::string {
    if (is_absolute_remote_path(path)) {
        return normalize_remote_path(path);
    }

    std::string result;
    for (auto component : split_components(path)) {
        if (component == ".") {
            continue;
        }
        if (!result.empty()) {
            result += '/';
        }
        result.append(component.data(), component.size());
    }
    return result.empty() ? "." : result;
}

auto join_remote_path(std::string_view base, std::string_view relative) -> std::string {
    std::string combined(base);
    combined += '/';
    combined.append(relative.data(), relative.size());
    return normalize_remote_path(combined);
}

auto remote_parent(std::string_view path) -> std::string {
    auto normalized = normalize_remote_path(path);
    auto last_sep = normalized.find_last_of('/');
    if (last_sep == 0 || last_sep == std::string::npos) {
        return "/";
    }
    return normalized.substr(0, last_sep);
}

auto remote_filename(std::string_view path) -> std::string {
    auto normalized = normalize_remote_path(path);
    return normalized.substr(normalized.find_last_of('/') + 1);
}

auto remote_ancestors(std::string_view path) -> std::vector<std::string> {
    std::vector<std::string> ancestors;
    const auto normalized = normalize_remote_path(path);
    std::string current;
    for (auto component : split_components(normalized)) {
        current += '/';
        current.append(component.data(), component.size());
        ancestors.push_back(current);
    }
    return ancestors;
}

auto is_same_or_ancestor(std::string_view ancestor, std::string_view path) -> bool {
    auto a = normalize_remote_path(ancestor);
    auto p = normalize_remote_path(path);
    if (a == "/") {
        return true;
    }
    if (p.size() < a.size() || p.compare(0, a.size(), a) != 0) {
        return false;
    }
    return p.size() == a.size() || p[a.size()] == '/';
}

}  // namespace cymo
