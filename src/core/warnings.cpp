#include "ocfg/warnings.hpp"

#include <algorithm>
#include <cctype>
#include <map>

#include <spdlog/spdlog.h>

namespace ocfg {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// Stable "k=v, k=v" rendering for log lines
std::string format_fields(const std::unordered_map<std::string, std::string>& fields) {
    std::map<std::string, std::string> sorted(fields.begin(), fields.end());
    std::string out;
    for (const auto& [key, value] : sorted) {
        if (!out.empty()) out += ", ";
        out += key + "=" + value;
    }
    return out;
}

} // namespace

void WarningCollector::emit(Warning warning, const std::unordered_map<std::string, std::string>& fields) {
    emit(warning_to_string(warning), fields);
}

void WarningCollector::emit(Warning warning) {
    emit(warning_to_string(warning), {});
}

void WarningCollector::emit(const std::string& warning_key,
                            std::unordered_map<std::string, std::string> fields) {
    std::string key = to_lower(warning_key);
    WarningAction action = get_effective_action(key);

    if (action == WarningAction::Error) {
        spdlog::error("{}: {}", key, format_fields(fields));
    } else if (action == WarningAction::Warn) {
        spdlog::warn("{}: {}", key, format_fields(fields));
    }

    // Ignored warnings are still collected but marked
    warnings_.push_back({key, std::move(fields), action});
}

void WarningCollector::append(const WarningCollector& other) {
    warnings_.insert(warnings_.end(), other.warnings_.begin(), other.warnings_.end());
}

std::vector<WarningObject> WarningCollector::get_warnings() const {
    std::vector<WarningObject> result;

    for (const auto& w : warnings_) {
        if (w.effective_action == WarningAction::Ignore) {
            continue;
        }

        WarningObject obj;
        obj.key = w.key;
        obj.action = action_to_string(w.effective_action);
        obj.fields = w.fields;
        result.push_back(std::move(obj));
    }

    return result;
}

std::size_t WarningCollector::count(Warning warning) const {
    const std::string key = warning_to_string(warning);
    return static_cast<std::size_t>(std::count_if(
        warnings_.begin(), warnings_.end(),
        [&key](const CollectedWarning& w) { return w.key == key; }));
}

bool WarningCollector::has_errors() const {
    for (const auto& w : warnings_) {
        if (w.effective_action == WarningAction::Error) {
            return true;
        }
    }
    return false;
}

bool WarningCollector::has_effective_warnings() const {
    for (const auto& w : warnings_) {
        if (w.effective_action != WarningAction::Ignore) {
            return true;
        }
    }
    return false;
}

void WarningCollector::clear() {
    warnings_.clear();
}

WarningAction WarningCollector::get_effective_action(const std::string& key) const {
    auto policy_it = policy_.find(key);
    if (policy_it != policy_.end()) {
        return policy_it->second;
    }

    // Default: warn
    return WarningAction::Warn;
}

} // namespace ocfg
