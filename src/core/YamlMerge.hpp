#pragma once

#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace svr {

struct MergeReport {
    std::vector<std::string> shapeMismatches;  // dotted keys whose default was kept
    std::vector<std::string> unknownKeys;      // dotted keys with no default
};

namespace detail {

inline bool sameShape(const YAML::Node& a, const YAML::Node& b)
{
    if (a.IsMap() || b.IsMap())
        return a.IsMap() && b.IsMap();
    if (a.IsSequence() || b.IsSequence())
        return a.IsSequence() && b.IsSequence();
    return true;
}

inline std::string joinKey(const std::string& prefix, const std::string& key)
{
    return prefix.empty() ? key : prefix + "." + key;
}

} // namespace detail

// User file laid over the built-in defaults. A user value replaces the
// default only when both are maps (merged key by key), both sequences, or
// both scalars; anything else keeps the default. Keys without a default are
// carried over as-is.
inline YAML::Node mergeOverDefaults(const YAML::Node& defaults, const YAML::Node& overlay,
                                    MergeReport* report = nullptr,
                                    const std::string& prefix = std::string())
{
    if (!overlay.IsDefined() || overlay.IsNull())
        return YAML::Clone(defaults);

    if (!defaults.IsDefined() || defaults.IsNull())
        return YAML::Clone(overlay);

    if (!detail::sameShape(defaults, overlay)) {
        if (report)
            report->shapeMismatches.push_back(prefix);
        return YAML::Clone(defaults);
    }

    if (!defaults.IsMap())
        return YAML::Clone(overlay);

    YAML::Node result = YAML::Clone(defaults);
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        const std::string key = it->first.as<std::string>();
        const std::string path = detail::joinKey(prefix, key);
        if (result[key]) {
            result[key] = mergeOverDefaults(result[key], it->second, report, path);
        } else {
            if (report)
                report->unknownKeys.push_back(path);
            result[key] = YAML::Clone(it->second);
        }
    }
    return result;
}

} // namespace svr
