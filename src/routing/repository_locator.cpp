#include "routing/repository_locator.hpp"

#include <cctype>
#include <fnmatch.h>
#include <utility>

namespace pkgrepo {

namespace {

bool GlobMatch(const std::string& pattern, const std::string& value) {
    if (pattern.empty() || pattern == "*") return true;
    return ::fnmatch(pattern.c_str(), value.c_str(), 0) == 0;
}

bool IsVarChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

Result LookupVariable(const std::string& var, const PackageDescriptor& d, std::string& out) {
    if (var == "arch" || var == "basearch") {
        out = d.architecture;
    } else if (var == "os_tag") {
        out = d.os_tag;
    } else if (var == "format") {
        out = std::string(ToString(d.format));
    } else if (var == "name") {
        out = d.name;
    } else if (var == "releasever") {
        out = d.ReleaseVersion();
        if (out.empty()) {
            return Result::Fail(ErrorCode::MalformedPackage,
                                "Unable to get \"releasever\" from release \"" + d.release +
                                    "\" of package \"" + d.name +
                                    "\"; the release must carry a dist tag such as \"1.el8\"");
        }
        return Result::Ok();
    } else {
        return Result::Fail(ErrorCode::InvalidConfig, "unknown routing variable $" + var);
    }
    if (out.empty()) {
        return Result::Fail(ErrorCode::MalformedPackage,
                            "package \"" + d.name + "\" has no value for $" + var);
    }
    return Result::Ok();
}

// Substituted values come from package headers and must stay one path segment.
bool IsSafeSegmentValue(const std::string& v) {
    if (v == "." || v.find("..") != std::string::npos) return false;
    for (char c : v) {
        const auto uc = static_cast<unsigned char>(c);
        if (c == '/' || c == '\\' || uc < 0x20 || uc == 0x7f) return false;
    }
    return true;
}

} // namespace

bool RoutePredicate::Matches(const PackageDescriptor& d) const {
    return GlobMatch(arch, d.architecture) && GlobMatch(os_tag, d.os_tag) &&
           GlobMatch(format, std::string(ToString(d.format)));
}

RepositoryLocator::RepositoryLocator(std::vector<RoutingRule> rules) : rules_(std::move(rules)) {}

Result RepositoryLocator::Resolve(const PackageDescriptor& descriptor, std::string& out_prefix) const {
    for (const auto& rule : rules_) {
        if (!rule.match.Matches(descriptor)) continue;
        return ExpandPrefixTemplate(rule.target_prefix, descriptor, out_prefix);
    }
    return Result::Fail(ErrorCode::NoMatchingRepository,
                        "no routing rule matches arch=" + descriptor.architecture +
                            " os_tag=" + descriptor.os_tag +
                            " format=" + std::string(ToString(descriptor.format)));
}

Result ExpandPrefixTemplate(const std::string& tmpl,
                            const PackageDescriptor& descriptor,
                            std::string& out) {
    std::string result;
    result.reserve(tmpl.size());
    for (size_t i = 0; i < tmpl.size(); ++i) {
        if (tmpl[i] != '$') {
            result.push_back(tmpl[i]);
            continue;
        }
        if (i + 1 < tmpl.size() && tmpl[i + 1] == '$') {
            result.push_back('$');
            ++i;
            continue;
        }

        std::string var;
        if (i + 1 < tmpl.size() && tmpl[i + 1] == '{') {
            const auto close = tmpl.find('}', i + 2);
            if (close == std::string::npos)
                return Result::Fail(ErrorCode::InvalidConfig, "unterminated ${ in " + tmpl);
            var = tmpl.substr(i + 2, close - i - 2);
            i = close;
        } else {
            size_t j = i + 1;
            while (j < tmpl.size() && IsVarChar(tmpl[j])) ++j;
            var = tmpl.substr(i + 1, j - i - 1);
            i = j - 1;
        }
        if (var.empty())
            return Result::Fail(ErrorCode::InvalidConfig, "dangling $ in " + tmpl);

        std::string value;
        auto r = LookupVariable(var, descriptor, value);
        if (!r.is_ok()) return r;
        if (!IsSafeSegmentValue(value)) {
            return Result::Fail(ErrorCode::MalformedPackage,
                                "package \"" + descriptor.name + "\" has unsafe value for $" + var);
        }
        result += value;
    }
    out = std::move(result);
    return Result::Ok();
}

} // namespace pkgrepo
