#pragma once

#include "package/package_descriptor.hpp"
#include "util/result.hpp"

#include <string>
#include <vector>

namespace pkgrepo {

// Shell-style globs over the routing attributes; an empty field matches anything.
struct RoutePredicate {
    std::string arch = "*";
    std::string os_tag = "*";
    std::string format = "*";

    bool Matches(const PackageDescriptor& d) const;
};

struct RoutingRule {
    RoutePredicate match;
    // May reference $arch, $basearch, $releasever, $os_tag, $format and $name.
    std::string target_prefix;
};

class RepositoryLocator {
public:
    RepositoryLocator() = default;
    explicit RepositoryLocator(std::vector<RoutingRule> rules);

    // First matching rule wins. Deterministic and free of shared mutable state.
    Result Resolve(const PackageDescriptor& descriptor, std::string& out_prefix) const;

    const std::vector<RoutingRule>& Rules() const { return rules_; }

private:
    std::vector<RoutingRule> rules_;
};

Result ExpandPrefixTemplate(const std::string& tmpl,
                            const PackageDescriptor& descriptor,
                            std::string& out);

} // namespace pkgrepo
