#pragma once
#include <initializer_list>
#include <map>
#include <string>
#include <utility>

// Tag keys and values attached to alerts. OWASP Top 10 tags carry the
// reference URL as value, policy tags carry an empty value.

namespace alert_tags {

using Tag = std::pair<const char*, const char*>;

constexpr Tag OWASP_2021_A01_BROKEN_AC{"OWASP_2021_A01", "https://owasp.org/Top10/A01_2021-Broken_Access_Control/"};
constexpr Tag OWASP_2021_A04_INSECURE_DESIGN{"OWASP_2021_A04", "https://owasp.org/Top10/A04_2021-Insecure_Design/"};
constexpr Tag OWASP_2021_A05_SEC_MISCONFIG{"OWASP_2021_A05", "https://owasp.org/Top10/A05_2021-Security_Misconfiguration/"};
constexpr Tag OWASP_2021_A06_VULN_COMP{"OWASP_2021_A06", "https://owasp.org/Top10/A06_2021-Vulnerable_and_Outdated_Components/"};

constexpr Tag OWASP_2017_A05_BROKEN_AC{"OWASP_2017_A05", "https://owasp.org/www-project-top-ten/2017/A5_2017-Broken_Access_Control.html"};
constexpr Tag OWASP_2017_A06_SEC_MISCONFIG{"OWASP_2017_A06", "https://owasp.org/www-project-top-ten/2017/A6_2017-Security_Misconfiguration.html"};
constexpr Tag OWASP_2017_A08_INSECURE_DESERIAL{"OWASP_2017_A08", "https://owasp.org/www-project-top-ten/2017/A8_2017-Insecure_Deserialization.html"};
constexpr Tag OWASP_2017_A09_VULN_COMP{"OWASP_2017_A09", "https://owasp.org/www-project-top-ten/2017/A9_2017-Using_Components_with_Known_Vulnerabilities.html"};

// Scan policy membership
constexpr Tag PENTEST{"PENTEST", ""};
constexpr Tag DEV_STD{"DEV_STD", ""};
constexpr Tag QA_STD{"QA_STD", ""};
constexpr Tag QA_FULL{"QA_FULL", ""};

inline std::map<std::string, std::string> to_map(std::initializer_list<Tag> tags) {
    std::map<std::string, std::string> out;
    for (const auto& [key, value] : tags) {
        out.emplace(key, value);
    }
    return out;
}

} // namespace alert_tags
