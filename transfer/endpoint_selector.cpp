// ============================================================
// endpoint_selector.cpp -- Rank candidate source URLs by scheme
// ============================================================

#include "endpoint_selector.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>

static constexpr char URL_LIST_DELIM = ',';

std::vector<UrlRewriteRule> default_rewrite_rules() {
    return {
        { Scheme::S3, "HMDEMO", "s3://{2}/DEMO/{4}/{-4:}" },
    };
}

std::vector<UrlRewriteRule> load_rewrite_rules(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw std::runtime_error("Cannot open rewrite rules: " + path);

    std::vector<UrlRewriteRule> rules;
    std::string line;
    int lineno = 0;
    while (std::getline(f, line)) {
        ++lineno;
        std::string t = utils::trim(line);
        if (t.empty() || t[0] == '#') continue;

        auto cols = utils::split(t, '\t');
        if (cols.size() != 3) {
            throw std::runtime_error(path + ":" + std::to_string(lineno) +
                                     ": expected scheme<TAB>marker<TAB>template");
        }
        UrlRewriteRule r;
        r.scheme       = scheme_from_name(cols[0]);
        r.marker       = utils::trim(cols[1]);
        r.url_template = utils::trim(cols[2]);
        if (r.scheme == Scheme::UNKNOWN || r.marker.empty() || r.url_template.empty()) {
            throw std::runtime_error(path + ":" + std::to_string(lineno) +
                                     ": invalid rewrite rule");
        }
        rules.push_back(std::move(r));
    }
    return rules;
}

// Resolve a possibly negative field index against n fields
static size_t field_index(long idx, size_t n, const std::string& tmpl) {
    long resolved = idx < 0 ? (long)n + idx : idx;
    if (resolved < 0 || (size_t)resolved >= n) {
        throw std::runtime_error("rewrite template " + tmpl + " references field " +
                                 std::to_string(idx) + " of a " + std::to_string(n) +
                                 "-field URL");
    }
    return (size_t)resolved;
}

std::string apply_rewrite(const UrlRewriteRule& rule, const std::string& url) {
    const std::string& tmpl = rule.url_template;
    auto fields = utils::split(url, '/');

    std::string out;
    size_t i = 0;
    while (i < tmpl.size()) {
        char c = tmpl[i];
        if (c != '{') {
            out += c;
            ++i;
            continue;
        }
        auto close = tmpl.find('}', i);
        if (close == std::string::npos) {
            throw std::runtime_error("unterminated field in rewrite template: " + tmpl);
        }
        std::string field = tmpl.substr(i + 1, close - i - 1);
        bool to_end = !field.empty() && field.back() == ':';
        if (to_end) field.pop_back();

        char* endp = nullptr;
        long idx = std::strtol(field.c_str(), &endp, 10);
        if (field.empty() || *endp != '\0') {
            throw std::runtime_error("bad field '" + field + "' in rewrite template: " + tmpl);
        }

        size_t first = field_index(idx, fields.size(), tmpl);
        if (to_end) {
            std::vector<std::string> tail(fields.begin() + (long)first, fields.end());
            out += utils::join(tail, "/");
        } else {
            out += fields[first];
        }
        i = close + 1;
    }
    return out;
}

static std::string rewrite_if_matched(const std::vector<UrlRewriteRule>& rules,
                                      const std::string& url)
{
    Scheme s = scheme_of_url(url);
    for (const auto& rule : rules) {
        if (rule.scheme != s || url.find(rule.marker) == std::string::npos) continue;
        try {
            std::string patched = apply_rewrite(rule, url);
            LOG_DEBUG("rewrote " + url + " -> " + patched);
            return patched;
        } catch (const std::exception& e) {
            LOG_WARN("URL rewrite skipped for " + url + ": " + e.what());
            return url;
        }
    }
    return url;
}

std::vector<EndpointCandidate> select_endpoints(
    const std::string& raw_url_list,
    const std::vector<std::string>& priorities,
    const std::vector<UrlRewriteRule>& rules)
{
    std::vector<EndpointCandidate> out;

    std::vector<std::string> urls;
    for (auto& u : utils::split(raw_url_list, URL_LIST_DELIM)) {
        std::string t = utils::trim(u);
        if (!t.empty()) urls.push_back(t);
    }
    if (urls.empty()) return out;

    std::vector<Scheme> buckets;
    if (priorities.empty()) {
        buckets = { Scheme::HTTP, Scheme::S3 };
    } else {
        for (const auto& name : priorities) {
            Scheme s = scheme_from_name(name);
            if (s == Scheme::UNKNOWN) {
                LOG_WARN("Ignoring unknown endpoint priority: " + name);
                continue;
            }
            s = priority_bucket(s);
            bool seen = false;
            for (auto b : buckets) if (b == s) seen = true;
            if (!seen) buckets.push_back(s);
        }
    }

    for (Scheme bucket : buckets) {
        for (const auto& url : urls) {
            Scheme s = scheme_of_url(url);
            if (s == Scheme::UNKNOWN || priority_bucket(s) != bucket) continue;
            std::string final_url = rewrite_if_matched(rules, url);
            out.push_back({ scheme_of_url(final_url), final_url });
        }
    }
    return out;
}
