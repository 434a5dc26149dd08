#pragma once

// ============================================================
// endpoint_selector.hpp -- Rank candidate source URLs by scheme
// ============================================================

#include "transfer_types.hpp"
#include <string>
#include <vector>

// Data-driven URL patch: when a URL of `scheme` contains `marker`, it is
// rebuilt from `url_template`. Template fields refer to the URL split on '/':
//   {N}   field N (negative N counts from the end)
//   {N:}  fields N..end joined with '/'
// e.g. "s3://b/HMDEMO/x/y/a/b/c/d" with "s3://{2}/DEMO/{4}/{-4:}"
//   -> "s3://b/DEMO/x/a/b/c/d"
struct UrlRewriteRule {
    Scheme      scheme{Scheme::UNKNOWN};
    std::string marker;
    std::string url_template;
};

// Built-in table: relocates demo-dataset objects on S3 to the nested
// DEMO/<collection>/... layout. Provisional until the upstream data is fixed.
std::vector<UrlRewriteRule> default_rewrite_rules();

// Rule file: one rule per line, "scheme<TAB>marker<TAB>template"; '#' comments.
// Throws std::runtime_error on a missing file or malformed line.
std::vector<UrlRewriteRule> load_rewrite_rules(const std::string& path);

// Apply one rule's template to url; throws std::runtime_error if the template
// is malformed or references a field the URL does not have
std::string apply_rewrite(const UrlRewriteRule& rule, const std::string& url);

// Split a comma-joined URL list, then emit candidates bucket by bucket in
// priority order, keeping manifest order within a bucket. An empty priority
// list means HTTP then S3; HTTPS ranks with HTTP. URLs whose scheme is not
// named by any priority are dropped. The first matching rewrite rule is
// applied to each emitted URL.
std::vector<EndpointCandidate> select_endpoints(
    const std::string& raw_url_list,
    const std::vector<std::string>& priorities,
    const std::vector<UrlRewriteRule>& rules = {});
