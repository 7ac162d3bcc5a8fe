#include "Arn.h"
#include "Errors.h"

namespace cloud_audit {

static std::vector<std::string> split_keep_empty(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::string cur;
    for(char c : s) {
        if(c == sep) { out.push_back(cur); cur.clear(); }
        else cur.push_back(c);
    }
    out.push_back(cur);
    return out;
}

// Same field layout as Aws::Utils::ARN in aws-cpp-sdk-core, kept here so the
// core library builds without the SDK.
Arn Arn::parse(const std::string& text) {
    auto fields = split_keep_empty(text, ':');
    if(fields.size() < 6 || fields[0] != "arn") throw MalformedIdentifier(text);
    Arn a;
    a.text_ = text;
    a.partition_ = fields[1];
    a.service_ = fields[2];
    a.region_ = fields[3];
    a.account_id_ = fields[4];
    a.resource_ = fields[5];
    for(size_t i = 6; i < fields.size(); ++i) a.resource_ += ":" + fields[i];
    return a;
}

bool Arn::is_valid(const std::string& text) {
    try {
        parse(text);
        return true;
    } catch(const MalformedIdentifier&) {
        return false;
    }
}

std::string Arn::resource_type() const {
    auto pos = resource_.find_first_of("/:");
    return pos == std::string::npos ? resource_ : resource_.substr(0, pos);
}

bool ScopeFilter::is_included(const std::string& candidate_arn) const {
    if(candidate_arn.empty()) return false;
    for(const auto& a : arns_) {
        if(a.empty()) continue;
        if(a == candidate_arn) return true;
        if(candidate_arn.size() > a.size() && candidate_arn.compare(0, a.size(), a) == 0) {
            char next = candidate_arn[a.size()];
            if(next == '/' || next == ':') return true;
        }
    }
    return false;
}

}
