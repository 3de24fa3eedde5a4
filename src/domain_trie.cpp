#include "dnsgate/domain_trie.hpp"
#include <algorithm>

namespace dnsgate {

// ==================== DomainTrie ====================

DomainTrie::DomainTrie()
    : root_(std::make_unique<TrieNode>()) {}

void DomainTrie::insert(const Rule* rule) {
    if (!rule) return;

    const std::string& suffix = rule->suffix();
    auto labels = splitAndReverse(suffix.c_str(), suffix.size());
    if (labels.empty()) return;

    TrieNode* node = root_.get();
    for (const auto& label : labels) {
        auto& child = node->children[label];
        if (!child) {
            child = std::make_unique<TrieNode>();
        }
        node = child.get();
    }

    if (rule->isWildcard()) {
        node->wildcard_rules.push_back(rule);
    } else {
        node->exact_rules.push_back(rule);
    }
}

void DomainTrie::lookup(const char* domain, size_t domain_len, TrieMatch* out) const {
    out->exact = nullptr;
    out->wildcards.clear();
    if (!domain || domain_len == 0) return;

    std::string dom(domain, domain_len);
    std::transform(dom.begin(), dom.end(), dom.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });

    auto labels = splitAndReverse(dom.c_str(), dom.size());
    if (labels.empty()) return;

    const TrieNode* node = root_.get();
    for (const auto& label : labels) {
        // 当前节点还有下级标签, 其通配符规则适用
        if (!node->wildcard_rules.empty()) {
            out->wildcards.push_back(&node->wildcard_rules);
        }

        auto it = node->children.find(label);
        if (it == node->children.end()) {
            node = nullptr;
            break;
        }
        node = it->second.get();
    }

    // 完整走完所有标签才可能精确匹配; 最终节点的通配符不匹配其自身
    if (node && !node->exact_rules.empty()) {
        out->exact = &node->exact_rules;
    }

    // 越深的节点后缀越长
    std::reverse(out->wildcards.begin(), out->wildcards.end());
}

void DomainTrie::lookup(const std::string& domain, TrieMatch* out) const {
    lookup(domain.c_str(), domain.size(), out);
}

std::vector<std::string> DomainTrie::splitAndReverse(const char* domain, size_t len) {
    std::vector<std::string> labels;
    std::string current;

    for (size_t i = 0; i < len; i++) {
        if (domain[i] == '.') {
            if (!current.empty()) {
                labels.push_back(std::move(current));
                current.clear();
            }
        } else {
            current += domain[i];
        }
    }

    if (!current.empty()) {
        labels.push_back(std::move(current));
    }

    // 反转
    std::reverse(labels.begin(), labels.end());
    return labels;
}

} // namespace dnsgate
