#pragma once

#include "rule.hpp"
#include <string>
#include <unordered_map>
#include <memory>
#include <vector>

namespace dnsgate {

// Trie 节点
struct TrieNode {
    std::unordered_map<std::string, std::unique_ptr<TrieNode>> children;
    std::vector<const Rule*> exact_rules;     // 精确匹配规则 (插入顺序)
    std::vector<const Rule*> wildcard_rules;  // 通配符规则, 只匹配严格子域名

    TrieNode() = default;
};

// 一次查找的候选集合
struct TrieMatch {
    const std::vector<const Rule*>* exact = nullptr;
    // 后缀从长到短
    std::vector<const std::vector<const Rule*>*> wildcards;
};

// 域名 Trie - 随快照一次性构建, 之后只读, 读取无需加锁
//
// 规则指针指向快照拥有的规则数组, 生命期与快照一致.
class DomainTrie {
public:
    DomainTrie();
    ~DomainTrie() = default;

    // 禁止拷贝
    DomainTrie(const DomainTrie&) = delete;
    DomainTrie& operator=(const DomainTrie&) = delete;

    // 插入规则 (模式已规范化)
    void insert(const Rule* rule);

    // 收集与域名匹配的候选, 不考虑启用状态与时间窗
    void lookup(const char* domain, size_t domain_len, TrieMatch* out) const;
    void lookup(const std::string& domain, TrieMatch* out) const;

    // 将域名分割为标签并反转
    static std::vector<std::string> splitAndReverse(const char* domain, size_t len);

private:
    std::unique_ptr<TrieNode> root_;
};

} // namespace dnsgate
