// ===================== include/suffix_tree.hpp =====================
#pragma once
#include <cstddef>
#include <istream>
#include <map>
#include <memory>
#include <string>
#include <variant>

namespace ipwho
{
    class DiagLogger;

    // Public-suffix rules as a label tree keyed from the TLD inwards.
    // Each label maps to an interior node or to a leaf marker, where the
    // marker is true for an exception ("!") rule. "*" is an ordinary label.
    class SuffixTree
    {
    public:
        struct Node;
        using Entry = std::variant<std::unique_ptr<Node>, bool>;
        struct Node
        {
            std::map<std::string, Entry> entries;
        };

        SuffixTree() = default;
        SuffixTree(SuffixTree &&) = default;
        SuffixTree &operator=(SuffixTree &&) = default;

        // One rule in list syntax: "com", "co.uk", "*.ck", "!www.ck".
        void addRule(const std::string &rule);

        // Reads public_suffix_list.dat. Private-section rules are skipped unless asked for.
        static SuffixTree fromStream(std::istream &in, bool include_private = false);
        // Throws std::runtime_error if the file is missing or holds no rules.
        static SuffixTree loadFile(const std::string &path, bool include_private = false,
                                   DiagLogger *diag = nullptr);

        // Public suffix plus one label, e.g. "a.b.example.co.uk" -> "example.co.uk".
        // host must already be lowercase.
        std::string registrableDomain(const std::string &host) const;

        const Node &root() const { return root_; }
        std::size_t ruleCount() const { return rules_; }

    private:
        Node root_;
        std::size_t rules_ = 0;
    };

    std::string registrable_domain(const std::string &host, const SuffixTree::Node &root);
} // namespace ipwho
