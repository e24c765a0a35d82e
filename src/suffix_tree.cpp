// ===================== src/suffix_tree.cpp =====================
#include "suffix_tree.hpp"
#include "diag_logger.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace ipwho
{
    namespace
    {
        std::vector<std::string> split_labels(const std::string &name)
        {
            std::vector<std::string> labels;
            std::string cur;
            for (char c : name)
            {
                if (c == '.')
                {
                    if (!cur.empty())
                        labels.push_back(cur);
                    cur.clear();
                }
                else
                {
                    cur += c;
                }
            }
            if (!cur.empty())
                labels.push_back(cur);
            return labels;
        }

        std::string to_lower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return s;
        }
    } // namespace

    void SuffixTree::addRule(const std::string &rule)
    {
        std::string text = to_lower(rule);
        const bool exception = !text.empty() && text.front() == '!';
        if (exception)
            text.erase(0, 1);

        std::vector<std::string> labels = split_labels(text);
        if (labels.empty())
            return;
        std::reverse(labels.begin(), labels.end());

        Node *node = &root_;
        for (size_t i = 0; i + 1 < labels.size(); ++i)
        {
            Entry &e = node->entries[labels[i]];
            // a leaf that gains children becomes interior; interior nodes match as rules anyway
            if (!std::holds_alternative<std::unique_ptr<Node>>(e))
                e = std::make_unique<Node>();
            node = std::get<std::unique_ptr<Node>>(e).get();
        }

        auto it = node->entries.find(labels.back());
        if (it == node->entries.end())
            node->entries.emplace(labels.back(), exception);
        else if (std::holds_alternative<bool>(it->second))
            it->second = exception;
        ++rules_;
    }

    SuffixTree SuffixTree::fromStream(std::istream &in, bool include_private)
    {
        SuffixTree tree;
        bool in_private = false;
        std::string line;
        while (std::getline(in, line))
        {
            if (line.rfind("//", 0) == 0)
            {
                if (line.find("===BEGIN PRIVATE DOMAINS===") != std::string::npos)
                    in_private = true;
                else if (line.find("===END PRIVATE DOMAINS===") != std::string::npos)
                    in_private = false;
                continue;
            }
            if (in_private && !include_private)
                continue;

            // rule is the first whitespace-delimited token
            std::istringstream iss(line);
            std::string rule;
            if (!(iss >> rule))
                continue;
            tree.addRule(rule);
        }
        return tree;
    }

    SuffixTree SuffixTree::loadFile(const std::string &path, bool include_private, DiagLogger *diag)
    {
        std::ifstream in(path);
        if (!in)
            throw std::runtime_error("cannot open public suffix list: " + path);
        SuffixTree tree = fromStream(in, include_private);
        if (tree.ruleCount() == 0)
            throw std::runtime_error("public suffix list has no rules: " + path);
        if (diag)
            diag->info("PSL loaded " + std::to_string(tree.ruleCount()) + " rules from " + path +
                       (include_private ? " (with private section)" : ""));
        return tree;
    }

    std::string registrable_domain(const std::string &host, const SuffixTree::Node &root)
    {
        using Node = SuffixTree::Node;
        static const Node empty{};

        std::vector<std::string> labels = split_labels(host);
        std::reverse(labels.begin(), labels.end());

        const Node *node = &root;
        bool in_suffix = true;
        std::vector<std::string> matched;

        for (const auto &label : labels)
        {
            if (in_suffix)
                matched.push_back(label);

            auto it = node->entries.find(label);
            if (it == node->entries.end())
                it = node->entries.find("*");
            if (it == node->entries.end())
                break;

            if (const auto *child = std::get_if<std::unique_ptr<Node>>(&it->second))
            {
                node = child->get();
                continue;
            }
            // leaf: an exception marker ends the suffix one label early
            in_suffix = !std::get<bool>(it->second);
            node = &empty;
        }

        std::string out;
        for (auto it = matched.rbegin(); it != matched.rend(); ++it)
        {
            if (!out.empty())
                out += '.';
            out += *it;
        }
        return out;
    }

    std::string SuffixTree::registrableDomain(const std::string &host) const
    {
        return registrable_domain(host, root_);
    }
} // namespace ipwho
