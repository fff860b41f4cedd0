#pragma once
#include <unordered_map>
#include <string>
#include <filesystem>
#include <memory>

namespace code_atlas {

enum PathFlag : uint8_t {
    NONE = 0,
    IGNORE = 1 << 0,  // 0x01
    INCLUDE = 1 << 1  // 0x02 (Overrides IGNORE)
};

// Segment trie over project-relative paths carrying ignore/include rules.
class PrefixTrie {
    struct Node {
        std::unordered_map<std::string, std::unique_ptr<Node>> children;
        uint8_t flags = PathFlag::NONE;
        bool subtree_has_include = false;
    };

    std::unique_ptr<Node> root;

public:
    PrefixTrie() : root(std::make_unique<Node>()) {}

    // O(L) Insertion
    void insert(const std::string& path, PathFlag flag) {
        Node* current = root.get();
        std::filesystem::path p = std::filesystem::path(path).lexically_normal();

        for (const auto& part : p) {
            std::string segment = part.string();
            if (segment == "." || segment.empty()) continue;
            if (flag == PathFlag::INCLUDE) current->subtree_has_include = true;

            auto& child = current->children[segment];
            if (!child) child = std::make_unique<Node>();
            current = child.get();
        }
        current->flags |= flag;
    }

    // O(L) Lookup - the deepest rule on the path wins; INCLUDE beats IGNORE at the same depth.
    uint8_t check(const std::filesystem::path& path) const {
        const Node* current = root.get();
        uint8_t accumulated_flags = PathFlag::NONE;

        for (const auto& part : path) {
            std::string segment = part.string();
            if (segment == "." || segment.empty()) continue;

            auto it = current->children.find(segment);
            if (it == current->children.end()) break;
            current = it->second.get();

            if (current->flags != PathFlag::NONE) {
                accumulated_flags = current->flags;
            }
        }
        return accumulated_flags;
    }

    bool is_ignored(const std::filesystem::path& path) const {
        uint8_t flags = check(path);
        return (flags & PathFlag::IGNORE) && !(flags & PathFlag::INCLUDE);
    }

    // True when an INCLUDE rule sits strictly below `path`, i.e. the
    // directory has to be entered to reach an exception.
    bool leads_to_include(const std::filesystem::path& path) const {
        const Node* current = root.get();
        for (const auto& part : path) {
            std::string segment = part.string();
            if (segment == "." || segment.empty()) continue;
            auto it = current->children.find(segment);
            if (it == current->children.end()) return false;
            current = it->second.get();
        }
        return current->subtree_has_include;
    }

    bool empty() const { return root->children.empty(); }

    void clear() {
        root = std::make_unique<Node>();
    }
};

}
