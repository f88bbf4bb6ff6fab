#ifndef DIRGROUPER_HPP
#define DIRGROUPER_HPP

#include "direntry.hpp"
#include "fingerprint.hpp"
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @brief Groups sibling directories that share a structural signature
 *
 * Groups appear in the order their signature is first seen among the
 * siblings, and members keep their sibling order. The partition is always
 * complete; limiting how many members get expanded is up to the caller.
 *
 * Example usage:
 * @code
 * for (const auto& group : DirGrouper::groupIdentical(node.children)) {
 *     std::cout << group.signature << ": " << group.members.size() << "\n";
 * }
 * @endcode
 */
class DirGrouper {
public:
    struct DirGroup {
        std::string signature;
        std::vector<const DirectoryNode*> members;
    };

    /**
     * @brief Partition siblings by signature equality
     * @param siblings Directories in display order (not modified)
     * @return Groups in first-seen order; pointers refer into @p siblings
     */
    static std::vector<DirGroup> groupIdentical(const std::vector<DirectoryNode>& siblings) {
        std::unordered_map<std::string, std::size_t> groupIndex;
        std::vector<DirGroup> groups;

        for (const auto& dir : siblings) {
            std::string sig = dir.signature;
            if (sig.empty()) {
                sig = Fingerprint::fallback(dir.name, dir.depth);
            }

            auto it = groupIndex.find(sig);
            if (it == groupIndex.end()) {
                groupIndex.emplace(sig, groups.size());
                groups.push_back(DirGroup{sig, {&dir}});
            } else {
                groups[it->second].members.push_back(&dir);
            }
        }

        return groups;
    }
};

#endif // DIRGROUPER_HPP
