/*
    SPDX-FileCopyrightText: 2025 Tabmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef LAYOUTTREE_H
#define LAYOUTTREE_H

#include <QList>

#include <memory>

#include "tabmuxprivate_export.h"

namespace Tabmux
{

// Vertical places the two children side by side, Horizontal stacks them.
enum class SplitDirection { Horizontal, Vertical };

enum class LayoutNodeType { Leaf, Split };

struct LayoutNode;
using LayoutNodePtr = std::shared_ptr<const LayoutNode>;

/**
 * One node of a tab's split tree.  Nodes are never modified once built;
 * every tree operation returns a new root that shares the untouched
 * subtrees with its input.
 */
struct LayoutNode {
    LayoutNodeType type = LayoutNodeType::Leaf;
    int paneId = -1; // leaf only
    SplitDirection direction = SplitDirection::Horizontal; // split only
    double ratio = 0.5; // split only, share of the first child
    LayoutNodePtr a; // split only
    LayoutNodePtr b; // split only

    bool isLeaf() const
    {
        return type == LayoutNodeType::Leaf;
    }
};

class TABMUXPRIVATE_EXPORT LayoutTree
{
public:
    static constexpr double DefaultRatio = 0.5;

    static LayoutNodePtr leaf(int paneId);
    static LayoutNodePtr makeSplit(SplitDirection direction, double ratio, LayoutNodePtr a, LayoutNodePtr b);

    /**
     * Replaces the leaf @p targetPaneId with a split holding the original
     * leaf first and a new leaf @p newPaneId second.  Returns @p tree
     * itself when the target is not part of the tree.
     */
    static LayoutNodePtr split(const LayoutNodePtr &tree, int targetPaneId, int newPaneId, SplitDirection direction);

    /**
     * Removes the leaf @p paneId; the split that held it is replaced by the
     * surviving sibling.  Returns nullptr when the leaf is not found or when
     * it is the only leaf of the tree.
     */
    static LayoutNodePtr removeLeaf(const LayoutNodePtr &tree, int paneId);

    static int countLeaves(const LayoutNodePtr &tree);
    static int firstLeaf(const LayoutNodePtr &tree);
    static bool containsLeaf(const LayoutNodePtr &tree, int paneId);
    static QList<int> leafIds(const LayoutNodePtr &tree);

    static bool structurallyEqual(const LayoutNodePtr &lhs, const LayoutNodePtr &rhs);

private:
    static LayoutNodePtr splitLeaf(const LayoutNodePtr &node, int targetPaneId, int newPaneId, SplitDirection direction);
    static LayoutNodePtr removeFromNode(const LayoutNodePtr &node, int paneId, bool &found);
    static LayoutNodePtr withChildren(const LayoutNodePtr &split, LayoutNodePtr a, LayoutNodePtr b);
    static void collectLeafIds(const LayoutNodePtr &node, QList<int> &ids);
};

} // namespace Tabmux

#endif // LAYOUTTREE_H
