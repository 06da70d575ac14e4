/*
    SPDX-FileCopyrightText: 2025 Tabmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "LayoutTree.h"

#include <QtGlobal>

namespace Tabmux
{

LayoutNodePtr LayoutTree::leaf(int paneId)
{
    auto node = std::make_shared<LayoutNode>();
    node->type = LayoutNodeType::Leaf;
    node->paneId = paneId;
    return node;
}

LayoutNodePtr LayoutTree::makeSplit(SplitDirection direction, double ratio, LayoutNodePtr a, LayoutNodePtr b)
{
    auto node = std::make_shared<LayoutNode>();
    node->type = LayoutNodeType::Split;
    node->direction = direction;
    node->ratio = ratio;
    node->a = std::move(a);
    node->b = std::move(b);
    return node;
}

LayoutNodePtr LayoutTree::withChildren(const LayoutNodePtr &split, LayoutNodePtr a, LayoutNodePtr b)
{
    return makeSplit(split->direction, split->ratio, std::move(a), std::move(b));
}

LayoutNodePtr LayoutTree::split(const LayoutNodePtr &tree, int targetPaneId, int newPaneId, SplitDirection direction)
{
    if (!tree) {
        return tree;
    }

    LayoutNodePtr replaced = splitLeaf(tree, targetPaneId, newPaneId, direction);
    if (!replaced) {
        return tree;
    }
    return replaced;
}

// Rebuilds the path from node down to the target leaf; returns nullptr when
// the target is not below node.
LayoutNodePtr LayoutTree::splitLeaf(const LayoutNodePtr &node, int targetPaneId, int newPaneId, SplitDirection direction)
{
    if (node->isLeaf()) {
        if (node->paneId != targetPaneId) {
            return nullptr;
        }
        return makeSplit(direction, DefaultRatio, node, leaf(newPaneId));
    }

    LayoutNodePtr replacedA = splitLeaf(node->a, targetPaneId, newPaneId, direction);
    if (replacedA) {
        return withChildren(node, replacedA, node->b);
    }

    LayoutNodePtr replacedB = splitLeaf(node->b, targetPaneId, newPaneId, direction);
    if (replacedB) {
        return withChildren(node, node->a, replacedB);
    }

    return nullptr;
}

LayoutNodePtr LayoutTree::removeLeaf(const LayoutNodePtr &tree, int paneId)
{
    if (!tree) {
        return nullptr;
    }

    bool found = false;
    LayoutNodePtr result = removeFromNode(tree, paneId, found);
    if (!found) {
        return nullptr;
    }
    return result;
}

LayoutNodePtr LayoutTree::removeFromNode(const LayoutNodePtr &node, int paneId, bool &found)
{
    if (node->isLeaf()) {
        if (node->paneId == paneId) {
            found = true;
            return nullptr;
        }
        return node;
    }

    // Collapse the split into the surviving sibling
    if (node->a->isLeaf() && node->a->paneId == paneId) {
        found = true;
        return node->b;
    }
    if (node->b->isLeaf() && node->b->paneId == paneId) {
        found = true;
        return node->a;
    }

    LayoutNodePtr newA = removeFromNode(node->a, paneId, found);
    if (found) {
        return newA ? withChildren(node, newA, node->b) : node->b;
    }

    LayoutNodePtr newB = removeFromNode(node->b, paneId, found);
    if (found) {
        return newB ? withChildren(node, node->a, newB) : node->a;
    }

    return node;
}

int LayoutTree::countLeaves(const LayoutNodePtr &tree)
{
    if (!tree) {
        return 0;
    }
    if (tree->isLeaf()) {
        return 1;
    }
    return countLeaves(tree->a) + countLeaves(tree->b);
}

int LayoutTree::firstLeaf(const LayoutNodePtr &tree)
{
    LayoutNodePtr node = tree;
    while (node && !node->isLeaf()) {
        node = node->a;
    }
    return node ? node->paneId : -1;
}

bool LayoutTree::containsLeaf(const LayoutNodePtr &tree, int paneId)
{
    if (!tree) {
        return false;
    }
    if (tree->isLeaf()) {
        return tree->paneId == paneId;
    }
    return containsLeaf(tree->a, paneId) || containsLeaf(tree->b, paneId);
}

QList<int> LayoutTree::leafIds(const LayoutNodePtr &tree)
{
    QList<int> ids;
    collectLeafIds(tree, ids);
    return ids;
}

void LayoutTree::collectLeafIds(const LayoutNodePtr &node, QList<int> &ids)
{
    if (!node) {
        return;
    }
    if (node->isLeaf()) {
        ids.append(node->paneId);
        return;
    }
    collectLeafIds(node->a, ids);
    collectLeafIds(node->b, ids);
}

bool LayoutTree::structurallyEqual(const LayoutNodePtr &lhs, const LayoutNodePtr &rhs)
{
    if (lhs == rhs) {
        return true;
    }
    if (!lhs || !rhs || lhs->type != rhs->type) {
        return false;
    }
    if (lhs->isLeaf()) {
        return lhs->paneId == rhs->paneId;
    }
    return lhs->direction == rhs->direction && qFuzzyCompare(lhs->ratio, rhs->ratio) && structurallyEqual(lhs->a, rhs->a)
        && structurallyEqual(lhs->b, rhs->b);
}

} // namespace Tabmux
