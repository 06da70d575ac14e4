/*
    SPDX-FileCopyrightText: 2025 Tabmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef LAYOUTCODEC_H
#define LAYOUTCODEC_H

#include <QByteArray>
#include <QString>

#include <optional>

#include "LayoutTree.h"
#include "tabmuxprivate_export.h"

namespace Tabmux
{

/**
 * Text form of a split tree, modelled on tmux's window layout strings:
 *
 *   "<4 hex digit checksum>,<node>"
 *   node  := <paneId> | '{' <ratio> ':' node ',' node '}' | '[' <ratio> ':' node ',' node ']'
 *
 * '{' is a vertical split (children side by side), '[' a horizontal split
 * (children stacked).  The checksum is tmux's layout checksum of the body.
 */
class TABMUXPRIVATE_EXPORT LayoutCodec
{
public:
    static std::optional<LayoutNodePtr> parse(const QString &layoutString);
    static QString serialize(const LayoutNodePtr &root);
    static uint16_t checksum(const QByteArray &body);

    // Deepest split nesting parse() accepts
    static constexpr int MaxDepth = 256;

private:
    static LayoutNodePtr parseNode(const QString &s, int &pos, int depth);
    static bool parseInt(const QString &s, int &pos, int &value);
    static bool parseRatio(const QString &s, int &pos, double &ratio);
    static void serializeNode(const LayoutNodePtr &node, QString &output);
};

} // namespace Tabmux

#endif // LAYOUTCODEC_H
