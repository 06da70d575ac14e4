/*
    SPDX-FileCopyrightText: 2025 Tabmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "LayoutCodec.h"

#include <QLocale>
#include <QLoggingCategory>

#include <limits>

Q_LOGGING_CATEGORY(lcLayout, "tabmux.layout")

namespace Tabmux
{

std::optional<LayoutNodePtr> LayoutCodec::parse(const QString &layoutString)
{
    // "a1b2," followed by at least one body character
    if (layoutString.length() < 6 || layoutString[4] != QLatin1Char(',')) {
        return std::nullopt;
    }

    bool ok = false;
    const uint expected = layoutString.left(4).toUInt(&ok, 16);
    if (!ok) {
        return std::nullopt;
    }

    const QString body = layoutString.mid(5);
    if (checksum(body.toLatin1()) != expected) {
        qCDebug(lcLayout) << "layout checksum mismatch:" << layoutString;
        return std::nullopt;
    }

    int pos = 0;
    LayoutNodePtr root = parseNode(body, pos, 0);
    if (!root || pos != body.length()) {
        return std::nullopt;
    }
    return root;
}

bool LayoutCodec::parseInt(const QString &s, int &pos, int &value)
{
    if (pos >= s.length() || !s[pos].isDigit()) {
        return false;
    }
    qint64 result = 0;
    while (pos < s.length() && s[pos].isDigit()) {
        result = result * 10 + (s[pos].unicode() - '0');
        if (result > std::numeric_limits<int>::max()) {
            return false;
        }
        pos++;
    }
    value = static_cast<int>(result);
    return true;
}

bool LayoutCodec::parseRatio(const QString &s, int &pos, double &ratio)
{
    const int start = pos;
    while (pos < s.length() && (s[pos].isDigit() || s[pos] == QLatin1Char('.'))) {
        pos++;
    }
    if (pos == start) {
        return false;
    }

    bool ok = false;
    ratio = s.mid(start, pos - start).toDouble(&ok);
    return ok && ratio > 0.0 && ratio < 1.0;
}

LayoutNodePtr LayoutCodec::parseNode(const QString &s, int &pos, int depth)
{
    if (pos >= s.length()) {
        return nullptr;
    }

    const QChar open = s[pos];
    if (open.isDigit()) {
        int paneId = 0;
        if (!parseInt(s, pos, paneId) || paneId <= 0) {
            return nullptr;
        }
        return LayoutTree::leaf(paneId);
    }

    QChar close;
    SplitDirection direction = SplitDirection::Horizontal;
    if (open == QLatin1Char('{')) {
        direction = SplitDirection::Vertical;
        close = QLatin1Char('}');
    } else if (open == QLatin1Char('[')) {
        direction = SplitDirection::Horizontal;
        close = QLatin1Char(']');
    } else {
        return nullptr;
    }
    if (depth >= MaxDepth) {
        qCDebug(lcLayout) << "layout nested deeper than" << MaxDepth << "splits";
        return nullptr;
    }
    pos++; // skip opening bracket

    double ratio = 0.0;
    if (!parseRatio(s, pos, ratio)) {
        return nullptr;
    }
    if (pos >= s.length() || s[pos] != QLatin1Char(':')) {
        return nullptr;
    }
    pos++; // skip ':'

    LayoutNodePtr a = parseNode(s, pos, depth + 1);
    if (!a) {
        return nullptr;
    }
    if (pos >= s.length() || s[pos] != QLatin1Char(',')) {
        return nullptr;
    }
    pos++; // skip ','

    LayoutNodePtr b = parseNode(s, pos, depth + 1);
    if (!b) {
        return nullptr;
    }
    if (pos >= s.length() || s[pos] != close) {
        return nullptr;
    }
    pos++; // skip closing bracket

    return LayoutTree::makeSplit(direction, ratio, std::move(a), std::move(b));
}

QString LayoutCodec::serialize(const LayoutNodePtr &root)
{
    QString body;
    serializeNode(root, body);
    const uint16_t csum = checksum(body.toLatin1());
    return QStringLiteral("%1,").arg(csum, 4, 16, QLatin1Char('0')) + body;
}

void LayoutCodec::serializeNode(const LayoutNodePtr &node, QString &output)
{
    if (!node) {
        return;
    }
    if (node->isLeaf()) {
        output += QString::number(node->paneId);
        return;
    }

    const bool vertical = node->direction == SplitDirection::Vertical;
    output += vertical ? QLatin1Char('{') : QLatin1Char('[');
    output += QString::number(node->ratio, 'f', QLocale::FloatingPointShortest);
    output += QLatin1Char(':');
    serializeNode(node->a, output);
    output += QLatin1Char(',');
    serializeNode(node->b, output);
    output += vertical ? QLatin1Char('}') : QLatin1Char(']');
}

uint16_t LayoutCodec::checksum(const QByteArray &body)
{
    uint16_t csum = 0;
    for (char c : body) {
        csum = (csum >> 1) + ((csum & 1) << 15);
        csum += static_cast<unsigned char>(c);
    }
    return csum;
}

} // namespace Tabmux
