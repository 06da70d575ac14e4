/*
    SPDX-FileCopyrightText: 2025 Tabmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONSTORE_H
#define SESSIONSTORE_H

#include <QByteArray>
#include <QJsonObject>
#include <QString>

#include "tabmuxprivate_export.h"

namespace Tabmux
{

class SessionManager;
struct Tab;

/**
 * Reads and writes the session as a JSON document.
 *
 * Only tab and pane identities, titles and layouts are stored; process
 * handles never are, so every restored pane starts without a process.
 */
class TABMUXPRIVATE_EXPORT SessionStore
{
public:
    static constexpr int FormatVersion = 1;

    static QJsonObject serialize(const SessionManager &manager);
    static QByteArray toJson(const SessionManager &manager);

    /**
     * Replaces the state of @p manager with the one in @p document.
     * Tabs that cannot be reconstructed are dropped.  When the document
     * as a whole is unusable the manager is left untouched, false is
     * returned and @p errorString says why.
     */
    static bool deserialize(const QJsonObject &document, SessionManager &manager, QString *errorString = nullptr);
    static bool fromJson(const QByteArray &json, SessionManager &manager, QString *errorString = nullptr);

    static bool save(const QString &fileName, const SessionManager &manager, QString *errorString = nullptr);
    static bool load(const QString &fileName, SessionManager &manager, QString *errorString = nullptr);

private:
    static QJsonObject serializeTab(const Tab &tab);
    static bool deserializeTab(const QJsonObject &object, Tab &tab);
};

} // namespace Tabmux

#endif // SESSIONSTORE_H
