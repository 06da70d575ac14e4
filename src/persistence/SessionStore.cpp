/*
    SPDX-FileCopyrightText: 2025 Tabmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionStore.h"

#include "layout/LayoutCodec.h"
#include "session/SessionManager.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QLoggingCategory>
#include <QSaveFile>

Q_LOGGING_CATEGORY(lcPersistence, "tabmux.persistence")

namespace Tabmux
{

namespace
{
void setError(QString *errorString, const QString &message)
{
    if (errorString) {
        *errorString = message;
    }
}
}

QJsonObject SessionStore::serialize(const SessionManager &manager)
{
    QJsonArray tabs;
    for (const Tab &tab : manager.tabs()) {
        tabs.append(serializeTab(tab));
    }

    QJsonObject document;
    document[QStringLiteral("version")] = FormatVersion;
    document[QStringLiteral("activeTabId")] = manager.activeTabId();
    document[QStringLiteral("nextTabNumber")] = manager.nextTabNumber();
    document[QStringLiteral("nextPaneNumber")] = manager.nextPaneNumber();
    document[QStringLiteral("tabs")] = tabs;
    return document;
}

QJsonObject SessionStore::serializeTab(const Tab &tab)
{
    QJsonArray panes;
    const auto records = tab.panes.panes();
    for (const Pane &pane : records) {
        QJsonObject object;
        object[QStringLiteral("id")] = pane.id;
        object[QStringLiteral("title")] = pane.title;
        panes.append(object);
    }

    QJsonObject object;
    object[QStringLiteral("id")] = tab.id;
    object[QStringLiteral("title")] = tab.title;
    object[QStringLiteral("activePaneId")] = tab.activePaneId;
    object[QStringLiteral("layout")] = LayoutCodec::serialize(tab.root);
    object[QStringLiteral("panes")] = panes;
    return object;
}

QByteArray SessionStore::toJson(const SessionManager &manager)
{
    return QJsonDocument(serialize(manager)).toJson(QJsonDocument::Indented);
}

bool SessionStore::deserialize(const QJsonObject &document, SessionManager &manager, QString *errorString)
{
    const int version = document.value(QStringLiteral("version")).toInt(-1);
    if (version != FormatVersion) {
        setError(errorString, QStringLiteral("unsupported session format version %1").arg(version));
        return false;
    }
    const QJsonValue tabsValue = document.value(QStringLiteral("tabs"));
    if (!tabsValue.isArray()) {
        setError(errorString, QStringLiteral("session has no tab list"));
        return false;
    }

    QList<Tab> tabs;
    const QJsonArray array = tabsValue.toArray();
    for (const QJsonValue &value : array) {
        Tab tab;
        if (!value.isObject() || !deserializeTab(value.toObject(), tab)) {
            qCWarning(lcPersistence) << "dropping unreadable tab" << value;
            continue;
        }
        tabs.append(tab);
    }

    manager.restore(tabs,
                    document.value(QStringLiteral("activeTabId")).toInt(-1),
                    document.value(QStringLiteral("nextTabNumber")).toInt(1),
                    document.value(QStringLiteral("nextPaneNumber")).toInt(1));
    return true;
}

bool SessionStore::deserializeTab(const QJsonObject &object, Tab &tab)
{
    tab.id = object.value(QStringLiteral("id")).toInt(-1);
    tab.title = object.value(QStringLiteral("title")).toString();
    tab.activePaneId = object.value(QStringLiteral("activePaneId")).toInt(-1);

    const std::optional<LayoutNodePtr> root = LayoutCodec::parse(object.value(QStringLiteral("layout")).toString());
    if (!root.has_value()) {
        qCWarning(lcPersistence) << "tab" << tab.id << "has an invalid layout";
        return false;
    }
    tab.root = root.value();

    const QJsonArray panes = object.value(QStringLiteral("panes")).toArray();
    for (const QJsonValue &value : panes) {
        const QJsonObject paneObject = value.toObject();
        Pane pane;
        pane.id = paneObject.value(QStringLiteral("id")).toInt(-1);
        pane.title = paneObject.value(QStringLiteral("title")).toString();
        if (pane.id <= 0 || pane.id > SessionManager::MaxId || tab.panes.contains(pane.id)) {
            return false;
        }
        tab.panes.insert(pane);
    }

    if (!SessionManager::isConsistent(tab)) {
        qCWarning(lcPersistence) << "tab" << tab.id << "does not match its layout";
        return false;
    }
    return true;
}

bool SessionStore::fromJson(const QByteArray &json, SessionManager &manager, QString *errorString)
{
    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        setError(errorString, parseError.errorString());
        return false;
    }
    if (!document.isObject()) {
        setError(errorString, QStringLiteral("session document is not an object"));
        return false;
    }
    return deserialize(document.object(), manager, errorString);
}

bool SessionStore::save(const QString &fileName, const SessionManager &manager, QString *errorString)
{
    const QFileInfo info(fileName);
    if (!QDir().mkpath(info.absolutePath())) {
        setError(errorString, QStringLiteral("cannot create directory %1").arg(info.absolutePath()));
        return false;
    }

    QSaveFile file(fileName);
    if (!file.open(QIODevice::WriteOnly)) {
        setError(errorString, file.errorString());
        return false;
    }
    file.write(toJson(manager));
    if (!file.commit()) {
        setError(errorString, file.errorString());
        return false;
    }

    qCDebug(lcPersistence) << "saved" << manager.tabs().size() << "tabs to" << fileName;
    return true;
}

bool SessionStore::load(const QString &fileName, SessionManager &manager, QString *errorString)
{
    QFile file(fileName);
    if (!file.open(QIODevice::ReadOnly)) {
        setError(errorString, file.errorString());
        return false;
    }

    if (!fromJson(file.readAll(), manager, errorString)) {
        qCWarning(lcPersistence) << "cannot restore session from" << fileName;
        return false;
    }
    return true;
}

} // namespace Tabmux
