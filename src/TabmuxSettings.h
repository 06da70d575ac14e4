/*
    SPDX-FileCopyrightText: 2025 Tabmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TABMUXSETTINGS_H
#define TABMUXSETTINGS_H

#include <QString>

#include "tabmuxprivate_export.h"

class QSettings;

namespace Tabmux
{

struct TABMUXPRIVATE_EXPORT TabmuxSettings {
    QString shell;
    QString initialCommand; // written to every new process, empty for none
    int defaultColumns = 80;
    int defaultLines = 24;
    int resizeDebounceMs = 50;
    QString stateFile;

    static TabmuxSettings defaults();

    // Missing keys keep their defaults, out of range values are clamped
    static TabmuxSettings load(QSettings &settings);
    void save(QSettings &settings) const;
};

} // namespace Tabmux

#endif // TABMUXSETTINGS_H
