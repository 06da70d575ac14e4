/*
    SPDX-FileCopyrightText: 2025 Tabmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "PtyBridge.h"

namespace Tabmux
{

PtyBridge::PtyBridge(QObject *parent)
    : QObject(parent)
{
}

PtyBridge::~PtyBridge() = default;

} // namespace Tabmux

#include "moc_PtyBridge.cpp"
