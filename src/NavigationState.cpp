/************************************************************************\

    Gdman - Google Drive manager
    Copyright (C) 2026 Jango73

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.

\************************************************************************/

#include "NavigationState.h"

#include <QCoreApplication>

#include "DriveEntry.h"
#include "Logging.h"

NavigationState::NavigationState()
    : m_currentFolderId(DriveEntry::rootFolderId())
    , m_currentFolderName(rootFolderName())
{
}

QString NavigationState::currentFolderId() const
{
    return m_currentFolderId;
}

QString NavigationState::currentFolderName() const
{
    return m_currentFolderName;
}

QVector<NavigationState::Location> NavigationState::history() const
{
    return m_history;
}

bool NavigationState::canGoBack() const
{
    return !m_history.isEmpty();
}

bool NavigationState::isAtRoot() const
{
    return m_currentFolderId == DriveEntry::rootFolderId();
}

void NavigationState::navigateInto(const QString &folderId, const QString &folderName)
{
    m_history.append(qMakePair(m_currentFolderId, m_currentFolderName));
    m_currentFolderId = folderId;
    m_currentFolderName = folderName;
    qCDebug(lcNavigation) << "Entered" << folderId << "depth" << m_history.size();
}

bool NavigationState::goBack()
{
    if (m_history.isEmpty()) {
        return false;
    }
    const Location previous = m_history.takeLast();
    m_currentFolderId = previous.first;
    m_currentFolderName = previous.second;
    qCDebug(lcNavigation) << "Back to" << m_currentFolderId << "depth" << m_history.size();
    return true;
}

void NavigationState::goHome()
{
    m_history.clear();
    m_currentFolderId = DriveEntry::rootFolderId();
    m_currentFolderName = rootFolderName();
}

QString NavigationState::rootFolderName()
{
    return QCoreApplication::translate("NavigationState", "Root");
}
