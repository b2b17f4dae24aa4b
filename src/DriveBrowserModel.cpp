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

#include "DriveBrowserModel.h"

#include <QDir>
#include <QFileInfo>
#include <QFutureWatcher>
#include <QThread>
#include <QtConcurrent>

#include "AppSettings.h"
#include "CancellableOperation.h"
#include "FolderUploadPlan.h"
#include "FormatUtils.h"
#include "LocalFileUtils.h"
#include "Logging.h"
#include "OperationRunner.h"
#include "RemoteStorageService.h"

using DriveOperations::BatchKind;

namespace {

struct DriveBrowserConstants {
    static constexpr int emptyCount = 0;
    static constexpr qreal zeroPercent = 0.0;
    static constexpr qint64 msPerSecond = 1000;
};

struct ListingResult {
    QVector<DriveEntry> entries;
    RemoteError error;
};

struct FolderResult {
    QString id;
    RemoteError error;
};

struct InfoResult {
    DriveEntry entry;
    RemoteError error;
};

QVariantMap failure(const QString &error)
{
    QVariantMap result;
    result.insert("ok", false);
    result.insert("error", error);
    return result;
}

} // namespace

/**
 * @brief Creates the browser over an injected remote service.
 * @param service Remote service used by every background call; must outlive the model.
 * @param settings Application settings, may be null in tests.
 * @param parent Parent QObject for ownership.
 */
DriveBrowserModel::DriveBrowserModel(RemoteStorageService *service, AppSettings *settings, QObject *parent)
    : QAbstractListModel(parent)
    , m_service(service)
    , m_settings(settings)
    , m_itemCountText(FormatUtils::itemCountText(DriveBrowserConstants::emptyCount, DriveBrowserConstants::emptyCount))
    , m_statusText(tr("Not connected"))
{
}

/**
 * @brief Stops background work before the service can go away.
 *
 * A running batch is cancelled and its current item is allowed to finish.
 * One-shot calls still running on the model's pool are waited for.
 */
DriveBrowserModel::~DriveBrowserModel()
{
    if (m_operation) {
        m_operation->requestCancel();
    }
    if (m_operationThread) {
        // The runner finishes its current item before the thread can stop.
        m_operationThread->quit();
        m_operationThread->wait();
    }
    delete m_operationRunner;
    m_pool.waitForDone();
}

QString DriveBrowserModel::currentFolderId() const
{
    return m_navigation.currentFolderId();
}

QString DriveBrowserModel::currentFolderName() const
{
    return m_navigation.currentFolderName();
}

bool DriveBrowserModel::canGoBack() const
{
    return m_navigation.canGoBack();
}

bool DriveBrowserModel::loading() const
{
    return m_loading;
}

bool DriveBrowserModel::connected() const
{
    return m_connected;
}

QString DriveBrowserModel::statusText() const
{
    return m_statusText;
}

QString DriveBrowserModel::itemCountText() const
{
    return m_itemCountText;
}

int DriveBrowserModel::selectedCount() const
{
    return m_selectedIds.size();
}

bool DriveBrowserModel::operationInProgress() const
{
    return m_operation != nullptr;
}

QString DriveBrowserModel::operationTitle() const
{
    return m_operation ? m_operation->title() : QString();
}

QString DriveBrowserModel::operationLabel() const
{
    return m_operationLabel;
}

qreal DriveBrowserModel::operationPercent() const
{
    return m_operationPercent;
}

QString DriveBrowserModel::operationRemainingText() const
{
    return m_operationRemainingText;
}

DriveEntry DriveBrowserModel::entryAt(int row) const
{
    if (row < 0 || row >= m_entries.size()) {
        return DriveEntry();
    }
    return m_entries.at(row);
}

/**
 * @brief Returns the selected entries in row order.
 */
QVector<DriveEntry> DriveBrowserModel::selectedEntries() const
{
    QVector<DriveEntry> entries;
    for (const DriveEntry &entry : m_entries) {
        if (m_selectedIds.contains(entry.id())) {
            entries.append(entry);
        }
    }
    return entries;
}

int DriveBrowserModel::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) {
        return 0;
    }
    return m_entries.size();
}

QVariant DriveBrowserModel::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || index.row() < 0 || index.row() >= m_entries.size()) {
        return {};
    }

    const DriveEntry &entry = m_entries.at(index.row());
    switch (role) {
    case Qt::DisplayRole:
    case TitleRole:
        return entry.title();
    case IdRole:
        return entry.id();
    case IsFolderRole:
        return entry.isFolder();
    case SizeRole:
        return entry.size();
    case SizeTextRole:
        return entry.isFolder() ? QStringLiteral("-") : FormatUtils::formatFileSize(entry.size());
    case ModifiedRole:
        return FormatUtils::formatDateTime(entry.modifiedTimestamp());
    case TypeDescriptionRole:
        return FormatUtils::fileTypeDescription(entry.mimeType());
    case SelectedRole:
        return m_selectedIds.contains(entry.id());
    default:
        return {};
    }
}

QHash<int, QByteArray> DriveBrowserModel::roleNames() const
{
    return {
        {IdRole, "entryId"},
        {TitleRole, "title"},
        {IsFolderRole, "isFolder"},
        {SizeRole, "size"},
        {SizeTextRole, "sizeText"},
        {ModifiedRole, "modified"},
        {TypeDescriptionRole, "typeDescription"},
        {SelectedRole, "selected"},
    };
}

/**
 * @brief Tests the remote connection in the background, then lists the current folder.
 */
void DriveBrowserModel::connectToDrive()
{
    if (!m_service) {
        return;
    }

    setStatusText(tr("Connecting to Google Drive..."));
    RemoteStorageService *service = m_service;
    auto future = QtConcurrent::run(&m_pool, [service]() {
        RemoteError error;
        service->testConnection(&error);
        return error;
    });

    auto *watcher = new QFutureWatcher<RemoteError>(this);
    connect(watcher, &QFutureWatcher<RemoteError>::finished, this, [this, watcher]() {
        const RemoteError error = watcher->result();
        watcher->deleteLater();

        if (error.isSet()) {
            qCWarning(lcApp) << "Connection failed:" << error.message;
            setConnected(false);
            setStatusText(tr("Not connected"));
            emit errorOccurred(tr("Connection Error"), tr("Failed to connect to Google Drive:\n%1").arg(error.message));
            return;
        }
        setConnected(true);
        setStatusText(tr("Connected to Google Drive"));
        refresh();
    });
    watcher->setFuture(future);
}

/**
 * @brief Lists the current folder asynchronously; results of superseded requests are dropped.
 */
void DriveBrowserModel::refresh()
{
    if (!m_service) {
        return;
    }

    setLoading(true);
    setStatusText(tr("Loading..."));
    const int token = ++m_generation;
    const QString folderId = m_navigation.currentFolderId();
    RemoteStorageService *service = m_service;

    auto future = QtConcurrent::run(&m_pool, [service, folderId]() {
        ListingResult result;
        result.entries = service->listChildren(folderId, &result.error);
        DriveEntry::sortForListing(result.entries);
        return result;
    });

    auto *watcher = new QFutureWatcher<ListingResult>(this);
    connect(watcher, &QFutureWatcher<ListingResult>::finished, this, [this, watcher, token, folderId]() {
        const ListingResult result = watcher->result();
        watcher->deleteLater();

        if (token != m_generation) {
            return;
        }
        setLoading(false);

        if (result.error.isSet()) {
            qCWarning(lcApp) << "Listing" << folderId << "failed:" << result.error.message;
            if (result.error.kind == RemoteError::Authentication || result.error.kind == RemoteError::Connectivity) {
                setConnected(false);
            }
            setStatusText(tr("Error loading folder"));
            emit errorOccurred(tr("Error"), tr("Failed to load folder contents:\n%1").arg(result.error.message));
            return;
        }

        setConnected(true);
        m_listedFolderId = folderId;
        applyEntries(result.entries);
        setStatusText(tr("Loaded %1").arg(DriveOperations::pluralize(result.entries.size(), tr("item"), tr("items"))));
    });
    watcher->setFuture(future);
}

/**
 * @brief Opens a folder row, or reports a file row as activated.
 * @param row Row index to activate.
 */
void DriveBrowserModel::activate(int row)
{
    if (row < 0 || row >= m_entries.size()) {
        return;
    }
    // Rows of the previous folder stay visible until the new listing arrives.
    if (m_listedFolderId != m_navigation.currentFolderId()) {
        qCDebug(lcNavigation) << "Ignoring activation of a row listed in" << m_listedFolderId;
        return;
    }

    const DriveEntry entry = m_entries.at(row);
    if (!entry.isFolder()) {
        emit fileActivated(entry.id(), entry.title());
        return;
    }

    m_navigation.navigateInto(entry.id(), entry.title());
    navigationChanged();
}

void DriveBrowserModel::goBack()
{
    if (!m_navigation.goBack()) {
        return;
    }
    navigationChanged();
}

void DriveBrowserModel::goHome()
{
    if (m_navigation.isAtRoot()) {
        refresh();
        return;
    }
    m_navigation.goHome();
    navigationChanged();
}

/**
 * @brief Selects or toggles the entry at the given row.
 * @param row Row index to select.
 * @param multi True to toggle the row, false to replace the selection.
 */
void DriveBrowserModel::select(int row, bool multi)
{
    if (row < 0 || row >= m_entries.size()) {
        return;
    }

    const QString id = m_entries.at(row).id();
    if (!multi) {
        if (m_selectedIds.size() == 1 && m_selectedIds.first() == id) {
            return;
        }
        m_selectedIds = {id};
        notifySelectionChanged();
        return;
    }

    if (m_selectedIds.contains(id)) {
        m_selectedIds.removeAll(id);
    } else {
        m_selectedIds.append(id);
    }
    notifySelectionChanged();
}

bool DriveBrowserModel::isSelected(int row) const
{
    if (row < 0 || row >= m_entries.size()) {
        return false;
    }
    return m_selectedIds.contains(m_entries.at(row).id());
}

void DriveBrowserModel::selectAll()
{
    QStringList ids;
    ids.reserve(m_entries.size());
    for (const DriveEntry &entry : m_entries) {
        ids.append(entry.id());
    }
    if (ids == m_selectedIds) {
        return;
    }
    m_selectedIds = ids;
    notifySelectionChanged();
}

void DriveBrowserModel::clearSelection()
{
    if (m_selectedIds.isEmpty()) {
        return;
    }
    m_selectedIds.clear();
    notifySelectionChanged();
}

QVariantList DriveBrowserModel::selectedRows() const
{
    QVariantList rows;
    for (int row = 0; row < m_entries.size(); ++row) {
        if (m_selectedIds.contains(m_entries.at(row).id())) {
            rows.append(row);
        }
    }
    return rows;
}

/**
 * @brief Uploads local files into the current folder.
 * @param paths Local paths or file URLs.
 * @return Result map with ok, or ok=false and error when nothing was started.
 */
QVariantMap DriveBrowserModel::startUploadFiles(const QStringList &paths)
{
    const QStringList localPaths = LocalFileUtils::toLocalPaths(paths);
    if (localPaths.isEmpty()) {
        return failure(tr("No files selected"));
    }
    return startBatch(BatchKind::UploadFiles,
                      DriveOperations::uploadItems(localPaths),
                      DriveOperations::uploadAction(m_service, m_navigation.currentFolderId()),
                      QString());
}

/**
 * @brief Recreates a local directory tree under the current folder.
 * @param folderPath Local directory path or URL.
 * @return Result map; a missing folder is rejected before any remote call.
 */
QVariantMap DriveBrowserModel::startUploadFolder(const QString &folderPath)
{
    const QString localPath = LocalFileUtils::toLocalPath(folderPath);
    QString error;
    if (!LocalFileUtils::validateReadablePath(localPath, &error)) {
        return failure(error);
    }

    const FolderUploadPlan plan = FolderUploadPlan::build(localPath, &error);
    if (!plan.isValid()) {
        return failure(error);
    }
    qCInfo(lcApp) << "Uploading folder" << plan.localRoot() << "with" << plan.fileCount() << "files in"
                  << plan.folderCount() << "folders";
    return startBatch(BatchKind::UploadFolder,
                      plan.steps(),
                      plan.action(m_service, m_navigation.currentFolderId()),
                      plan.rootName());
}

/**
 * @brief Downloads the selected files into a local folder. Folders are skipped.
 * @param targetDir Local directory path or URL; stored as the last download path.
 * @return Result map with ok, or ok=false and error when nothing was started.
 */
QVariantMap DriveBrowserModel::startDownloadSelected(const QString &targetDir)
{
    const QString localDir = LocalFileUtils::toLocalPath(targetDir);
    if (localDir.isEmpty()) {
        return failure(tr("No download folder selected"));
    }

    const QVector<BatchItem> items = DriveOperations::downloadItems(selectedEntries(), localDir);
    if (items.isEmpty()) {
        return failure(tr("Please select files to download (folders cannot be downloaded)"));
    }

    QString error;
    if (!LocalFileUtils::ensureDirectory(localDir, &error)) {
        return failure(error);
    }
    if (m_settings) {
        m_settings->setLastDownloadPath(localDir);
    }
    return startBatch(BatchKind::Download, items, DriveOperations::downloadAction(m_service), localDir);
}

/**
 * @brief Deletes the selected entries.
 * @param confirmed True once the user confirmed the deletion.
 * @return Result map; confirmationRequired=true when confirmation is still needed.
 */
QVariantMap DriveBrowserModel::deleteSelected(bool confirmed)
{
    const QVector<DriveEntry> entries = selectedEntries();
    if (entries.isEmpty()) {
        return failure(tr("Please select items to delete"));
    }

    if (!confirmed && m_settings && m_settings->confirmOperations()) {
        QVariantMap result;
        result.insert("ok", false);
        result.insert("confirmationRequired", true);
        result.insert("count", entries.size());
        return result;
    }
    return startBatch(BatchKind::Delete,
                      DriveOperations::deleteItems(entries),
                      DriveOperations::deleteAction(m_service),
                      QString());
}

/**
 * @brief Requests cooperative cancellation of the running batch.
 *
 * The flag is atomic, so it is set directly instead of through the busy worker thread.
 */
void DriveBrowserModel::cancelOperation()
{
    if (!m_operation || m_operation->isCancelled()) {
        return;
    }
    m_operation->requestCancel();
    setStatusText(tr("Cancelling..."));
}

/**
 * @brief Creates a folder under the current folder in the background.
 * @param name Folder name, trimmed.
 * @return Result map with ok and pending, or ok=false and error for an empty name.
 */
QVariantMap DriveBrowserModel::createFolder(const QString &name)
{
    const QString trimmed = name.trimmed();
    if (trimmed.isEmpty()) {
        return failure(tr("Folder name cannot be empty"));
    }
    if (!m_service) {
        return failure(tr("Not connected"));
    }

    const QString parentId = m_navigation.currentFolderId();
    RemoteStorageService *service = m_service;
    auto future = QtConcurrent::run(&m_pool, [service, trimmed, parentId]() {
        FolderResult result;
        result.id = service->createFolder(trimmed, parentId, &result.error);
        return result;
    });

    auto *watcher = new QFutureWatcher<FolderResult>(this);
    connect(watcher, &QFutureWatcher<FolderResult>::finished, this, [this, watcher, trimmed]() {
        const FolderResult result = watcher->result();
        watcher->deleteLater();

        if (result.error.isSet()) {
            qCWarning(lcApp) << "Create folder" << trimmed << "failed:" << result.error.message;
            emit errorOccurred(tr("Error"), tr("Failed to create folder:\n%1").arg(result.error.message));
            return;
        }
        setStatusText(tr("Created folder: %1").arg(trimmed));
        emit folderCreated(result.id, trimmed);
        if (autoRefreshEnabled()) {
            refresh();
        }
    });
    watcher->setFuture(future);

    QVariantMap result;
    result.insert("ok", true);
    result.insert("pending", true);
    return result;
}

/**
 * @brief Fetches fresh metadata for a row and emits infoReady.
 */
void DriveBrowserModel::requestInfo(int row)
{
    if (!m_service || row < 0 || row >= m_entries.size()) {
        return;
    }

    const QString id = m_entries.at(row).id();
    RemoteStorageService *service = m_service;
    auto future = QtConcurrent::run(&m_pool, [service, id]() {
        InfoResult result;
        result.entry = service->getInfo(id, &result.error);
        return result;
    });

    auto *watcher = new QFutureWatcher<InfoResult>(this);
    connect(watcher, &QFutureWatcher<InfoResult>::finished, this, [this, watcher]() {
        const InfoResult result = watcher->result();
        watcher->deleteLater();

        if (result.error.isSet()) {
            qCWarning(lcApp) << "File info failed:" << result.error.message;
            emit errorOccurred(tr("Error"), tr("Failed to get file info:\n%1").arg(result.error.message));
            return;
        }

        const DriveEntry &entry = result.entry;
        QVariantMap info;
        info.insert("id", entry.id());
        info.insert("title", entry.title());
        info.insert("isFolder", entry.isFolder());
        info.insert("type", FormatUtils::fileTypeDescription(entry.mimeType()));
        info.insert("mimeType", entry.mimeType());
        info.insert("size", entry.isFolder() ? QStringLiteral("-") : FormatUtils::formatFileSize(entry.size()));
        info.insert("modified", FormatUtils::formatDateTime(entry.modifiedTimestamp()));
        info.insert("parentId", entry.parentId());
        emit infoReady(info);
    });
    watcher->setFuture(future);
}

/**
 * @brief Describes a local file or folder before it is uploaded.
 * @param path Local path or URL.
 * @return Map with ok, name, files, folders, size and text, or ok=false and error.
 */
QVariantMap DriveBrowserModel::localSummary(const QString &path) const
{
    const QString localPath = LocalFileUtils::toLocalPath(path);
    QString error;
    if (!LocalFileUtils::validateReadablePath(localPath, &error)) {
        return failure(error);
    }

    const LocalFileUtils::EntryCounts counts = LocalFileUtils::countEntries(localPath);
    QVariantMap result;
    result.insert("ok", true);
    result.insert("name", QFileInfo(localPath).fileName());
    result.insert("files", counts.fileCount);
    result.insert("folders", counts.folderCount);
    result.insert("size", FormatUtils::formatFileSize(counts.totalBytes));
    result.insert("text", tr("%1, %2").arg(FormatUtils::itemCountText(counts.folderCount, counts.fileCount),
                                           FormatUtils::formatFileSize(counts.totalBytes)));
    return result;
}

/**
 * @brief Runs a batch on its own thread.
 *
 * Status updates reach the model through the operation's queued signal, in
 * the order the runner produced them.
 */
QVariantMap DriveBrowserModel::startBatch(BatchKind kind,
                                          const QVector<BatchItem> &items,
                                          BatchAction action,
                                          const QString &detail)
{
    if (m_operation) {
        return failure(tr("Another operation is already running"));
    }
    if (!m_service) {
        return failure(tr("Not connected"));
    }
    if (items.isEmpty()) {
        return failure(tr("Nothing to process"));
    }

    auto *thread = new QThread(this);
    auto *operation = new CancellableOperation(DriveOperations::operationTitle(kind), items.size(), this);
    auto *runner = new OperationRunner(operation, items, std::move(action));
    // Downloads do not change the remote listing.
    runner->setAutoRefresh(kind != BatchKind::Download && autoRefreshEnabled());
    runner->moveToThread(thread);

    m_operationThread = thread;
    m_operation = operation;
    m_operationRunner = runner;
    m_operationLabel.clear();
    m_operationPercent = DriveBrowserConstants::zeroPercent;
    m_operationRemainingText.clear();
    emit operationProgressChanged();
    emit operationInProgressChanged();
    setStatusText(operation->title());

    connect(thread, &QThread::started, runner, &OperationRunner::start);
    connect(operation, &CancellableOperation::statusReported, this, &DriveBrowserModel::setOperationProgress);
    connect(runner, &OperationRunner::refreshRequested, this, &DriveBrowserModel::refresh);
    connect(runner, &OperationRunner::finished, this, [this, thread, operation, kind, detail](const QVariantMap &result) {
        OperationRunner *finishedRunner = m_operationRunner;
        m_operation = nullptr;
        m_operationThread = nullptr;
        m_operationRunner = nullptr;
        operation->deleteLater();
        // The runner has returned, so the thread stops right away.
        thread->quit();
        thread->wait();
        delete finishedRunner;
        m_operationRemainingText.clear();
        emit operationInProgressChanged();
        emit operationProgressChanged();
        finishBatch(kind, detail, result);
    });
    connect(thread, &QThread::finished, thread, &QObject::deleteLater);
    thread->start();

    QVariantMap result;
    result.insert("ok", true);
    result.insert("pending", true);
    result.insert("total", items.size());
    return result;
}

/**
 * @brief Applies a finished batch result on the GUI thread.
 */
void DriveBrowserModel::finishBatch(BatchKind kind, const QString &detail, const QVariantMap &result)
{
    const int succeeded = result.value("succeeded").toInt();
    const int failed = result.value("failed").toInt();
    const bool cancelled = result.value("cancelled").toBool();
    const bool fatal = result.value("fatal").toBool();

    if (kind == BatchKind::Delete && succeeded > DriveBrowserConstants::emptyCount) {
        clearSelection();
    }

    emit operationFinished(result);

    if (fatal) {
        setConnected(false);
        setStatusText(tr("Operation stopped"));
        emit errorOccurred(tr("Operation Failed"), result.value("error").toString());
        return;
    }
    if (cancelled) {
        setStatusText(tr("Operation cancelled"));
        return;
    }
    if (succeeded > DriveBrowserConstants::emptyCount) {
        setStatusText(DriveOperations::summaryTitle(kind));
        emit operationSummary(DriveOperations::summaryTitle(kind),
                              DriveOperations::summaryMessage(kind, succeeded, failed, detail));
        return;
    }

    setStatusText(tr("Operation failed"));
    const QStringList errors = result.value("errors").toStringList();
    emit errorOccurred(tr("Operation Failed"),
                       errors.isEmpty() ? result.value("error").toString() : errors.join(QLatin1Char('\n')));
}

void DriveBrowserModel::applyEntries(const QVector<DriveEntry> &entries)
{
    beginResetModel();
    m_entries = entries;
    endResetModel();

    QStringList kept;
    int folderCount = DriveBrowserConstants::emptyCount;
    for (const DriveEntry &entry : m_entries) {
        if (entry.isFolder()) {
            folderCount += 1;
        }
        if (m_selectedIds.contains(entry.id())) {
            kept.append(entry.id());
        }
    }
    if (kept != m_selectedIds) {
        m_selectedIds = kept;
        emit selectionChanged();
    }

    const QString countText = FormatUtils::itemCountText(folderCount, m_entries.size() - folderCount);
    if (countText != m_itemCountText) {
        m_itemCountText = countText;
        emit itemCountTextChanged();
    }
}

void DriveBrowserModel::navigationChanged()
{
    clearSelection();
    emit locationChanged();
    refresh();
}

void DriveBrowserModel::setLoading(bool loading)
{
    if (loading == m_loading) {
        return;
    }
    m_loading = loading;
    emit loadingChanged();
}

void DriveBrowserModel::setConnected(bool connected)
{
    if (connected == m_connected) {
        return;
    }
    m_connected = connected;
    emit connectedChanged();
}

void DriveBrowserModel::setStatusText(const QString &text)
{
    if (text == m_statusText) {
        return;
    }
    m_statusText = text;
    emit statusTextChanged();
}

void DriveBrowserModel::setOperationProgress(const QString &label, qreal percent)
{
    if (!label.isEmpty()) {
        m_operationLabel = label;
    }
    if (percent >= DriveBrowserConstants::zeroPercent) {
        m_operationPercent = percent;
    }
    if (m_operation) {
        const qint64 remainingMs = m_operation->status().estimatedRemainingMs();
        m_operationRemainingText = remainingMs == ProgressTracker::unknownRemaining
            ? QString()
            : tr("About %1 remaining").arg(FormatUtils::formatDuration(remainingMs / DriveBrowserConstants::msPerSecond));
    }
    emit operationProgressChanged();
}

void DriveBrowserModel::notifySelectionChanged()
{
    if (!m_entries.isEmpty()) {
        emit dataChanged(index(0, 0), index(m_entries.size() - 1, 0), {SelectedRole});
    }
    emit selectionChanged();
}

bool DriveBrowserModel::autoRefreshEnabled() const
{
    return m_settings ? m_settings->autoRefresh() : true;
}
