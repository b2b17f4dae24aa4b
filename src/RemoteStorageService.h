#pragma once

#include <QString>
#include <QVector>

#include "DriveEntry.h"

struct RemoteError {
    enum Kind {
        None = 0,
        Validation,
        NotFound,
        Remote,
        Connectivity,
        Authentication
    };

    Kind kind = None;
    QString message;

    bool isSet() const { return kind != None; }
    // Only a lost or rejected credential aborts a batch.
    bool isFatal() const { return kind == Authentication; }

    void set(Kind errorKind, const QString &errorMessage)
    {
        kind = errorKind;
        message = errorMessage;
    }

    void clear()
    {
        kind = None;
        message.clear();
    }
};

/**
 * @brief Blocking capability surface of the remote drive.
 *
 * Every call may block on the network and must not run on the GUI thread.
 * Failures are reported through the error out-parameter; the returned value
 * is then empty (or false).
 */
class RemoteStorageService
{
public:
    virtual ~RemoteStorageService() = default;

    virtual bool testConnection(RemoteError *error) = 0;
    virtual QVector<DriveEntry> listChildren(const QString &folderId, RemoteError *error) = 0;
    virtual QString upload(const QString &localPath, const QString &parentId, RemoteError *error) = 0;
    virtual bool download(const QString &id, const QString &localPath, RemoteError *error) = 0;
    virtual QString createFolder(const QString &name, const QString &parentId, RemoteError *error) = 0;
    virtual bool remove(const QString &id, RemoteError *error) = 0;
    virtual DriveEntry getInfo(const QString &id, RemoteError *error) = 0;
};
