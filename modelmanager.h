#pragma once

#include <QObject>
#include <QPointer>
#include <QScopedPointer>
#include <QUrl>

class QNetworkAccessManager;
class QNetworkReply;
class QSaveFile;

class ModelManager : public QObject
{
    Q_OBJECT
public:
    ModelManager(const QString &directory, const QString &modelSize, const QUrl &baseUrl, QObject *parent = nullptr);
    ~ModelManager() override;

    static QString fileNameFor(const QString &modelSize);
    static QUrl downloadUrl(const QUrl &baseUrl, const QString &modelSize);

    QString modelSize() const;
    QString modelPath() const;
    bool isAvailable() const;
    bool downloading() const;

    void ensureAvailable();

Q_SIGNALS:
    void downloadStarted();
    void downloadProgress(qint64 received, qint64 total);
    void ready(const QString &path);
    void failed(const QString &message);

private:
    void startDownload();
    void handleReadyRead();
    void handleFinished();
    void abortDownload(const QString &message);

    QString m_directory;
    QString m_modelSize;
    QUrl m_baseUrl;

    QNetworkAccessManager *m_network;
    QPointer<QNetworkReply> m_reply;
    QScopedPointer<QSaveFile> m_file;
};
