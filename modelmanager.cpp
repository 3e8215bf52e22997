#include "modelmanager.h"

#include "diktat_debug.h"

#include <QDir>
#include <QFileInfo>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QSaveFile>

ModelManager::ModelManager(const QString &directory, const QString &modelSize, const QUrl &baseUrl, QObject *parent)
    : QObject(parent)
    , m_directory(directory)
    , m_modelSize(modelSize)
    , m_baseUrl(baseUrl)
    , m_network(new QNetworkAccessManager(this))
{
}

ModelManager::~ModelManager()
{
    if (m_reply) {
        m_reply->disconnect(this);
        m_reply->abort();
    }
}

QString ModelManager::fileNameFor(const QString &modelSize)
{
    // the repository only carries numbered large models
    const QString name = modelSize == QLatin1String("large") ? QStringLiteral("large-v3") : modelSize;
    return QStringLiteral("ggml-%1.bin").arg(name);
}

QUrl ModelManager::downloadUrl(const QUrl &baseUrl, const QString &modelSize)
{
    QUrl url = baseUrl;
    QString path = url.path();
    if (!path.endsWith(QLatin1Char('/'))) {
        path += QLatin1Char('/');
    }
    url.setPath(path + fileNameFor(modelSize));
    return url;
}

QString ModelManager::modelSize() const
{
    return m_modelSize;
}

QString ModelManager::modelPath() const
{
    return QDir(m_directory).filePath(fileNameFor(m_modelSize));
}

bool ModelManager::isAvailable() const
{
    const QFileInfo info(modelPath());
    return info.isFile() && info.size() > 0;
}

bool ModelManager::downloading() const
{
    return !m_reply.isNull();
}

void ModelManager::ensureAvailable()
{
    if (downloading()) {
        qCDebug(DIKTAT) << "Model download already running";
        return;
    }

    if (isAvailable()) {
        qCDebug(DIKTAT) << "Using model" << modelPath();
        Q_EMIT ready(modelPath());
        return;
    }

    startDownload();
}

void ModelManager::startDownload()
{
    if (!QDir().mkpath(m_directory)) {
        Q_EMIT failed(QStringLiteral("Modellverzeichnis %1 kann nicht angelegt werden").arg(m_directory));
        return;
    }

    m_file.reset(new QSaveFile(modelPath()));
    if (!m_file->open(QIODevice::WriteOnly)) {
        const QString message = QStringLiteral("%1: %2").arg(modelPath(), m_file->errorString());
        m_file.reset();
        Q_EMIT failed(message);
        return;
    }

    const QUrl url = downloadUrl(m_baseUrl, m_modelSize);
    qCInfo(DIKTAT) << "Downloading model" << m_modelSize << "from" << url;

    QNetworkRequest request(url);
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::NoLessSafeRedirectPolicy);

    m_reply = m_network->get(request);
    connect(m_reply.data(), &QNetworkReply::readyRead, this, &ModelManager::handleReadyRead);
    connect(m_reply.data(), &QNetworkReply::downloadProgress, this, &ModelManager::downloadProgress);
    connect(m_reply.data(), &QNetworkReply::finished, this, &ModelManager::handleFinished);

    Q_EMIT downloadStarted();
}

void ModelManager::handleReadyRead()
{
    if (!m_file || !m_reply) {
        return;
    }

    const QByteArray chunk = m_reply->readAll();
    if (m_file->write(chunk) != chunk.size()) {
        abortDownload(QStringLiteral("%1: %2").arg(modelPath(), m_file->errorString()));
    }
}

void ModelManager::handleFinished()
{
    QNetworkReply *reply = m_reply.data();
    if (!reply) {
        return;
    }
    m_reply.clear();
    reply->deleteLater();

    if (!m_file) {
        // aborted, already reported
        return;
    }

    QScopedPointer<QSaveFile> file(m_file.take());

    if (reply->error() != QNetworkReply::NoError) {
        file->cancelWriting();
        qCWarning(DIKTAT) << "Model download failed" << reply->errorString();
        Q_EMIT failed(QStringLiteral("Modell-Download fehlgeschlagen: %1").arg(reply->errorString()));
        return;
    }

    const QVariant status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    if (status.isValid() && status.toInt() >= 400) {
        file->cancelWriting();
        Q_EMIT failed(QStringLiteral("Modell-Download fehlgeschlagen: HTTP %1").arg(status.toInt()));
        return;
    }

    const QByteArray rest = reply->readAll();
    if (file->write(rest) != rest.size()) {
        file->cancelWriting();
        Q_EMIT failed(QStringLiteral("%1: %2").arg(modelPath(), file->errorString()));
        return;
    }
    if (file->size() == 0) {
        file->cancelWriting();
        Q_EMIT failed(QStringLiteral("Modell-Download fehlgeschlagen: leere Datei"));
        return;
    }

    if (!file->commit()) {
        Q_EMIT failed(QStringLiteral("%1: %2").arg(modelPath(), file->errorString()));
        return;
    }

    qCInfo(DIKTAT) << "Model stored at" << modelPath();
    Q_EMIT ready(modelPath());
}

void ModelManager::abortDownload(const QString &message)
{
    qCWarning(DIKTAT) << "Aborting model download:" << message;

    m_file->cancelWriting();
    m_file.reset();
    if (m_reply) {
        m_reply->abort();
    }
    Q_EMIT failed(message);
}
