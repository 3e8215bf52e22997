#include "transcriber.h"

#include "diktat_debug.h"

#include <QElapsedTimer>
#include <QMutexLocker>

#include <exception>

Transcriber::Transcriber(std::unique_ptr<SpeechEngine> engine, QObject *parent)
    : QObject(parent)
    , m_engine(std::move(engine))
{
    qRegisterMetaType<AudioBuffer>();
}

Transcriber::~Transcriber() = default;

bool Transcriber::busy() const
{
    QMutexLocker lock(&m_mutex);
    return m_processing;
}

void Transcriber::enqueue(const QString &modelPath, const AudioBuffer &buffer)
{
    QMutexLocker lock(&m_mutex);
    m_pending.enqueue({modelPath, buffer});
    if (m_pending.size() > 1 || m_processing) {
        qCWarning(DIKTAT) << "New buffer arrived whilst processing the old one. Queuing";
        return;
    }
    QMetaObject::invokeMethod(this, &Transcriber::process, Qt::QueuedConnection);
}

void Transcriber::process()
{
    Job job;
    {
        QMutexLocker lock(&m_mutex);
        if (m_pending.isEmpty()) {
            return;
        }
        job = m_pending.dequeue();
        m_processing = true;
    }
    Q_EMIT busyChanged(true);

    QElapsedTimer bench;
    bench.start();
    qCDebug(DIKTAT) << "processing" << job.buffer.duration() << "ms of audio";

    try {
        const QString text = m_engine->transcribe(job.modelPath, job.buffer);
        qCInfo(DIKTAT) << "Transcribed" << job.buffer.duration() << "ms of audio in" << bench.elapsed() << "ms";
        Q_EMIT textFound(text);
    } catch (const std::exception &e) {
        qCWarning(DIKTAT) << "Transcription failed:" << e.what();
        Q_EMIT failed(QString::fromLocal8Bit(e.what()));
    }

    bool more = false;
    {
        QMutexLocker lock(&m_mutex);
        m_processing = false;
        more = !m_pending.isEmpty();
    }
    if (more) {
        QMetaObject::invokeMethod(this, &Transcriber::process, Qt::QueuedConnection);
    }

    Q_EMIT busyChanged(false);
}
