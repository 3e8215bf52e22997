#pragma once

#include "audiosource.h"
#include "recorder.h"
#include "transcriber.h"

#include <QMutex>
#include <QMutexLocker>
#include <QThread>

#include <stdexcept>

// Writes a fixed block of samples into the recorder as soon as capture starts.
class FakeAudioSource : public AudioSource
{
    Q_OBJECT
public:
    using AudioSource::AudioSource;

    QStringList deviceNames() const override { return {QStringLiteral("Fake Mic")}; }
    QString currentDevice() const override { return QStringLiteral("Fake Mic"); }
    void setDevice(const QString &) override {}

    bool start(AudioRecorder *sink) override
    {
        if (!available) {
            setErrorString(QStringLiteral("Kein Mikrofon gefunden"));
            return false;
        }
        sink->setInputFormat(AudioRecorder::requiredFormat());
        if (!samples.isEmpty()) {
            sink->write(reinterpret_cast<const char *>(samples.constData()), samples.size() * int(sizeof(float)));
        }
        started++;
        running = true;
        return true;
    }

    void stop() override { running = false; }

    void breakDevice(const QString &message)
    {
        setErrorString(message);
        Q_EMIT failed(message);
    }

    bool available = true;
    bool running = false;
    int started = 0;
    QVector<float> samples = QVector<float>(AudioBuffer::SampleRate / 2, 0.1f);
};

// Returns a canned transcript, or throws when told to.
class FakeEngine : public SpeechEngine
{
public:
    struct State {
        QMutex mutex;
        QString text = QStringLiteral("  Hallo Welt  ");
        QString error;
        QStringList modelPaths;
        QList<int> sampleCounts;
        QList<QThread *> threads;
    };

    explicit FakeEngine(State *state)
        : m_state(state)
    {
    }

    QString transcribe(const QString &modelPath, const AudioBuffer &buffer) override
    {
        QMutexLocker lock(&m_state->mutex);
        m_state->modelPaths << modelPath;
        m_state->sampleCounts << buffer.size();
        m_state->threads << QThread::currentThread();
        if (!m_state->error.isEmpty()) {
            throw std::runtime_error(m_state->error.toStdString());
        }
        return m_state->text;
    }

private:
    State *m_state;
};
