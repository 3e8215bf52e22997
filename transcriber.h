#pragma once

#include "recorder.h"

#include <QMutex>
#include <QObject>
#include <QQueue>

#include <memory>

// Called on the transcriber thread, throws std::runtime_error on failure.
class SpeechEngine
{
public:
    virtual ~SpeechEngine() = default;
    virtual QString transcribe(const QString &modelPath, const AudioBuffer &buffer) = 0;
};

// Lives on its own QThread; enqueue() is safe from any thread.
class Transcriber : public QObject
{
    Q_OBJECT
public:
    explicit Transcriber(std::unique_ptr<SpeechEngine> engine, QObject *parent = nullptr);
    ~Transcriber() override;

    bool busy() const;

    void enqueue(const QString &modelPath, const AudioBuffer &buffer);

Q_SIGNALS:
    void busyChanged(bool busy);
    void textFound(const QString &text);
    void failed(const QString &message);

private:
    struct Job {
        QString modelPath;
        AudioBuffer buffer;
    };

    void process();

    std::unique_ptr<SpeechEngine> m_engine;
    QQueue<Job> m_pending;
    bool m_processing = false;
    mutable QMutex m_mutex; // guards m_pending and m_processing
};
